/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "print_header.hpp"

#include <iomanip>

auto print_signature(std::ostream& os, BinHeader const& header) noexcept
	-> void
{
	os << "Signature: " << std::hex << std::setfill('0');
	for(auto const byte : header.signature)
		os << std::setw(2) << static_cast<unsigned>(byte);
	os << std::dec << std::setfill(' ') << '\n';
}

auto print_bin_header(std::ostream& os, BinHeader const& header) noexcept
	-> void
{
	os << "Header size: " << header.header_length << '\n';
	os << "File size: " << header.file_length << '\n';
	os << "Metadata offset: " << header.metadata_offset << '\n';
	os << "Metadata length: " << header.metadata_length << '\n';
	os << "Payload header offset: " << header.payload_header_offset << '\n';
	os << "Payload header length: " << header.payload_header_length << '\n';
	os << "Payload offset: " << header.payload_offset << '\n';
}

auto print_payload_header(std::ostream& os,
                          PayloadHeader const& header) noexcept -> void
{
	os << "Match ID: " << header.id() << '\n';
	os << "Match length: " << header.duration() << " ms\n";
	os << "Keyframe count: " << header.keyframe_count() << '\n';
	os << "Chunk count: " << header.chunk_count() << '\n';
	os << "Last loading chunk: " << header.load_end_chunk() << '\n';
	os << "First game chunk: " << header.game_start_chunk() << '\n';
	os << "Keyframe interval: " << header.keyframe_interval() << " ms\n";
	os << "Encryption key (" << header.encryption_key().size()
	   << " chars): " << header.encryption_key() << '\n';
}
