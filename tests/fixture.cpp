/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "fixture.hpp"

#include <cstring> // std::memcpy
#include <openssl/blowfish.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <zlib.h>

auto put_u16(Bytes& out, uint16_t value) -> void
{
	for(unsigned i = 0U; i < 2U; ++i)
		out.push_back(static_cast<uint8_t>(value >> (8U * i)));
}

auto put_u32(Bytes& out, uint32_t value) -> void
{
	for(unsigned i = 0U; i < 4U; ++i)
		out.push_back(static_cast<uint8_t>(value >> (8U * i)));
}

auto put_u64(Bytes& out, uint64_t value) -> void
{
	for(unsigned i = 0U; i < 8U; ++i)
		out.push_back(static_cast<uint8_t>(value >> (8U * i)));
}

auto encrypt(Bytes const& key, Bytes const& plain) -> Bytes
{
	BF_KEY bf{};
	BF_set_key(&bf, static_cast<int>(key.size()), key.data());
	Bytes padded = plain;
	auto const pad = BF_BLOCK - (plain.size() % BF_BLOCK);
	padded.insert(padded.end(), pad, static_cast<uint8_t>(pad));
	Bytes out(padded.size());
	for(size_t i = 0U; i < padded.size(); i += BF_BLOCK)
		BF_ecb_encrypt(padded.data() + i, out.data() + i, &bf, BF_ENCRYPT);
	return out;
}

auto gzip(Bytes const& plain) -> Bytes
{
	z_stream stream{};
	if(deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
	                Z_DEFAULT_STRATEGY) != Z_OK)
		throw std::runtime_error("deflateInit2 failed");
	Bytes out(deflateBound(&stream, static_cast<uLong>(plain.size())));
	stream.next_in = const_cast<Bytef*>(plain.data());
	stream.avail_in = static_cast<uInt>(plain.size());
	stream.next_out = out.data();
	stream.avail_out = static_cast<uInt>(out.size());
	auto const ret = deflate(&stream, Z_FINISH);
	out.resize(stream.total_out);
	deflateEnd(&stream);
	if(ret != Z_STREAM_END)
		throw std::runtime_error("deflate failed");
	return out;
}

auto base64_encode(Bytes const& data) -> std::string
{
	std::string out(((data.size() + 2U) / 3U) * 4U + 1U, '\0');
	auto const n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
	                               data.data(), static_cast<int>(data.size()));
	out.resize(static_cast<size_t>(n));
	return out;
}

auto float_bits(float value) -> uint32_t
{
	uint32_t bits{};
	std::memcpy(&bits, &value, sizeof(bits));
	return bits;
}

auto encode_section(uint8_t marker, uint32_t time_bits, uint32_t type,
                    uint32_t parameter, Bytes const& payload) -> Bytes
{
	Bytes out{marker};
	if((marker & 0x80U) != 0U)
		out.push_back(static_cast<uint8_t>(time_bits));
	else
		put_u32(out, time_bits);
	if((marker & 0x10U) != 0U)
		out.push_back(static_cast<uint8_t>(payload.size()));
	else
		put_u32(out, static_cast<uint32_t>(payload.size()));
	if((marker & 0x40U) == 0U)
		put_u16(out, static_cast<uint16_t>(type));
	if((marker & 0x20U) != 0U)
		out.push_back(static_cast<uint8_t>(parameter));
	else
		put_u32(out, parameter);
	out.insert(out.end(), payload.begin(), payload.end());
	return out;
}

auto sample_sections() -> Bytes
{
	Bytes out;
	auto append = [&out](Bytes const& b)
	{
		out.insert(out.end(), b.begin(), b.end());
	};
	append(encode_section(0x01, float_bits(1.5F), 0x0123, 0x40000001U,
	                      {1, 2, 3, 4, 5}));
	append(encode_section(0x31, float_bits(1.75F), 0x0025, 0x07, {9, 9}));
	append(encode_section(0x71, float_bits(2.0F), 0U, 0x08, {7}));
	append(encode_section(0xB1, 16U, 0x0123, 0x09, {}));
	append(encode_section(0xF2, 33U, 0U, 0x0A, {1, 2, 3}));
	append(encode_section(0x81, 4U, 0xFFFF, 0x12345678U, {0xAA, 0xBB}));
	return out;
}

auto sample_segments() -> std::vector<FixtureSegment>
{
	auto const sections = sample_sections();
	std::vector<FixtureSegment> segments;
	// Keyframes interleave with chunks as in real files.
	segments.push_back({1U, SEGMENT_CHUNK, 0U, sections});
	segments.push_back({2U, SEGMENT_CHUNK, 0U, sections});
	segments.push_back({1U, SEGMENT_KEYFRAME, 3U, sections});
	segments.push_back({3U, SEGMENT_CHUNK, 0U, sections});
	segments.push_back({4U, SEGMENT_CHUNK, 0U, sections});
	segments.push_back({2U, SEGMENT_KEYFRAME, 5U, sections});
	segments.push_back({5U, SEGMENT_CHUNK, 0U, sections});
	segments.push_back({6U, SEGMENT_CHUNK, 0U, sections});
	return segments;
}

auto build_rofl(FixtureReplay const& replay) -> Bytes
{
	auto const match_id_str = std::to_string(replay.match_id);
	Bytes const match_key(match_id_str.begin(), match_id_str.end());
	auto const encryption_key =
		base64_encode(encrypt(match_key, replay.segment_key));
	uint32_t chunk_count = 0U;
	uint32_t keyframe_count = 0U;
	Bytes table;
	Bytes blocks;
	for(auto const& s : replay.segments)
	{
		(s.kind == SEGMENT_CHUNK ? chunk_count : keyframe_count)++;
		auto const block = encrypt(replay.segment_key, gzip(s.plain));
		put_u32(table, s.id);
		table.push_back(s.kind);
		put_u32(table, static_cast<uint32_t>(block.size()));
		put_u32(table, s.back_reference);
		put_u32(table, static_cast<uint32_t>(blocks.size()));
		blocks.insert(blocks.end(), block.begin(), block.end());
	}
	Bytes payload_header;
	put_u64(payload_header, replay.match_id);
	put_u32(payload_header, replay.duration);
	put_u32(payload_header, keyframe_count);
	put_u32(payload_header, chunk_count);
	put_u32(payload_header, replay.load_end_chunk);
	put_u32(payload_header, replay.game_start_chunk);
	put_u32(payload_header, replay.keyframe_interval);
	put_u16(payload_header, static_cast<uint16_t>(encryption_key.size()));
	payload_header.insert(payload_header.end(), encryption_key.begin(),
	                      encryption_key.end());

	auto const metadata_offset = uint32_t{BIN_HEADER_SIZE};
	auto const metadata_length = static_cast<uint32_t>(replay.metadata.size());
	auto const payload_header_offset = metadata_offset + metadata_length;
	auto const payload_header_length =
		static_cast<uint32_t>(payload_header.size());
	auto const payload_offset = payload_header_offset + payload_header_length;
	auto const file_length = payload_offset +
	                         static_cast<uint32_t>(table.size() + blocks.size());

	Bytes out(ROFL_MAGIC.begin(), ROFL_MAGIC.end());
	out.push_back(0x00);
	out.push_back(0x00);
	for(unsigned i = 0U; i < SIGNATURE_SIZE; ++i)
		out.push_back(static_cast<uint8_t>(i ^ 0x5AU));
	put_u16(out, static_cast<uint16_t>(BIN_HEADER_SIZE));
	put_u32(out, file_length);
	put_u32(out, metadata_offset);
	put_u32(out, metadata_length);
	put_u32(out, payload_header_offset);
	put_u32(out, payload_header_length);
	put_u32(out, payload_offset);
	out.insert(out.end(), replay.metadata.begin(), replay.metadata.end());
	out.insert(out.end(), payload_header.begin(), payload_header.end());
	out.insert(out.end(), table.begin(), table.end());
	out.insert(out.end(), blocks.begin(), blocks.end());
	return out;
}

auto sample_rofl() -> Bytes
{
	FixtureReplay replay{};
	replay.segments = sample_segments();
	return build_rofl(replay);
}
