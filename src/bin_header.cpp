/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "bin_header.hpp"

#include <algorithm> // std::equal
#include <cstring>   // std::memcpy
#include <type_traits>

namespace
{

#include "read.inl"

} // namespace

auto read_bin_header(uint8_t const* buffer, size_t size) noexcept
	-> ReadBinHeaderResult
{
	ReadBinHeaderResult r{};
	if(buffer == nullptr || size < BIN_HEADER_SIZE ||
	   !std::equal(ROFL_MAGIC.begin(), ROFL_MAGIC.end(), buffer))
	{
		r.error = RoflError::INVALID_BUFFER;
		return r;
	}
	auto& h = r.header;
	std::memcpy(h.signature.data(), buffer + BIN_HEADER_SIGNATURE,
	            SIGNATURE_SIZE);
	auto const* ptr = buffer + BIN_HEADER_HEADER_LENGTH;
	h.header_length = read<uint16_t>(ptr);
	h.file_length = read<uint32_t>(ptr);
	h.metadata_offset = read<uint32_t>(ptr);
	h.metadata_length = read<uint32_t>(ptr);
	h.payload_header_offset = read<uint32_t>(ptr);
	h.payload_header_length = read<uint32_t>(ptr);
	h.payload_offset = read<uint32_t>(ptr);
	return r;
}
