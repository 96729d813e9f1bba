/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_BIN_HEADER_HPP
#define RRP_BIN_HEADER_HPP
#include <array>
#include <cstddef>
#include <cstdint>

#include "error.hpp"
#include "rofl_data.hpp"

// Start section of the file: where every other section lives.
struct BinHeader
{
	std::array<uint8_t, SIGNATURE_SIZE> signature;
	uint16_t header_length; // Constant in every known file.
	uint32_t file_length;   // As written, may not match the real size.
	uint32_t metadata_offset;
	uint32_t metadata_length;
	uint32_t payload_header_offset;
	uint32_t payload_header_length;
	uint32_t payload_offset;
};

struct ReadBinHeaderResult
{
	RoflError error{};
	BinHeader header{};
};

auto read_bin_header(uint8_t const* buffer, size_t size) noexcept
	-> ReadBinHeaderResult;

#endif // RRP_BIN_HEADER_HPP
