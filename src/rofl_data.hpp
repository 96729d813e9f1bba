/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_ROFL_DATA_HPP
#define RRP_ROFL_DATA_HPP
#include <array>
#include <cstddef>
#include <cstdint>

// NOTE: Layout of League of Legends ".rofl" replay files, little endian.

constexpr std::array<uint8_t, 4U> ROFL_MAGIC = {0x52, 0x49, 0x4F, 0x54};

enum BinHeaderOffsets : size_t
{
	BIN_HEADER_MAGIC = 0U,
	BIN_HEADER_SIGNATURE = 6U,
	BIN_HEADER_HEADER_LENGTH = 262U,
	BIN_HEADER_FILE_LENGTH = 264U,
	BIN_HEADER_METADATA_OFFSET = 268U,
	BIN_HEADER_METADATA_LENGTH = 272U,
	BIN_HEADER_PAYLOAD_HEADER_OFFSET = 276U,
	BIN_HEADER_PAYLOAD_HEADER_LENGTH = 280U,
	BIN_HEADER_PAYLOAD_OFFSET = 284U,
	BIN_HEADER_SIZE = 288U
};

constexpr size_t SIGNATURE_SIZE = 256U;

// Fixed part of the payload header, the encryption key follows it.
constexpr size_t PAYLOAD_HEADER_FIXED_SIZE = 34U;

constexpr size_t SEGMENT_HEADER_SIZE = 17U;

enum SegmentKind : uint8_t
{
	SEGMENT_NONE = 0, // Never decoded from a record.
	SEGMENT_CHUNK = 1,
	SEGMENT_KEYFRAME = 2
};

// Flags in the first byte of a section. When a flag is set the field it
// controls is narrower (or absent for the type).
enum SectionFlags : uint8_t
{
	SECTION_RELATIVE_TIME = 0x80,
	SECTION_INHERIT_TYPE = 0x40,
	SECTION_NARROW_PARAM = 0x20,
	SECTION_NARROW_LENGTH = 0x10
};

// Borrowed range of bytes, never owns what it points to.
struct ByteView
{
	uint8_t const* data{};
	size_t size{};
};

#endif // RRP_ROFL_DATA_HPP
