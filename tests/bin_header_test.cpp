/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include <gtest/gtest.h>

#include "bin_header.hpp"
#include "fixture.hpp"

namespace
{

TEST(BinHeader, DecodesFixedFields)
{
	auto const file = sample_rofl();
	auto const r = read_bin_header(file.data(), file.size());
	ASSERT_EQ(r.error, RoflError::NONE);
	auto const& h = r.header;
	EXPECT_EQ(h.header_length, BIN_HEADER_SIZE);
	EXPECT_EQ(h.file_length, file.size());
	EXPECT_EQ(h.metadata_offset, BIN_HEADER_SIZE);
	EXPECT_EQ(h.payload_header_offset, h.metadata_offset + h.metadata_length);
	EXPECT_EQ(h.payload_offset,
	          h.payload_header_offset + h.payload_header_length);
	for(size_t i = 0U; i < SIGNATURE_SIZE; ++i)
		EXPECT_EQ(h.signature[i], static_cast<uint8_t>(i ^ 0x5AU));
}

TEST(BinHeader, SegmentTableFitsInFile)
{
	auto const file = sample_rofl();
	auto const h = read_bin_header(file.data(), file.size()).header;
	// Six chunks and two keyframes.
	EXPECT_LE(h.payload_offset + SEGMENT_HEADER_SIZE * 8U, h.file_length);
}

TEST(BinHeader, RejectsBadMagic)
{
	auto file = sample_rofl();
	file[0] = 'X';
	auto const r = read_bin_header(file.data(), file.size());
	EXPECT_EQ(r.error, RoflError::INVALID_BUFFER);
}

TEST(BinHeader, RejectsShortBuffer)
{
	auto const file = sample_rofl();
	auto const r = read_bin_header(file.data(), BIN_HEADER_SIZE - 1U);
	EXPECT_EQ(r.error, RoflError::INVALID_BUFFER);
	EXPECT_EQ(read_bin_header(file.data(), 2U).error,
	          RoflError::INVALID_BUFFER);
	EXPECT_EQ(read_bin_header(nullptr, 0U).error, RoflError::INVALID_BUFFER);
}

TEST(BinHeader, AcceptsExactExtent)
{
	auto const file = sample_rofl();
	auto const r = read_bin_header(file.data(), BIN_HEADER_SIZE);
	EXPECT_EQ(r.error, RoflError::NONE);
	EXPECT_EQ(r.header.file_length, file.size());
}

} // namespace
