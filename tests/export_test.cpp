/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>

#include "export.hpp"
#include "fixture.hpp"
#include "rofl.hpp"

namespace
{

namespace fs = std::filesystem;

class Export : public ::testing::Test
{
protected:
	void SetUp() override
	{
		auto const* info = ::testing::UnitTest::GetInstance()->current_test_info();
		dir_ = fs::temp_directory_path() /
		       (std::string("rrp_export_") + info->name());
		fs::remove_all(dir_);
	}

	void TearDown() override
	{
		std::error_code ec;
		fs::remove_all(dir_, ec);
	}

	fs::path dir_;
};

auto load_segments(Bytes const& file) -> std::vector<Segment>
{
	std::vector<Segment> out;
	auto const r = parse_rofl(file.data(), file.size());
	EXPECT_EQ(r.error, RoflError::NONE);
	auto segments = r.file->segments(true);
	EXPECT_EQ(segments.error, RoflError::NONE);
	while(auto s = segments.iterator->next())
		out.push_back(std::move(*s));
	return out;
}

TEST_F(Export, CreatesNestedDirectories)
{
	auto const nested = dir_ / "a" / "b";
	EXPECT_TRUE(ensure_directory(nested));
	EXPECT_TRUE(fs::is_directory(nested));
	// Existing directories are fine.
	EXPECT_TRUE(ensure_directory(nested));
}

TEST_F(Export, RefusesExistingFile)
{
	ASSERT_TRUE(ensure_directory(dir_));
	auto const file = dir_ / "taken";
	std::ofstream(file) << "x";
	EXPECT_FALSE(ensure_directory(file));
}

TEST_F(Export, NamesFilesAfterMatchAndSegment)
{
	auto const segments = load_segments(sample_rofl());
	ASSERT_EQ(segments.size(), 8U);
	auto const match_id = FixtureReplay{}.match_id;
	EXPECT_EQ(export_file_name(match_id, segments[0]), "4089123456-1-Chunk.bin");
	EXPECT_EQ(export_file_name(match_id, segments[5]),
	          "4089123456-2-Keyframe.bin");
}

TEST_F(Export, WritesMaterializedData)
{
	ASSERT_TRUE(ensure_directory(dir_));
	auto const segments = load_segments(sample_rofl());
	auto const match_id = FixtureReplay{}.match_id;
	for(auto const& s : segments)
	{
		auto const r = export_segment(dir_, match_id, s);
		ASSERT_TRUE(r.success) << r.error;
		EXPECT_EQ(r.path, dir_ / export_file_name(match_id, s));
	}
	std::ifstream f(dir_ / "4089123456-1-Keyframe.bin", std::ios_base::binary);
	ASSERT_TRUE(f.is_open());
	Bytes const written{std::istreambuf_iterator<char>(f),
	                    std::istreambuf_iterator<char>()};
	EXPECT_EQ(written, sample_sections());
	EXPECT_EQ(std::distance(fs::directory_iterator(dir_),
	                        fs::directory_iterator()),
	          8);
}

TEST_F(Export, UnloadedSegmentIsNotWritten)
{
	ASSERT_TRUE(ensure_directory(dir_));
	auto const file = sample_rofl();
	auto const r = parse_rofl(file.data(), file.size());
	ASSERT_EQ(r.error, RoflError::NONE);
	auto segments = r.file->segments(false);
	ASSERT_EQ(segments.error, RoflError::NONE);
	auto const s = segments.iterator->next();
	ASSERT_TRUE(s.has_value());
	auto const e = export_segment(dir_, 1U, *s);
	EXPECT_FALSE(e.success);
	EXPECT_EQ(e.error, to_string(RoflError::NO_DATA));
	EXPECT_FALSE(fs::exists(e.path));
}

} // namespace
