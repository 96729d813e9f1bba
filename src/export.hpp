/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_EXPORT_HPP
#define RRP_EXPORT_HPP
#include <cstdint>
#include <filesystem>
#include <string>

#include "segment.hpp"

struct ExportResult
{
	bool success{};
	std::filesystem::path path{};
	std::string error{};
};

// Creates `dir` if missing. Fails if it exists but is not a directory.
auto ensure_directory(std::filesystem::path const& dir) noexcept -> bool;

// "<match_id>-<segment_id>-<Chunk|Keyframe>.bin"
auto export_file_name(uint64_t match_id, Segment const& segment)
	-> std::string;

// Writes the loaded data of `segment` under `dir`.
auto export_segment(std::filesystem::path const& dir, uint64_t match_id,
                    Segment const& segment) noexcept -> ExportResult;

#endif // RRP_EXPORT_HPP
