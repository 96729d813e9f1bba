/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "export.hpp"

#include <fstream>
#include <string>
#include <system_error>

namespace
{

constexpr auto IOS_OUT =
	std::ios_base::binary | std::ios_base::out | std::ios_base::trunc;

} // namespace

auto ensure_directory(std::filesystem::path const& dir) noexcept -> bool
{
	std::error_code ec;
	if(std::filesystem::is_directory(dir, ec))
		return true;
	if(std::filesystem::exists(dir, ec))
		return false;
	return std::filesystem::create_directories(dir, ec) && !ec;
}

auto export_file_name(uint64_t match_id, Segment const& segment)
	-> std::string
{
	return std::to_string(match_id) + '-' + std::to_string(segment.id()) +
	       '-' + to_string(segment.kind()) + ".bin";
}

auto export_segment(std::filesystem::path const& dir, uint64_t match_id,
                    Segment const& segment) noexcept -> ExportResult
{
	ExportResult r{};
	r.path = dir / export_file_name(match_id, segment);
	if(!segment.is_loaded())
	{
		r.error = std::string(to_string(RoflError::NO_DATA));
		return r;
	}
	std::ofstream f(r.path, IOS_OUT);
	if(!f.is_open())
	{
		r.error = "Could not open file for writing";
		return r;
	}
	auto const data = segment.data();
	f.write(reinterpret_cast<char const*>(data.data),
	        static_cast<std::streamsize>(data.size));
	if(!f)
	{
		r.error = "Write error";
		return r;
	}
	r.success = true;
	return r;
}
