/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_ANALYZE_HPP
#define RRP_ANALYZE_HPP
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "rofl.hpp"

enum class AnalyzeMode
{
	STATS,  // Section histogram per segment.
	DETAIL, // Every decoded section.
	VERIFY, // Only whether sections decode to the end.
	BYTES   // Raw materialized bytes.
};

struct AnalyzeOptions
{
	AnalyzeMode mode{AnalyzeMode::STATS};
	std::vector<uint32_t> ids{};
	std::optional<SegmentKind> only{};
	// In STATS mode, histogram payload lengths of this type instead.
	std::optional<uint32_t> type{};
};

struct AnalyzeResult
{
	RoflError error;
	std::string report; // JSON.
	std::vector<std::string> diagnostics;
};

auto parse_analyze_mode(std::string_view name) noexcept
	-> std::optional<AnalyzeMode>;

// Whether a segment passes the id and kind filters of `options`.
auto is_selected(AnalyzeOptions const& options, Segment const& segment) noexcept
	-> bool;

auto analyze(RoflFile const& file, AnalyzeOptions const& options) noexcept
	-> AnalyzeResult;

#endif // RRP_ANALYZE_HPP
