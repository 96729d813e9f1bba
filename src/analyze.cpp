/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "analyze.hpp"

#include <algorithm> // std::find, std::min
#include <google/protobuf/arena.h>
#include <google/protobuf/util/json_util.h>
#include <iomanip>
#include <sstream>
#include <utility> // std::swap

#include "report.pb.h"

namespace
{

using PBArena = google::protobuf::Arena;
namespace Proto = RoflReplay::Proto;

constexpr size_t NEXT_BYTES_COUNT = 20U;

auto to_bytes(ByteView view) -> std::string
{
	auto const* p = reinterpret_cast<char const*>(view.data);
	return std::string(p, view.size);
}

auto hex_dump(ByteView view) -> std::string
{
	std::ostringstream ss;
	ss << std::hex << std::setfill('0');
	for(size_t i = 0U; i < view.size; ++i)
		ss << (i != 0U ? " " : "") << std::setw(2)
		   << static_cast<unsigned>(view.data[i]);
	return ss.str();
}

class ReportContext final
{
public:
	explicit ReportContext(AnalyzeOptions const& options) noexcept
		: options_(options)
		, arena_()
		, report_(*PBArena::Create<Proto::Report>(&arena_))
		, diagnostics_()
	{
		report_.set_valid(true);
	}

	auto summarize(PayloadHeader const& payload) noexcept -> void
	{
		auto& p = *report_.mutable_payload();
		p.set_match_id(payload.id());
		p.set_duration_ms(payload.duration());
		p.set_chunk_count(payload.chunk_count());
		p.set_keyframe_count(payload.keyframe_count());
		p.set_load_end_chunk(payload.load_end_chunk());
		p.set_game_start_chunk(payload.game_start_chunk());
		p.set_keyframe_interval_ms(payload.keyframe_interval());
	}

	auto parse(Segment const& segment) noexcept -> void
	{
		auto& s = *report_.add_segments();
		s.set_id(segment.id());
		s.set_kind(segment.is_chunk() ? Proto::SEGMENT_KIND_CHUNK
		                              : Proto::SEGMENT_KIND_KEYFRAME);
		s.set_length(segment.length());
		s.set_back_reference(segment.back_reference());
		s.set_offset(segment.offset());
		s.set_data_size(segment.data().size);
		if(options_.mode == AnalyzeMode::BYTES)
			s.set_data(to_bytes(segment.data()));
		auto r = segment.sections();
		if(r.error != RoflError::NONE)
		{
			s.set_valid(false);
			s.set_error(std::string(to_string(r.error)));
			return;
		}
		auto& it = *r.iterator;
		uint64_t count = 0U;
		auto& histogram = *s.mutable_histogram();
		while(auto const section = it.next())
		{
			++count;
			if(options_.mode == AnalyzeMode::STATS)
			{
				if(!options_.type.has_value())
					++histogram[section->type()];
				else if(section->type() == *options_.type)
					++histogram[section->payload_length()];
			}
			else if(options_.mode == AnalyzeMode::DETAIL)
			{
				add_section(s, *section, it.index() - section->total_length());
			}
		}
		s.set_section_count(count);
		s.set_valid(it.is_valid());
		if(it.is_valid())
			return;
		auto const data = it.data();
		auto const next_count = std::min(NEXT_BYTES_COUNT, data.size - it.index());
		ByteView const next{data.data + it.index(), next_count};
		s.set_error(std::string(to_string(it.last_error())));
		s.set_error_offset(it.index());
		s.set_next_bytes(to_bytes(next));
		std::ostringstream ss;
		ss << "BROKE at index " << it.index() << " of "
		   << to_string(segment.kind()) << ' ' << segment.id()
		   << ", next bytes: [" << hex_dump(next) << ']';
		diagnostics_.emplace_back(ss.str());
	}

	auto fail(RoflError error, uint64_t offset) noexcept -> void
	{
		report_.set_valid(false);
		report_.set_error(std::string(to_string(error)));
		report_.set_error_offset(offset);
		std::ostringstream ss;
		ss << "Segment table broke at offset " << offset << ": "
		   << to_string(error);
		diagnostics_.emplace_back(ss.str());
	}

	auto serialize() noexcept -> std::string
	{
		std::string out;
		auto options = google::protobuf::util::JsonPrintOptions{};
		options.always_print_primitive_fields = true;
		options.always_print_enums_as_ints = true;
		if(!google::protobuf::util::MessageToJsonString(report_, &out, options)
		        .ok())
			out.clear();
		return out;
	}

	auto take_diagnostics() noexcept -> std::vector<std::string>
	{
		decltype(diagnostics_) taken{};
		std::swap(taken, diagnostics_);
		return taken;
	}

private:
	auto add_section(Proto::Segment& s, Section const& section,
	                 uint64_t offset) noexcept -> void
	{
		auto& out = *s.add_sections();
		out.set_offset(offset);
		out.set_marker(section.marker());
		if(auto const* t = std::get_if<AbsoluteTime>(&section.time()))
			out.set_absolute_seconds(t->seconds);
		else
			out.set_relative_ms(std::get<RelativeTime>(section.time()).delta_ms);
		out.set_type(section.type());
		out.set_inherited_type(!section.has_explicit_type());
		out.set_parameter(section.parameter());
		out.set_payload(to_bytes(section.payload()));
	}

	AnalyzeOptions const& options_;
	PBArena arena_;
	Proto::Report& report_;
	std::vector<std::string> diagnostics_;
};

} // namespace

auto parse_analyze_mode(std::string_view name) noexcept
	-> std::optional<AnalyzeMode>
{
	if(name == "stats")
		return AnalyzeMode::STATS;
	if(name == "detail")
		return AnalyzeMode::DETAIL;
	if(name == "verify")
		return AnalyzeMode::VERIFY;
	if(name == "bytes")
		return AnalyzeMode::BYTES;
	return std::nullopt;
}

auto is_selected(AnalyzeOptions const& options, Segment const& segment) noexcept
	-> bool
{
	if(options.only.has_value() && *options.only != segment.kind())
		return false;
	return options.ids.empty() ||
	       std::find(options.ids.begin(), options.ids.end(), segment.id()) !=
	           options.ids.end();
}

auto analyze(RoflFile const& file, AnalyzeOptions const& options) noexcept
	-> AnalyzeResult
{
	auto const& payload = file.payload();
	if(payload.error != RoflError::NONE)
		return {payload.error, {}, {}};
	auto segments = file.segments(true);
	if(segments.error != RoflError::NONE)
		return {segments.error, {}, {}};
	ReportContext ctx(options);
	ctx.summarize(payload.header);
	auto& it = *segments.iterator;
	while(auto const segment = it.next())
	{
		if(is_selected(options, *segment))
			ctx.parse(*segment);
	}
	if(!it.is_valid())
		ctx.fail(it.last_error(), it.error_offset());
	return {RoflError::NONE, ctx.serialize(), ctx.take_diagnostics()};
}
