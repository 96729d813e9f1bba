/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_SECTION_HPP
#define RRP_SECTION_HPP
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

#include "error.hpp"
#include "rofl_data.hpp"

// Widths in bytes of the fields following the marker byte of a section.
struct SectionLayout
{
	uint8_t time_width;
	uint8_t length_width;
	uint8_t type_width;
	uint8_t param_width;

	constexpr auto core_length() const noexcept -> size_t
	{
		return 1U + time_width + length_width + type_width + param_width;
	}
};

namespace detail
{

constexpr auto make_section_layout(uint8_t flags) noexcept -> SectionLayout
{
	return {
		static_cast<uint8_t>((flags & SECTION_RELATIVE_TIME) != 0U ? 1U : 4U),
		static_cast<uint8_t>((flags & SECTION_NARROW_LENGTH) != 0U ? 1U : 4U),
		static_cast<uint8_t>((flags & SECTION_INHERIT_TYPE) != 0U ? 0U : 2U),
		static_cast<uint8_t>((flags & SECTION_NARROW_PARAM) != 0U ? 1U : 4U)};
}

// Indexed by the high nibble of the marker, which holds every flag.
constexpr std::array<SectionLayout, 16U> SECTION_LAYOUTS = []()
{
	std::array<SectionLayout, 16U> layouts{};
	for(unsigned i = 0U; i < layouts.size(); ++i)
		layouts[i] = make_section_layout(static_cast<uint8_t>(i << 4U));
	return layouts;
}();

} // namespace detail

constexpr auto section_layout(uint8_t marker) noexcept -> SectionLayout
{
	return detail::SECTION_LAYOUTS[marker >> 4U];
}

// Absolute game time in seconds.
struct AbsoluteTime
{
	float seconds;
};

// Milliseconds elapsed since the previous section.
struct RelativeTime
{
	uint8_t delta_ms;
};

using SectionTime = std::variant<AbsoluteTime, RelativeTime>;

struct ReadSectionResult;

// One framed record of a segment. Views into the segment's bytes, which must
// outlive it.
class Section final
{
public:
	Section() noexcept;

	auto marker() const noexcept -> uint8_t { return marker_; }
	auto layout() const noexcept -> SectionLayout
	{
		return section_layout(marker_);
	}
	auto time() const noexcept -> SectionTime const& { return time_; }
	// Explicit type, or the one carried from a previous section.
	auto type() const noexcept -> uint32_t { return type_; }
	auto has_explicit_type() const noexcept -> bool
	{
		return (marker_ & SECTION_INHERIT_TYPE) == 0U;
	}
	auto parameter() const noexcept -> uint32_t { return parameter_; }
	auto parameter_bytes() const noexcept -> ByteView { return parameter_bytes_; }
	auto payload() const noexcept -> ByteView { return payload_; }
	auto core_length() const noexcept -> size_t
	{
		return layout().core_length();
	}
	auto payload_length() const noexcept -> size_t { return payload_.size; }
	auto total_length() const noexcept -> size_t
	{
		return core_length() + payload_.size;
	}
	// Every byte consumed by this section, marker included.
	auto bytes() const noexcept -> ByteView { return {start_, total_length()}; }

	friend auto read_section(uint8_t const* buffer, size_t size,
	                         std::optional<uint32_t> last_type) noexcept
		-> ReadSectionResult;

private:
	uint8_t const* start_;
	uint8_t marker_;
	SectionTime time_;
	uint32_t type_;
	uint32_t parameter_;
	ByteView parameter_bytes_;
	ByteView payload_;
};

struct ReadSectionResult
{
	RoflError error{};
	Section section{};
};

// Decodes the section starting at `buffer`. `last_type` is the type to use
// when the section carries none.
auto read_section(uint8_t const* buffer, size_t size,
                  std::optional<uint32_t> last_type) noexcept
	-> ReadSectionResult;

#endif // RRP_SECTION_HPP
