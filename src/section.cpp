/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "section.hpp"

#include <cstring> // std::memcpy
#include <type_traits>

namespace
{

#include "read.inl"

auto read_width(uint8_t const*& ptr, uint8_t width) noexcept -> uint32_t
{
	switch(width)
	{
	case 0U:
		return 0U;
	case 1U:
		return read<uint8_t>(ptr);
	case 2U:
		return read<uint16_t>(ptr);
	default: // 4U
		return read<uint32_t>(ptr);
	}
}

} // namespace

Section::Section() noexcept
	: start_(nullptr)
	, marker_(0U)
	, time_(AbsoluteTime{0.0F})
	, type_(0U)
	, parameter_(0U)
	, parameter_bytes_()
	, payload_()
{}

auto read_section(uint8_t const* buffer, size_t size,
                  std::optional<uint32_t> last_type) noexcept
	-> ReadSectionResult
{
	ReadSectionResult r{};
	if(buffer == nullptr || size == 0U)
	{
		r.error = RoflError::BUFFER_TOO_SMALL;
		return r;
	}
	auto const marker = buffer[0];
	auto const layout = section_layout(marker);
	auto const core_length = layout.core_length();
	if(size < core_length)
	{
		r.error = RoflError::BUFFER_TOO_SMALL;
		return r;
	}
	if(layout.type_width == 0U && !last_type.has_value())
	{
		r.error = RoflError::NO_DATA;
		return r;
	}
	auto& s = r.section;
	s.start_ = buffer;
	s.marker_ = marker;
	auto const* ptr = buffer + 1U;
	if(layout.time_width == 1U)
		s.time_ = RelativeTime{read<uint8_t>(ptr)};
	else
		s.time_ = AbsoluteTime{read_float(ptr)};
	auto const payload_length = read_width(ptr, layout.length_width);
	s.type_ = layout.type_width == 0U ? *last_type
	                                  : read_width(ptr, layout.type_width);
	s.parameter_bytes_ = {ptr, layout.param_width};
	s.parameter_ = read_width(ptr, layout.param_width);
	if(size - core_length < payload_length)
	{
		r.section = Section{};
		r.error = RoflError::BUFFER_TOO_SMALL;
		return r;
	}
	s.payload_ = {ptr, payload_length};
	return r;
}
