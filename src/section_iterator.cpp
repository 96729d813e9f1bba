/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "section_iterator.hpp"

SectionIterator::SectionIterator(uint8_t const* data, size_t size) noexcept
	: data_(data), size_(size), index_(0U), last_type_(), last_error_()
{}

auto SectionIterator::next() noexcept -> std::optional<Section>
{
	if(!is_valid() || index_ >= size_)
		return std::nullopt;
	auto r = read_section(data_ + index_, size_ - index_, last_type_);
	if(r.error != RoflError::NONE)
	{
		last_error_ = r.error;
		return std::nullopt;
	}
	index_ += r.section.total_length();
	if(r.section.has_explicit_type())
		last_type_ = r.section.type();
	return r.section;
}
