/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_SECTION_ITERATOR_HPP
#define RRP_SECTION_ITERATOR_HPP
#include <cstddef>
#include <cstdint>
#include <optional>

#include "error.hpp"
#include "section.hpp"

// Single pass over the sections of a materialized segment. Stops for good on
// the first malformed section; sections yielded before stay usable.
class SectionIterator final
{
public:
	SectionIterator(uint8_t const* data, size_t size) noexcept;

	// Next section, or nothing once exhausted or broken.
	auto next() noexcept -> std::optional<Section>;

	auto is_valid() const noexcept -> bool
	{
		return last_error_ == RoflError::NONE;
	}
	auto last_error() const noexcept -> RoflError { return last_error_; }
	// Offset of the next section to read. Once broken, offset of the section
	// that failed to decode.
	auto index() const noexcept -> size_t { return index_; }
	auto data() const noexcept -> ByteView { return {data_, size_}; }

private:
	uint8_t const* data_;
	size_t size_;
	size_t index_;
	std::optional<uint32_t> last_type_;
	RoflError last_error_;
};

#endif // RRP_SECTION_ITERATOR_HPP
