/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_SEGMENT_ITERATOR_HPP
#define RRP_SEGMENT_ITERATOR_HPP
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "cipher.hpp"
#include "error.hpp"
#include "rofl_data.hpp"
#include "segment.hpp"

struct SegmentIteratorResult;

// Single pass over the segment header table, in file order. When built with
// data, every yielded segment is already loaded. Stops for good on the first
// malformed record or failed load.
class SegmentHeaderIterator final
{
public:
	auto next() noexcept -> std::optional<Segment>;

	auto is_valid() const noexcept -> bool
	{
		return last_error_ == RoflError::NONE;
	}
	auto last_error() const noexcept -> RoflError { return last_error_; }
	// Number of segments yielded so far.
	auto index() const noexcept -> uint64_t { return index_; }
	// Offset in the payload of the next header record. Once broken, offset
	// of the record that failed.
	auto error_offset() const noexcept -> uint64_t
	{
		return index_ * SEGMENT_HEADER_SIZE;
	}
	auto segment_count() const noexcept -> uint64_t { return segment_count_; }
	auto data() const noexcept -> ByteView { return {data_, size_}; }
	// Bytes following the segment header table.
	auto data_region() const noexcept -> ByteView;
	// Cipher used to load segment data, without key unless built with data.
	auto cipher() const noexcept -> BlowfishCipher const& { return cipher_; }

	// `data` spans from the payload offset to the end of the file. `key` is
	// only used, and only checked, when `with_data` is set.
	friend auto make_segment_iterator(uint8_t const* data, size_t size,
	                                  uint64_t segment_count,
	                                  std::vector<uint8_t> const& key,
	                                  bool with_data) noexcept
		-> SegmentIteratorResult;

private:
	SegmentHeaderIterator(uint8_t const* data, size_t size,
	                      uint64_t segment_count, bool with_data) noexcept;

	uint8_t const* data_;
	size_t size_;
	uint64_t segment_count_;
	uint64_t index_;
	bool with_data_;
	BlowfishCipher cipher_;
	RoflError last_error_;
};

struct SegmentIteratorResult
{
	RoflError error{};
	std::optional<SegmentHeaderIterator> iterator{};
};

auto make_segment_iterator(uint8_t const* data, size_t size,
                           uint64_t segment_count,
                           std::vector<uint8_t> const& key,
                           bool with_data) noexcept -> SegmentIteratorResult;

#endif // RRP_SEGMENT_ITERATOR_HPP
