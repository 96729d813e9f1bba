/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "segment_iterator.hpp"

#include <utility>

SegmentHeaderIterator::SegmentHeaderIterator(uint8_t const* data, size_t size,
                                             uint64_t segment_count,
                                             bool with_data) noexcept
	: data_(data)
	, size_(size)
	, segment_count_(segment_count)
	, index_(0U)
	, with_data_(with_data)
	, cipher_()
	, last_error_()
{}

auto SegmentHeaderIterator::data_region() const noexcept -> ByteView
{
	auto const table_size = segment_count_ * SEGMENT_HEADER_SIZE;
	return {data_ + table_size, size_ - static_cast<size_t>(table_size)};
}

auto SegmentHeaderIterator::next() noexcept -> std::optional<Segment>
{
	if(!is_valid() || index_ >= segment_count_)
		return std::nullopt;
	auto const record_offset = static_cast<size_t>(error_offset());
	auto r = read_segment(data_ + record_offset, size_ - record_offset);
	if(r.error == RoflError::NONE && with_data_)
	{
		auto const region = data_region();
		r.error = r.segment.load(cipher_, region.data, region.size);
	}
	if(r.error != RoflError::NONE)
	{
		last_error_ = r.error;
		return std::nullopt;
	}
	++index_;
	return std::move(r.segment);
}

auto make_segment_iterator(uint8_t const* data, size_t size,
                           uint64_t segment_count,
                           std::vector<uint8_t> const& key,
                           bool with_data) noexcept -> SegmentIteratorResult
{
	if(data == nullptr ||
	   size / SEGMENT_HEADER_SIZE < segment_count)
		return {RoflError::BUFFER_TOO_SMALL, std::nullopt};
	SegmentHeaderIterator it(data, size, segment_count, with_data);
	if(with_data)
	{
		if(auto const e = it.cipher_.set_key(key.data(), key.size());
		   e != RoflError::NONE)
			return {e, std::nullopt};
	}
	return {RoflError::NONE, std::move(it)};
}
