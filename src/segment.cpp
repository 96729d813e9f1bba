/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "segment.hpp"

#include <cstring> // std::memcpy
#include <type_traits>
#include <utility>

namespace
{

#include "read.inl"

} // namespace

Segment::Segment() noexcept
	: id_(0U)
	, kind_(SEGMENT_NONE)
	, length_(0U)
	, back_reference_(0U)
	, offset_(0U)
	, data_()
{}

auto Segment::data() const noexcept -> ByteView
{
	if(!data_.has_value())
		return {};
	return {data_->data(), data_->size()};
}

auto Segment::load(BlowfishCipher const& cipher, uint8_t const* data_region,
                   size_t data_region_size) noexcept -> RoflError
{
	if(data_.has_value())
		return RoflError::NONE;
	if(data_region == nullptr || data_region_size < offset_ ||
	   data_region_size - offset_ < length_)
		return RoflError::BUFFER_TOO_SMALL;
	std::vector<uint8_t> out;
	auto const e =
		decrypt(cipher, data_region + offset_, length_,
	            PIPELINE_DECRYPT | PIPELINE_DEPAD | PIPELINE_DECOMPRESS, out);
	if(e != RoflError::NONE)
		return e;
	data_ = std::move(out);
	return RoflError::NONE;
}

auto Segment::sections() const noexcept -> SectionIteratorResult
{
	if(!data_.has_value())
		return {RoflError::NO_DATA, std::nullopt};
	return {RoflError::NONE, SectionIterator{data_->data(), data_->size()}};
}

auto read_segment(uint8_t const* buffer, size_t size) noexcept
	-> ReadSegmentResult
{
	ReadSegmentResult r{};
	if(buffer == nullptr || size < SEGMENT_HEADER_SIZE)
	{
		r.error = RoflError::BUFFER_TOO_SMALL;
		return r;
	}
	auto const* ptr = buffer;
	auto const id = read<uint32_t>(ptr);
	auto const kind = read<uint8_t>(ptr);
	if(kind != SEGMENT_CHUNK && kind != SEGMENT_KEYFRAME)
	{
		r.error = RoflError::INVALID_BUFFER;
		return r;
	}
	auto& s = r.segment;
	s.id_ = id;
	s.kind_ = static_cast<SegmentKind>(kind);
	s.length_ = read<uint32_t>(ptr);
	s.back_reference_ = read<uint32_t>(ptr);
	s.offset_ = read<uint32_t>(ptr);
	return r;
}

auto to_string(SegmentKind kind) noexcept -> char const*
{
	switch(kind)
	{
	case SEGMENT_CHUNK:
		return "Chunk";
	case SEGMENT_KEYFRAME:
		return "Keyframe";
	default:
		return "None";
	}
}
