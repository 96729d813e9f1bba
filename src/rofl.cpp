/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "rofl.hpp"

#include <codecvt>
#include <locale>
#include <stdexcept> // std::range_error
#include <utility>
#include <vector>

namespace
{

using Utf32Converter =
	std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t>;

// Checks that `[offset, offset + length)` lies within `size` bytes.
constexpr auto fits(size_t size, uint64_t offset, uint64_t length) noexcept
	-> bool
{
	return offset <= size && length <= size - offset;
}

// UTF-16 surrogate halves, never valid as code points.
constexpr char32_t SURROGATE_FIRST = 0xD800;
constexpr char32_t SURROGATE_LAST = 0xDFFF;

} // namespace

auto is_valid_utf8(std::string_view text) noexcept -> bool
{
	try
	{
		Utf32Converter conv;
		auto const decoded =
			conv.from_bytes(text.data(), text.data() + text.size());
		// A truncated trailing sequence is dropped rather than reported.
		if(conv.converted() != text.size())
			return false;
		for(auto const cp : decoded)
		{
			if(cp >= SURROGATE_FIRST && cp <= SURROGATE_LAST)
				return false;
		}
		return true;
	}
	catch(std::range_error const&)
	{
		return false;
	}
}

RoflFile::RoflFile(uint8_t const* data, size_t size,
                   BinHeader const& head) noexcept
	: data_(data), size_(size), head_(head), payload_()
{}

auto RoflFile::metadata() const noexcept -> MetadataResult
{
	if(!fits(size_, head_.metadata_offset, head_.metadata_length))
		return {RoflError::BUFFER_TOO_SMALL, {}};
	auto const json = std::string_view{
		reinterpret_cast<char const*>(data_ + head_.metadata_offset),
		head_.metadata_length};
	if(!is_valid_utf8(json))
		return {RoflError::INVALID_BUFFER, {}};
	return {RoflError::NONE, json};
}

auto RoflFile::payload() const noexcept -> ReadPayloadHeaderResult const&
{
	if(payload_.has_value())
		return *payload_;
	if(!fits(size_, head_.payload_header_offset, head_.payload_header_length))
		payload_ = ReadPayloadHeaderResult{RoflError::BUFFER_TOO_SMALL, {}};
	else
		payload_ = read_payload_header(data_ + head_.payload_header_offset,
		                               head_.payload_header_length);
	return *payload_;
}

auto RoflFile::segments(bool with_data) const noexcept -> SegmentIteratorResult
{
	if(size_ < head_.file_length || head_.payload_offset > head_.file_length)
		return {RoflError::BUFFER_TOO_SMALL, std::nullopt};
	auto const& payload = this->payload();
	if(payload.error != RoflError::NONE)
		return {payload.error, std::nullopt};
	std::vector<uint8_t> key;
	if(with_data)
	{
		auto r = payload.header.segment_encryption_key();
		if(r.error != RoflError::NONE)
			return {r.error, std::nullopt};
		key = std::move(r.key);
	}
	return make_segment_iterator(data_ + head_.payload_offset,
	                             head_.file_length - head_.payload_offset,
	                             payload.header.segment_count(), key,
	                             with_data);
}

auto parse_rofl(uint8_t const* data, size_t size) noexcept -> ParseRoflResult
{
	auto const r = read_bin_header(data, size);
	if(r.error != RoflError::NONE)
		return {r.error, std::nullopt};
	return {RoflError::NONE, RoflFile{data, size, r.header}};
}
