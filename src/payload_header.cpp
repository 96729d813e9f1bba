/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "payload_header.hpp"

#include <cstring> // std::memcpy
#include <limits>
#include <openssl/evp.h>
#include <string>
#include <type_traits>
#include <utility>

#include "cipher.hpp"
#include "rofl_data.hpp"

namespace
{

#include "read.inl"

constexpr size_t ENCRYPTION_KEY_LENGTH_OFFSET = 32U;

} // namespace

PayloadHeader::PayloadHeader() noexcept
	: match_id_(0U)
	, match_length_(0U)
	, keyframe_count_(0U)
	, chunk_count_(0U)
	, end_startup_chunk_id_(0U)
	, start_game_chunk_id_(0U)
	, keyframe_interval_(0U)
	, encryption_key_()
	, segment_key_()
{}

auto PayloadHeader::segment_encryption_key() const noexcept
	-> SegmentKeyResult
{
	if(segment_key_.has_value())
		return {RoflError::NONE, *segment_key_};
	std::vector<uint8_t> encrypted;
	if(auto const e = base64_decode(encryption_key_, encrypted);
	   e != RoflError::NONE)
		return {e, {}};
	// The key's key is the game ID written as a decimal string.
	auto const match_id_str = std::to_string(match_id_);
	std::vector<uint8_t> key;
	auto const e = decrypt(
		reinterpret_cast<uint8_t const*>(match_id_str.data()),
		match_id_str.size(), encrypted.data(), encrypted.size(),
		PIPELINE_DECRYPT | PIPELINE_DEPAD, key);
	if(e != RoflError::NONE)
		return {e, {}};
	segment_key_ = key;
	return {RoflError::NONE, std::move(key)};
}

auto read_payload_header(uint8_t const* buffer, size_t size) noexcept
	-> ReadPayloadHeaderResult
{
	ReadPayloadHeaderResult r{};
	if(buffer == nullptr || size < PAYLOAD_HEADER_FIXED_SIZE)
	{
		r.error = RoflError::BUFFER_TOO_SMALL;
		return r;
	}
	auto const key_length = read_at<uint16_t>(buffer,
	                                          ENCRYPTION_KEY_LENGTH_OFFSET);
	if(size - PAYLOAD_HEADER_FIXED_SIZE < key_length)
	{
		r.error = RoflError::BUFFER_TOO_SMALL;
		return r;
	}
	auto& h = r.header;
	auto const* ptr = buffer;
	h.match_id_ = read<uint64_t>(ptr);
	h.match_length_ = read<uint32_t>(ptr);
	h.keyframe_count_ = read<uint32_t>(ptr);
	h.chunk_count_ = read<uint32_t>(ptr);
	h.end_startup_chunk_id_ = read<uint32_t>(ptr);
	h.start_game_chunk_id_ = read<uint32_t>(ptr);
	h.keyframe_interval_ = read<uint32_t>(ptr);
	ptr += sizeof(uint16_t); // Key length, read above.
	h.encryption_key_ =
		std::string_view{reinterpret_cast<char const*>(ptr), key_length};
	return r;
}

auto base64_decode(std::string_view text, std::vector<uint8_t>& out) noexcept
	-> RoflError
{
	out.clear();
	if(text.empty() || text.size() % 4U != 0U ||
	   text.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
		return RoflError::INVALID_BUFFER;
	out.resize((text.size() / 4U) * 3U);
	auto const decoded =
		EVP_DecodeBlock(out.data(),
	                    reinterpret_cast<unsigned char const*>(text.data()),
	                    static_cast<int>(text.size()));
	if(decoded < 0)
	{
		out.clear();
		return RoflError::INVALID_BUFFER;
	}
	// EVP_DecodeBlock counts the bytes standing in for '=' padding.
	size_t padding = 0U;
	for(auto it = text.rbegin(); it != text.rend() && *it == '=' && padding < 2U;
	    ++it)
		++padding;
	out.resize(static_cast<size_t>(decoded) - padding);
	return RoflError::NONE;
}
