/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_PAYLOAD_HEADER_HPP
#define RRP_PAYLOAD_HEADER_HPP
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "error.hpp"

struct SegmentKeyResult
{
	RoflError error{};
	std::vector<uint8_t> key{};
};

struct ReadPayloadHeaderResult;

// Payload layout and crypto material. The encryption key is a view into the
// buffer the header was read from, which must outlive it.
class PayloadHeader final
{
public:
	PayloadHeader() noexcept;

	auto id() const noexcept -> uint64_t { return match_id_; }
	// Duration of the game in milliseconds.
	auto duration() const noexcept -> uint32_t { return match_length_; }
	auto keyframe_count() const noexcept -> uint32_t { return keyframe_count_; }
	auto chunk_count() const noexcept -> uint32_t { return chunk_count_; }
	auto segment_count() const noexcept -> uint64_t
	{
		return uint64_t{chunk_count_} + keyframe_count_;
	}
	// Last chunk used to load data before the game starts.
	auto load_end_chunk() const noexcept -> uint32_t
	{
		return end_startup_chunk_id_;
	}
	auto game_start_chunk() const noexcept -> uint32_t
	{
		return start_game_chunk_id_;
	}
	// Duration covered by a single keyframe in milliseconds.
	auto keyframe_interval() const noexcept -> uint32_t
	{
		return keyframe_interval_;
	}
	// Base64 text of the encrypted segment key.
	auto encryption_key() const noexcept -> std::string_view
	{
		return encryption_key_;
	}

	// Key used to decrypt segment data. Derived on first success and cached.
	auto segment_encryption_key() const noexcept -> SegmentKeyResult;

	friend auto read_payload_header(uint8_t const* buffer, size_t size) noexcept
		-> ReadPayloadHeaderResult;

private:
	uint64_t match_id_;
	uint32_t match_length_;
	uint32_t keyframe_count_;
	uint32_t chunk_count_;
	uint32_t end_startup_chunk_id_;
	uint32_t start_game_chunk_id_;
	uint32_t keyframe_interval_;
	std::string_view encryption_key_;
	mutable std::optional<std::vector<uint8_t>> segment_key_;
};

struct ReadPayloadHeaderResult
{
	RoflError error{};
	PayloadHeader header{};
};

auto read_payload_header(uint8_t const* buffer, size_t size) noexcept
	-> ReadPayloadHeaderResult;

// Decodes standard (padded) base64 text.
auto base64_decode(std::string_view text, std::vector<uint8_t>& out) noexcept
	-> RoflError;

#endif // RRP_PAYLOAD_HEADER_HPP
