/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_SEGMENT_HPP
#define RRP_SEGMENT_HPP
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "cipher.hpp"
#include "error.hpp"
#include "rofl_data.hpp"
#include "section_iterator.hpp"

struct SectionIteratorResult
{
	RoflError error{};
	std::optional<SectionIterator> iterator{};
};

struct ReadSegmentResult;

// A chunk or a keyframe: its header record and, once loaded, its decrypted
// and decompressed data.
class Segment final
{
public:
	// Of kind SEGMENT_NONE until decoded by `read_segment`.
	Segment() noexcept;

	// 1-based, chunks and keyframes are numbered separately.
	auto id() const noexcept -> uint32_t { return id_; }
	auto kind() const noexcept -> SegmentKind { return kind_; }
	auto is_chunk() const noexcept -> bool { return kind_ == SEGMENT_CHUNK; }
	auto is_keyframe() const noexcept -> bool
	{
		return kind_ == SEGMENT_KEYFRAME;
	}
	// Length of the encrypted data.
	auto length() const noexcept -> uint32_t { return length_; }
	// For keyframes, the first chunk they summarize. 0 for chunks.
	auto back_reference() const noexcept -> uint32_t { return back_reference_; }
	// Offset of the encrypted data from the end of the segment header table.
	auto offset() const noexcept -> uint32_t { return offset_; }

	auto is_loaded() const noexcept -> bool { return data_.has_value(); }
	// Materialized bytes, empty when not loaded.
	auto data() const noexcept -> ByteView;

	// Decrypts and inflates this segment's bytes out of `data_region`, the
	// bytes following the segment header table. Does nothing when loaded.
	auto load(BlowfishCipher const& cipher, uint8_t const* data_region,
	          size_t data_region_size) noexcept -> RoflError;

	// Iterator over the sections of the loaded data. NO_DATA if not loaded.
	auto sections() const noexcept -> SectionIteratorResult;

	friend auto read_segment(uint8_t const* buffer, size_t size) noexcept
		-> ReadSegmentResult;

private:
	uint32_t id_;
	SegmentKind kind_;
	uint32_t length_;
	uint32_t back_reference_;
	uint32_t offset_;
	std::optional<std::vector<uint8_t>> data_;
};

struct ReadSegmentResult
{
	RoflError error{};
	Segment segment{};
};

// Decodes one segment header record, does not load its data.
auto read_segment(uint8_t const* buffer, size_t size) noexcept
	-> ReadSegmentResult;

auto to_string(SegmentKind kind) noexcept -> char const*;

#endif // RRP_SEGMENT_HPP
