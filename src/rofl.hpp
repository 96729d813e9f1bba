/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_ROFL_HPP
#define RRP_ROFL_HPP
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "bin_header.hpp"
#include "error.hpp"
#include "payload_header.hpp"
#include "segment_iterator.hpp"

struct MetadataResult
{
	RoflError error{};
	std::string_view json{};
};

// Read-only view of a whole replay file. The buffer it was parsed from must
// stay alive and unmodified for as long as this and everything derived from
// it is in use.
class RoflFile final
{
public:
	RoflFile(uint8_t const* data, size_t size, BinHeader const& head) noexcept;

	auto head() const noexcept -> BinHeader const& { return head_; }
	auto data() const noexcept -> ByteView { return {data_, size_}; }

	// JSON text describing the game, not validated beyond UTF-8.
	auto metadata() const noexcept -> MetadataResult;

	// Decoded on first call, the same header (and its derived segment key) is
	// returned afterwards.
	auto payload() const noexcept -> ReadPayloadHeaderResult const&;

	// Iterator over chunks and keyframes. Deriving the segment key is only
	// done when `with_data` is requested.
	auto segments(bool with_data) const noexcept -> SegmentIteratorResult;

private:
	uint8_t const* data_;
	size_t size_;
	BinHeader head_;
	mutable std::optional<ReadPayloadHeaderResult> payload_;
};

struct ParseRoflResult
{
	RoflError error{};
	std::optional<RoflFile> file{};
};

auto parse_rofl(uint8_t const* data, size_t size) noexcept -> ParseRoflResult;

// Checks UTF-8 well-formedness of the whole string.
auto is_valid_utf8(std::string_view text) noexcept -> bool;

#endif // RRP_ROFL_HPP
