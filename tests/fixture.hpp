/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_TESTS_FIXTURE_HPP
#define RRP_TESTS_FIXTURE_HPP
#include <cstdint>
#include <string>
#include <vector>

#include "rofl_data.hpp"

using Bytes = std::vector<uint8_t>;

struct FixtureSegment
{
	uint32_t id;
	SegmentKind kind;
	uint32_t back_reference;
	Bytes plain; // Section stream, before compression and encryption.
};

struct FixtureReplay
{
	uint64_t match_id{4089123456U};
	uint32_t duration{0x01664AU};
	uint32_t load_end_chunk{2U};
	uint32_t game_start_chunk{3U};
	uint32_t keyframe_interval{60000U};
	std::string metadata{
		R"({"gameLength":91722,"gameVersion":"12.10.444.2068",)"
		R"("lastGameChunkId":6,"lastKeyFrameId":2,)"
		R"("statsJson":"[{\"NAME\":\"Summoner\",\"WIN\":\"Win\"}]"})"};
	Bytes segment_key{0x10, 0x32, 0x54, 0x76, 0x98, 0xBA, 0xDC, 0xFE,
	                  0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF};
	std::vector<FixtureSegment> segments{};
};

// Blowfish ECB with trailing pad bytes worth the pad length (1 to 8).
auto encrypt(Bytes const& key, Bytes const& plain) -> Bytes;

auto gzip(Bytes const& plain) -> Bytes;

auto base64_encode(Bytes const& data) -> std::string;

// Bytes of a section following the marker's flags. `time_bits` is the raw
// value of the time field (a float bit pattern when absolute).
auto encode_section(uint8_t marker, uint32_t time_bits, uint32_t type,
                    uint32_t parameter, Bytes const& payload) -> Bytes;

auto float_bits(float value) -> uint32_t;

// Section stream with a few explicit and inherited types.
auto sample_sections() -> Bytes;

// Six chunks and two keyframes laid out as the game writes them.
auto sample_segments() -> std::vector<FixtureSegment>;

auto build_rofl(FixtureReplay const& replay) -> Bytes;

auto sample_rofl() -> Bytes;

// Little endian writers.
auto put_u16(Bytes& out, uint16_t value) -> void;
auto put_u32(Bytes& out, uint32_t value) -> void;
auto put_u64(Bytes& out, uint64_t value) -> void;

#endif // RRP_TESTS_FIXTURE_HPP
