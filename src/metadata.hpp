/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_METADATA_HPP
#define RRP_METADATA_HPP
#include <string>
#include <string_view>

#include "error.hpp"

constexpr std::string_view METADATA_STATS_KEY = "statsJson";

struct MetadataValueResult
{
	RoflError error{};
	std::string value{};
};

// Looks up a top-level key of the metadata JSON object. Strings are returned
// as is, anything else as JSON text. NO_DATA if the key is absent.
auto metadata_value(std::string_view json, std::string_view key) noexcept
	-> MetadataValueResult;

#endif // RRP_METADATA_HPP
