/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_ERROR_HPP
#define RRP_ERROR_HPP
#include <string_view>

enum class RoflError
{
	NONE,
	NO_DATA,         // Required data was never produced.
	BUFFER_TOO_SMALL,
	INVALID_BUFFER   // Bytes are present but structurally wrong.
};

auto to_string(RoflError error) noexcept -> std::string_view;

#endif // RRP_ERROR_HPP
