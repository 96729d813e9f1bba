/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "error.hpp"

auto to_string(RoflError error) noexcept -> std::string_view
{
	switch(error)
	{
	case RoflError::NONE:
		return "No error";
	case RoflError::NO_DATA:
		return "No data was loaded or provided";
	case RoflError::BUFFER_TOO_SMALL:
		return "The provided data buffer was too small to be used";
	default: // RoflError::INVALID_BUFFER
		return "The provided data buffer did not provide usable data";
	}
}
