/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_PRINT_HEADER_HPP
#define RRP_PRINT_HEADER_HPP
#include <ostream>

#include "bin_header.hpp"
#include "payload_header.hpp"

auto print_signature(std::ostream& os, BinHeader const& header) noexcept
	-> void;

auto print_bin_header(std::ostream& os, BinHeader const& header) noexcept
	-> void;

auto print_payload_header(std::ostream& os,
                          PayloadHeader const& header) noexcept -> void;

#endif // RRP_PRINT_HEADER_HPP
