/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_DECOMPRESS_HPP
#define RRP_DECOMPRESS_HPP
#include <cstddef>
#include <cstdint>
#include <vector>

#include "error.hpp"

// Inflates a complete gzip stream, appending the result to `out`. On failure
// `out` is left empty.
auto decompress(uint8_t const* gzip_buffer, size_t gzip_buffer_size,
                std::vector<uint8_t>& out) noexcept -> RoflError;

#endif // RRP_DECOMPRESS_HPP
