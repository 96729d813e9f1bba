/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#ifndef RRP_CIPHER_HPP
#define RRP_CIPHER_HPP
#include <cstddef>
#include <cstdint>
#include <openssl/blowfish.h>
#include <vector>

#include "error.hpp"

// Blowfish works on independent 64-bit blocks (ECB, no IV).
constexpr size_t CIPHER_BLOCK_SIZE = BF_BLOCK;
constexpr size_t CIPHER_MAX_KEY_SIZE = 56U;

enum PipelineSteps : unsigned
{
	PIPELINE_DECRYPT = 0x0,
	PIPELINE_DEPAD = 0x1,
	PIPELINE_DECOMPRESS = 0x2
};

// Initialized cipher state, reused to decrypt every segment of a replay.
class BlowfishCipher final
{
public:
	BlowfishCipher() noexcept;

	// Fails with INVALID_BUFFER for empty keys or keys over 448 bits.
	auto set_key(uint8_t const* key, size_t key_size) noexcept -> RoflError;

	auto has_key() const noexcept -> bool { return has_key_; }

	auto decrypt_block(uint8_t const* in, uint8_t* out) const noexcept -> void;

	auto encrypt_block(uint8_t const* in, uint8_t* out) const noexcept -> void;

private:
	BF_KEY key_;
	bool has_key_;
};

// Decrypts `size` bytes (a non-zero multiple of the block size) and runs the
// optional depad and gzip steps, writing the result to `out`.
auto decrypt(BlowfishCipher const& cipher, uint8_t const* in, size_t size,
             unsigned steps, std::vector<uint8_t>& out) noexcept -> RoflError;

// Same as above with a cipher initialized from `key` for this call only.
auto decrypt(uint8_t const* key, size_t key_size, uint8_t const* in,
             size_t size, unsigned steps,
             std::vector<uint8_t>& out) noexcept -> RoflError;

// Removes trailing padding whose length is given by the last byte.
auto depad(std::vector<uint8_t>& buffer) noexcept -> RoflError;

#endif // RRP_CIPHER_HPP
