/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "cipher.hpp"

#include <cstring> // std::memset
#include <utility>

#include "decompress.hpp"

BlowfishCipher::BlowfishCipher() noexcept : key_(), has_key_(false)
{
	std::memset(&key_, 0, sizeof(key_));
}

auto BlowfishCipher::set_key(uint8_t const* key, size_t key_size) noexcept
	-> RoflError
{
	if(key == nullptr || key_size == 0U || key_size > CIPHER_MAX_KEY_SIZE)
		return RoflError::INVALID_BUFFER;
	BF_set_key(&key_, static_cast<int>(key_size), key);
	has_key_ = true;
	return RoflError::NONE;
}

auto BlowfishCipher::decrypt_block(uint8_t const* in, uint8_t* out) const
	noexcept -> void
{
	BF_ecb_encrypt(in, out, &key_, BF_DECRYPT);
}

auto BlowfishCipher::encrypt_block(uint8_t const* in, uint8_t* out) const
	noexcept -> void
{
	BF_ecb_encrypt(in, out, &key_, BF_ENCRYPT);
}

auto depad(std::vector<uint8_t>& buffer) noexcept -> RoflError
{
	if(buffer.empty())
		return RoflError::BUFFER_TOO_SMALL;
	auto const pad = static_cast<size_t>(buffer.back());
	if(pad > CIPHER_BLOCK_SIZE)
		return RoflError::INVALID_BUFFER;
	if(buffer.size() < pad)
		return RoflError::BUFFER_TOO_SMALL;
	buffer.resize(buffer.size() - pad);
	return RoflError::NONE;
}

auto decrypt(BlowfishCipher const& cipher, uint8_t const* in, size_t size,
             unsigned steps, std::vector<uint8_t>& out) noexcept -> RoflError
{
	if(!cipher.has_key())
		return RoflError::NO_DATA;
	if(size == 0U || size % CIPHER_BLOCK_SIZE != 0U)
		return RoflError::INVALID_BUFFER;
	std::vector<uint8_t> plain(size);
	for(size_t i = 0U; i < size; i += CIPHER_BLOCK_SIZE)
		cipher.decrypt_block(in + i, plain.data() + i);
	if((steps & PIPELINE_DEPAD) != 0U)
	{
		if(auto const e = depad(plain); e != RoflError::NONE)
			return e;
	}
	out.clear();
	if((steps & PIPELINE_DECOMPRESS) != 0U)
		return decompress(plain.data(), plain.size(), out);
	out = std::move(plain);
	return RoflError::NONE;
}

auto decrypt(uint8_t const* key, size_t key_size, uint8_t const* in,
             size_t size, unsigned steps,
             std::vector<uint8_t>& out) noexcept -> RoflError
{
	BlowfishCipher cipher;
	if(auto const e = cipher.set_key(key, key_size); e != RoflError::NONE)
		return e;
	return decrypt(cipher, in, size, steps, out);
}
