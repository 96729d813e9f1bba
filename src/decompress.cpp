/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include "decompress.hpp"

#include <array>
#include <limits>
#include <zlib.h>

namespace
{

// Window bits for a gzip (not zlib nor raw deflate) wrapped stream.
constexpr int GZIP_WINDOW_BITS = 16 + MAX_WBITS;
constexpr size_t INFLATE_STEP = 16U * 1024U;

} // namespace

auto decompress(uint8_t const* gzip_buffer, size_t gzip_buffer_size,
                std::vector<uint8_t>& out) noexcept -> RoflError
{
	auto fail = [&]() -> RoflError
	{
		out.clear();
		return RoflError::INVALID_BUFFER;
	};
	if(gzip_buffer_size == 0U ||
	   gzip_buffer_size > std::numeric_limits<uInt>::max())
		return fail();
	z_stream stream{};
	stream.next_in = const_cast<Bytef*>(gzip_buffer);
	stream.avail_in = static_cast<uInt>(gzip_buffer_size);
	if(inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK)
		return fail();
	struct End // Close the stream regardless of how we end decompression.
	{
		z_stream& s;
		~End() { inflateEnd(&s); }
	} _{stream};
	std::array<uint8_t, INFLATE_STEP> step_buffer{};
	for(;;)
	{
		stream.next_out = step_buffer.data();
		stream.avail_out = static_cast<uInt>(step_buffer.size());
		auto const step = inflate(&stream, Z_NO_FLUSH);
		auto const produced = step_buffer.size() - stream.avail_out;
		out.insert(out.end(), step_buffer.begin(),
		           step_buffer.begin() + produced);
		if(step == Z_STREAM_END)
			break;
		if(step != Z_OK)
			return fail(); // Z_BUF_ERROR here means a truncated stream.
		if(stream.avail_in == 0U && stream.avail_out != 0U)
			return fail(); // Input exhausted before the gzip trailer.
	}
	return RoflError::NONE;
}
