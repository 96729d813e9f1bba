// Little endian field readers, callers check bounds beforehand.
template<typename T>
constexpr auto read(uint8_t const*& ptr) noexcept -> T
{
	static_assert(std::is_unsigned_v<T>, "Only unsigned integers are read");
	T value{};
	for(size_t i = 0U; i < sizeof(T); ++i)
		value |= static_cast<T>(static_cast<T>(ptr[i]) << (8U * i));
	ptr += sizeof(T);
	return value;
}

template<typename T>
constexpr auto read_at(uint8_t const* ptr, size_t offset) noexcept -> T
{
	ptr += offset;
	return read<T>(ptr);
}

inline auto read_float(uint8_t const*& ptr) noexcept -> float
{
	auto const bits = read<uint32_t>(ptr);
	float value{};
	std::memcpy(&value, &bits, sizeof(value));
	return value;
}
