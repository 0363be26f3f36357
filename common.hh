#pragma once



#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <type_traits>



// stringify
#define XSTRINGIFY(arg__) STRINGIFY(arg__)
#define STRINGIFY(arg__) #arg__

// meaningful throw
#ifdef NDEBUG
#define throw_line(...) throw std::runtime_error(fmt::format(__VA_ARGS__))
#else
#define throw_line(...) throw std::runtime_error(fmt::format("{} {{{}:{}}}", fmt::format(__VA_ARGS__), __FILE__, __LINE__))
#endif



namespace ccd2iso
{

template <typename T, size_t N>
constexpr size_t countof(T(&)[N])
{
	return N;
}

template <typename T, typename U, class = typename std::enable_if_t<std::is_unsigned_v<U>>>
constexpr T scale_up(T value, U multiple)
{
	T sign = value > 0 ? +1 : (value < 0 ? -1 : 0);
	return (value - sign) / (T)multiple + sign;
}

uint32_t percentage(uint64_t value, uint64_t value_max);
std::string system_date_time(std::string fmt);

}
