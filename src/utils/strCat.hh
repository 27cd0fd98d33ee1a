#ifndef STRCAT_HH
#define STRCAT_HH

#include <array>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// strCat() and strAppend() can be used to efficiently concatenate strings,
// characters and integers. Example usage:
//
//   auto s = strCat("pc=#", hex_string<4>(pc), " steps=", count);
//   strAppend(s, ", halted");
//
// Integral values (also 'uint8_t') are formatted as decimal numbers,
// hex_string<N>() formats a value as exactly N lowercase hex digits.

namespace strCatImpl {

template<size_t N, std::integral T> struct FixedWidthHex
{
	T value;
};

inline void appendOne(std::string& result, std::string_view s)
{
	result.append(s);
}

inline void appendOne(std::string& result, const char* s)
{
	result.append(s);
}

inline void appendOne(std::string& result, const std::string& s)
{
	result.append(s);
}

inline void appendOne(std::string& result, char c)
{
	result.push_back(c);
}

template<std::integral T>
	requires(!std::same_as<T, char> && !std::same_as<T, bool>)
inline void appendOne(std::string& result, T t)
{
	std::array<char, 24> buf;
	auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), t);
	result.append(buf.data(), ptr);
}

template<size_t N, std::integral T>
inline void appendOne(std::string& result, FixedWidthHex<N, T> h)
{
	static constexpr std::string_view digits = "0123456789abcdef";
	auto u = static_cast<std::make_unsigned_t<T>>(h.value);
	std::array<char, N> buf;
	for (size_t i = N; i-- > 0; /**/) {
		buf[i] = digits[u & 15];
		u = static_cast<std::make_unsigned_t<T>>(u >> 4);
	}
	result.append(buf.data(), N);
}

} // namespace strCatImpl

template<size_t N, std::integral T>
[[nodiscard]] constexpr auto hex_string(T t)
{
	return strCatImpl::FixedWidthHex<N, T>{t};
}

template<typename... Ts>
void strAppend(std::string& result, Ts&& ...ts)
{
	(strCatImpl::appendOne(result, std::forward<Ts>(ts)), ...);
}

template<typename... Ts>
[[nodiscard]] std::string strCat(Ts&& ...ts)
{
	std::string result;
	strAppend(result, std::forward<Ts>(ts)...);
	return result;
}

#endif
