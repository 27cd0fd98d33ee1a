#ifndef XRANGE_HH
#define XRANGE_HH

// Utility to iterate over a range of numbers,
// modeled after python's xrange() function.
//
//   for (auto i : xrange(256)) { ... }        // [0, 256)
//   for (auto i : xrange(0x40, 0x80)) { ... } // [0x40, 0x80)
//
// The type of the induction variable is the (common) type of the bounds.

#include <cstddef>
#include <iterator>
#include <type_traits>

template<typename T> struct XRange
{
	struct Iter
	{
		using difference_type = ptrdiff_t;
		using value_type = T;
		using pointer    = T*;
		using reference  = T&;
		using iterator_category = std::forward_iterator_tag;

		[[nodiscard]] constexpr T operator*() const { return x; }

		constexpr Iter& operator++()
		{
			++x;
			return *this;
		}
		constexpr Iter operator++(int)
		{
			auto copy = *this;
			++x;
			return copy;
		}

		[[nodiscard]] constexpr bool operator==(const Iter&) const = default;

		T x;
	};

	[[nodiscard]] constexpr auto begin() const { return Iter{b}; }
	[[nodiscard]] constexpr auto end()   const { return Iter{e}; }

	T b;
	T e;
};

template<typename T> [[nodiscard]] constexpr auto xrange(T e)
{
	return XRange<T>{T(0), e < T(0) ? T(0) : e};
}
template<typename T1, typename T2> [[nodiscard]] constexpr auto xrange(T1 b, T2 e)
{
	static_assert(std::is_signed_v<T1> == std::is_signed_v<T2>);
	using T = std::common_type_t<T1, T2>;
	return XRange<T>{T(b), e < b ? T(b) : T(e)};
}

#endif
