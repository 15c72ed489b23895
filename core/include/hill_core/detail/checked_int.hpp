#pragma once

#include <cstdint>
#include <limits>

// overflow checked signed arithmetic. each helper returns true on overflow
// and leaves *out untouched in that case.
//
// written without __builtin_*_overflow and __int128 so the same code runs on
// the CE toolchain, where both are unavailable or unreliable for 64 bit
namespace hill_core::detail {

constexpr std::uint64_t uabs(std::int64_t x) noexcept {
		// works for INT64_MIN
		return x < 0 ? (static_cast<std::uint64_t>(-(x + 1)) + 1u) : static_cast<std::uint64_t>(x);
}

constexpr std::uint64_t gcd_u64(std::uint64_t a, std::uint64_t b) noexcept {
		while (b != 0u) {
				const std::uint64_t t = a % b;
				a = b;
				b = t;
		}
		return a;
}

template <typename T> constexpr bool add_overflow(T a, T b, T* out) noexcept {
		if (!out)
				return true;
		constexpr T kMax = std::numeric_limits<T>::max();
		constexpr T kMin = std::numeric_limits<T>::min();
		if (b > 0 && a > static_cast<T>(kMax - b))
				return true;
		if (b < 0 && a < static_cast<T>(kMin - b))
				return true;
		*out = static_cast<T>(a + b);
		return false;
}

template <typename T> constexpr bool sub_overflow(T a, T b, T* out) noexcept {
		if (!out)
				return true;
		constexpr T kMax = std::numeric_limits<T>::max();
		constexpr T kMin = std::numeric_limits<T>::min();
		if (b > 0 && a < static_cast<T>(kMin + b))
				return true;
		if (b < 0 && a > static_cast<T>(kMax + b))
				return true;
		*out = static_cast<T>(a - b);
		return false;
}

template <typename T> constexpr bool mul_overflow(T a, T b, T* out) noexcept {
		if (!out)
				return true;
		constexpr T kMax = std::numeric_limits<T>::max();
		constexpr T kMin = std::numeric_limits<T>::min();

		if (a == 0 || b == 0) {
				*out = 0;
				return false;
		}
		// min * -1 is the only product of magnitude-1 operands that overflows
		if (a == -1 || b == -1) {
				const T other = (a == -1) ? b : a;
				if (other == kMin)
						return true;
				*out = static_cast<T>(-other);
				return false;
		}

		if (a > 0) {
				if (b > 0) {
						if (a > static_cast<T>(kMax / b))
								return true;
				} else if (b < static_cast<T>(kMin / a)) {
						return true;
				}
		} else {
				if (b > 0) {
						if (a < static_cast<T>(kMin / b))
								return true;
				} else if (b < static_cast<T>(kMax / a)) {
						return true;
				}
		}

		*out = static_cast<T>(a * b);
		return false;
}

} // namespace hill_core::detail
