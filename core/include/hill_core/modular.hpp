#pragma once

#include <cstdint>

#include "hill_core/error.hpp"

namespace hill_core {

// canonical residue of a in [0, m). requires m > 0
constexpr std::int64_t mod_normalize(std::int64_t a, std::int64_t m) noexcept {
		const std::int64_t r = a % m;
		return r < 0 ? r + m : r;
}

// gcd(|a|, |b|), gcd(0, 0) == 0
std::int64_t gcd_i64(In std::int64_t a, In std::int64_t b) noexcept;

// (a * b) mod m without intermediate overflow, result in [0, m). requires m > 0
std::int64_t mod_mul(In std::int64_t a, In std::int64_t b, In std::int64_t m) noexcept;

// (a + b) mod m, result in [0, m). requires m > 0
std::int64_t mod_add(In std::int64_t a, In std::int64_t b, In std::int64_t m) noexcept;

// x in [1, m) with a*x == 1 (mod m), by the extended euclidean algorithm
//
// InvalidModulus when m < 2
// NotInvertible when gcd(a mod m, m) != 1, err.gcd holds the gcd
Error mod_inverse_scalar(In std::int64_t a, In std::int64_t m, Out std::int64_t* out) noexcept;

// smallest prime dividing n (n >= 2)
std::int64_t smallest_prime_factor(In std::int64_t n) noexcept;

} // namespace hill_core
