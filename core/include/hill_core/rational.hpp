#pragma once

#include <cstdint>

#include "hill_core/error.hpp"

namespace hill_core {

// exact fraction for elimination and cofactor work. invariants: den > 0,
// num and den coprime, zero is stored as 0/1. none of the operations wrap,
// an out of range result comes back as Overflow
class Rational {
	  public:
		constexpr Rational() noexcept = default;

		// key entries are integers, so this is the common constructor
		static constexpr Rational from_int(std::int64_t v) noexcept { return Rational(v, 1); }

		// normalizes sign and common factors. DivisionByZero for den == 0
		static ErrorCode make(In std::int64_t num, In std::int64_t den, Out Rational* out) noexcept;

		constexpr std::int64_t num() const noexcept { return num_; }
		constexpr std::int64_t den() const noexcept { return den_; }
		constexpr bool is_zero() const noexcept { return num_ == 0; }
		constexpr bool is_integer() const noexcept { return den_ == 1; }

	  private:
		constexpr Rational(std::int64_t num, std::int64_t den) noexcept : num_(num), den_(den) {}

		std::int64_t num_ = 0;
		std::int64_t den_ = 1;
};

// out may not alias an operand
ErrorCode rational_add(In const Rational& a, In const Rational& b, Out Rational* out) noexcept;
ErrorCode rational_sub(In const Rational& a, In const Rational& b, Out Rational* out) noexcept;
ErrorCode rational_mul(In const Rational& a, In const Rational& b, Out Rational* out) noexcept;
ErrorCode rational_div(In const Rational& a, In const Rational& b, Out Rational* out) noexcept;
ErrorCode rational_neg(In const Rational& a, Out Rational* out) noexcept;

// sign of |a| - |b|, used for pivot choice. compares num/den by long
// division so it cannot overflow
int rational_cmp_abs(In const Rational& a, In const Rational& b) noexcept;

} // namespace hill_core
