#include "hill_core/rational.hpp"

#include "hill_core/detail/checked_int.hpp"

#include <limits>
#include <utility>

namespace hill_core {
namespace {
using detail::add_overflow;
using detail::gcd_u64;
using detail::mul_overflow;
using detail::sub_overflow;
using detail::uabs;

constexpr std::int64_t kI64Min = std::numeric_limits<std::int64_t>::min();

ErrorCode normalize(std::int64_t* num, std::int64_t* den) noexcept {
		if (*den == 0)
				return ErrorCode::DivisionByZero;

		if (*num == 0) {
				*den = 1;
				return ErrorCode::Ok;
		}

		if (*den < 0) {
				if (*den == kI64Min || *num == kI64Min)
						return ErrorCode::Overflow;
				*num = -*num;
				*den = -*den;
		}

		const std::uint64_t g = gcd_u64(uabs(*num), static_cast<std::uint64_t>(*den));
		if (g > 1u) {
				*num /= static_cast<std::int64_t>(g);
				*den /= static_cast<std::int64_t>(g);
		}
		return ErrorCode::Ok;
}

// a/b +- c/d = (a*(d/g) +- c*(b/g)) / (b/g*d), g = gcd(b, d)
//
// subtraction is computed directly rather than as add(a, -b): negating the
// second operand would overflow for INT64_MIN numerators
ErrorCode add_or_sub(const Rational& a, const Rational& b, bool subtract, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;

		const std::uint64_t g = gcd_u64(static_cast<std::uint64_t>(a.den()), static_cast<std::uint64_t>(b.den()));
		const std::int64_t a_den_g = a.den() / static_cast<std::int64_t>(g);
		const std::int64_t b_den_g = b.den() / static_cast<std::int64_t>(g);

		std::int64_t lhs = 0;
		std::int64_t rhs = 0;
		std::int64_t num = 0;
		std::int64_t den = 0;
		if (mul_overflow(a.num(), b_den_g, &lhs) || mul_overflow(b.num(), a_den_g, &rhs))
				return ErrorCode::Overflow;
		if (subtract ? sub_overflow(lhs, rhs, &num) : add_overflow(lhs, rhs, &num))
				return ErrorCode::Overflow;
		if (mul_overflow(a_den_g, b.den(), &den))
				return ErrorCode::Overflow;

		return Rational::make(num, den, out);
}

} // namespace

ErrorCode Rational::make(std::int64_t num, std::int64_t den, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;

		ErrorCode ec = normalize(&num, &den);
		if (!is_ok(ec))
				return ec;

		*out = Rational(num, den);
		return ErrorCode::Ok;
}

ErrorCode rational_add(const Rational& a, const Rational& b, Rational* out) noexcept {
		return add_or_sub(a, b, false, out);
}

ErrorCode rational_sub(const Rational& a, const Rational& b, Rational* out) noexcept {
		return add_or_sub(a, b, true, out);
}

ErrorCode rational_mul(const Rational& a, const Rational& b, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;

		if (a.is_zero() || b.is_zero()) {
				*out = Rational::from_int(0);
				return ErrorCode::Ok;
		}

		// cross-reduce before multiplying: (a/b)*(c/d) with gcd(a,d) and gcd(c,b)
		// divided out keeps intermediate products small
		const std::uint64_t g1 = gcd_u64(uabs(a.num()), static_cast<std::uint64_t>(b.den()));
		const std::uint64_t g2 = gcd_u64(uabs(b.num()), static_cast<std::uint64_t>(a.den()));

		std::int64_t num = 0;
		std::int64_t den = 0;
		if (mul_overflow(a.num() / static_cast<std::int64_t>(g1), b.num() / static_cast<std::int64_t>(g2), &num))
				return ErrorCode::Overflow;
		if (mul_overflow(a.den() / static_cast<std::int64_t>(g2), b.den() / static_cast<std::int64_t>(g1), &den))
				return ErrorCode::Overflow;

		return Rational::make(num, den, out);
}

ErrorCode rational_div(const Rational& a, const Rational& b, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (b.is_zero())
				return ErrorCode::DivisionByZero;

		Rational recip;
		ErrorCode ec = Rational::make(b.den(), b.num(), &recip);
		if (!is_ok(ec))
				return ec;
		return rational_mul(a, recip, out);
}

ErrorCode rational_neg(const Rational& a, Rational* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (a.num() == kI64Min)
				return ErrorCode::Overflow;
		return Rational::make(-a.num(), a.den(), out);
}

int rational_cmp_abs(const Rational& a, const Rational& b) noexcept {
		// compare the continued fraction expansions of |a| and |b|. every round
		// compares integer parts, then flips both fractional parts, which reverses
		// the ordering
		std::uint64_t an = uabs(a.num());
		std::uint64_t ad = static_cast<std::uint64_t>(a.den());
		std::uint64_t bn = uabs(b.num());
		std::uint64_t bd = static_cast<std::uint64_t>(b.den());
		int sign = 1;

		for (;;) {
				const std::uint64_t aq = an / ad;
				const std::uint64_t bq = bn / bd;
				if (aq != bq)
						return aq < bq ? -sign : sign;

				an %= ad;
				bn %= bd;
				if (an == 0 || bn == 0) {
						if (an == bn)
								return 0;
						return an == 0 ? -sign : sign;
				}

				std::swap(an, ad);
				std::swap(bn, bd);
				sign = -sign;
		}
}

} // namespace hill_core
