#include "hill_core/modular.hpp"

#include "hill_core/detail/checked_int.hpp"

namespace hill_core {

std::int64_t gcd_i64(std::int64_t a, std::int64_t b) noexcept {
		return static_cast<std::int64_t>(detail::gcd_u64(detail::uabs(a), detail::uabs(b)));
}

std::int64_t mod_add(std::int64_t a, std::int64_t b, std::int64_t m) noexcept {
		const auto ua = static_cast<std::uint64_t>(mod_normalize(a, m));
		const auto ub = static_cast<std::uint64_t>(mod_normalize(b, m));
		const auto um = static_cast<std::uint64_t>(m);
		// ua, ub < m < 2^63, so the unsigned sum cannot wrap
		const std::uint64_t s = ua + ub;
		return static_cast<std::int64_t>(s >= um ? s - um : s);
}

std::int64_t mod_mul(std::int64_t a, std::int64_t b, std::int64_t m) noexcept {
		std::int64_t x = mod_normalize(a, m);
		std::int64_t y = mod_normalize(b, m);

		std::int64_t direct = 0;
		if (!detail::mul_overflow(x, y, &direct))
				return direct % m;

		// double-and-add, every partial value stays below m
		std::int64_t acc = 0;
		while (y != 0) {
				if (y & 1)
						acc = mod_add(acc, x, m);
				x = mod_add(x, x, m);
				y >>= 1;
		}
		return acc;
}

Error mod_inverse_scalar(std::int64_t a, std::int64_t m, std::int64_t* out) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		// the t_i alternate in sign and |t_i| <= m up to the final step, so
		// q*t1 and t0 - q*t1 stay within int64 for every m
		if (m < 2)
				return err_invalid_modulus(m);

		// invariant: r_i == t_i * a (mod m)
		std::int64_t r0 = m;
		std::int64_t r1 = mod_normalize(a, m);
		std::int64_t t0 = 0;
		std::int64_t t1 = 1;
		while (r1 != 0) {
				const std::int64_t q = r0 / r1;
				const std::int64_t r2 = r0 - q * r1;
				const std::int64_t t2 = t0 - q * t1;
				r0 = r1;
				r1 = r2;
				t0 = t1;
				t1 = t2;
		}

		if (r0 != 1)
				return err_not_invertible(r0, m);

		*out = mod_normalize(t0, m);
		return {};
}

std::int64_t smallest_prime_factor(std::int64_t n) noexcept {
		if (n % 2 == 0)
				return 2;
		for (std::int64_t d = 3; d <= n / d; d += 2) {
				if (n % d == 0)
						return d;
		}
		return n;
}

} // namespace hill_core
