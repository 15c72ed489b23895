#include "hill_core/ops.hpp"

#include "hill_core/det_detail.hpp"
#include "hill_core/modular.hpp"

#if HILL_CORE_ENABLE_WITNESS
namespace hill_core {

// p = smallest prime dividing gcd(det mod m, m). K is singular over GF(p), so
// it has a kernel vector v there; K v == p t over the integers, hence
// w = (m / p) v satisfies K w == m t == 0 (mod m), and w != 0 because v has a 1
Error op_collision_witness(MatrixView key, std::int64_t m, std::uint16_t* out) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		Error err = key_check(key, 0);
		if (!is_ok(err))
				return err;
		if (m < 2 || m > kMaxModulus)
				return err_invalid_modulus(m);

		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(key, &k);
		if (!is_ok(ec))
				return err_code(ec);

		const std::int64_t g = gcd_i64(detail::det_mod(k, m), m);
		if (g == 1)
				return err_code(ErrorCode::KeyInvertible);

		const std::int64_t p = smallest_prime_factor(g);
		for (std::size_t i = 0; i < static_cast<std::size_t>(k.n) * k.n; i++)
				k.a[i] = mod_normalize(k.a[i], p);

		std::uint8_t pivot_cols[kMaxDim]{};
		std::uint8_t rank = 0;
		ec = detail::rref_mod_prime(k, p, pivot_cols, &rank);
		if (!is_ok(ec))
				return err_code(ec);
		if (rank >= k.n)
				return err_code(ErrorCode::Internal);

		bool is_pivot[kMaxDim]{};
		for (std::uint8_t r = 0; r < rank; r++)
				is_pivot[pivot_cols[r]] = true;
		std::uint8_t free_col = 0;
		while (is_pivot[free_col])
				free_col++;

		std::int64_t v[kMaxDim]{};
		v[free_col] = 1;
		for (std::uint8_t r = 0; r < rank; r++)
				v[pivot_cols[r]] = mod_normalize(-k.at(r, free_col), p);

		const std::int64_t scale = m / p;
		for (std::uint8_t i = 0; i < k.n; i++)
				out[i] = static_cast<std::uint16_t>(mod_mul(v[i], scale, m));
		return err;
}

} // namespace hill_core
#endif // HILL_CORE_ENABLE_WITNESS
