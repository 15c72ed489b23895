#include "hill_core/det_detail.hpp"

#include "hill_core/detail/checked_int.hpp"
#include "hill_core/modular.hpp"

namespace hill_core::detail {
namespace {

// 13 primes, product above 2^402 > (sqrt(6) 2^63)^6
constexpr std::int64_t kRankPrimes[] = {
        2147483647,
        2147483629,
        2147483587,
        2147483579,
        2147483563,
        2147483549,
        2147483543,
        2147483497,
        2147483489,
        2147483477,
        2147483423,
        2147483399,
        2147483353,
};

// x*y - z*w, checked
ErrorCode cross(std::int64_t x, std::int64_t y, std::int64_t z, std::int64_t w, std::int64_t* out) noexcept {
		std::int64_t p = 0;
		std::int64_t q = 0;
		if (mul_overflow(x, y, &p) || mul_overflow(z, w, &q))
				return ErrorCode::Overflow;
		if (sub_overflow(p, q, out))
				return ErrorCode::Overflow;
		return ErrorCode::Ok;
}

ErrorCode det3(const IntSquare& m, std::int64_t* out) noexcept {
		// a(ei - fh) - b(di - fg) + c(dh - eg)
		const std::int64_t a = m.at(0, 0), b = m.at(0, 1), c = m.at(0, 2);
		const std::int64_t d = m.at(1, 0), e = m.at(1, 1), f = m.at(1, 2);
		const std::int64_t g = m.at(2, 0), h = m.at(2, 1), i = m.at(2, 2);

		std::int64_t m0 = 0, m1 = 0, m2 = 0;
		if (!is_ok(cross(e, i, f, h, &m0)) || !is_ok(cross(d, i, f, g, &m1)) || !is_ok(cross(d, h, e, g, &m2)))
				return ErrorCode::Overflow;

		std::int64_t t0 = 0, t1 = 0, t2 = 0;
		if (mul_overflow(a, m0, &t0) || mul_overflow(b, m1, &t1) || mul_overflow(c, m2, &t2))
				return ErrorCode::Overflow;

		std::int64_t acc = 0;
		if (sub_overflow(t0, t1, &acc) || add_overflow(acc, t2, &acc))
				return ErrorCode::Overflow;
		*out = acc;
		return ErrorCode::Ok;
}

} // namespace

ErrorCode int_square_from(MatrixView m, IntSquare* out) noexcept {
		if (!out || !m.data)
				return ErrorCode::Internal;
		if (!m.square())
				return ErrorCode::NotSquare;
		if (m.rows == 0 || m.rows > kMaxDim)
				return ErrorCode::InvalidDimension;

		out->n = m.rows;
		for (std::uint8_t r = 0; r < m.rows; r++) {
				for (std::uint8_t c = 0; c < m.cols; c++) {
						const Rational& v = m.at(r, c);
						if (!v.is_integer())
								return ErrorCode::NotInteger;
						out->at_mut(r, c) = v.num();
				}
		}
		return ErrorCode::Ok;
}

void int_square_minor(const IntSquare& a, std::uint8_t del_r, std::uint8_t del_c, IntSquare* out) noexcept {
		out->n = static_cast<std::uint8_t>(a.n - 1);
		std::uint8_t dst_r = 0;
		for (std::uint8_t r = 0; r < a.n; r++) {
				if (r == del_r)
						continue;
				std::uint8_t dst_c = 0;
				for (std::uint8_t c = 0; c < a.n; c++) {
						if (c == del_c)
								continue;
						out->at_mut(dst_r, dst_c) = a.at(r, c);
						dst_c++;
				}
				dst_r++;
		}
}

ErrorCode det_exact(const IntSquare& a, std::int64_t* out) noexcept {
		if (!out)
				return ErrorCode::Internal;

		switch (a.n) {
		case 0:
				return ErrorCode::InvalidDimension;
		case 1:
				*out = a.at(0, 0);
				return ErrorCode::Ok;
		case 2:
				return cross(a.at(0, 0), a.at(1, 1), a.at(0, 1), a.at(1, 0), out);
		case 3:
				return det3(a, out);
		default:
				break;
		}

		std::int64_t acc = 0;
		for (std::uint8_t j = 0; j < a.n; j++) {
				if (a.at(0, j) == 0)
						continue;
				std::int64_t cof = 0;
				ErrorCode ec = cofactor_exact(a, 0, j, &cof);
				if (!is_ok(ec))
						return ec;
				std::int64_t term = 0;
				if (mul_overflow(a.at(0, j), cof, &term) || add_overflow(acc, term, &acc))
						return ErrorCode::Overflow;
		}
		*out = acc;
		return ErrorCode::Ok;
}

ErrorCode cofactor_exact(const IntSquare& a, std::uint8_t i, std::uint8_t j, std::int64_t* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (i >= a.n || j >= a.n)
				return ErrorCode::IndexOutOfRange;
		if (a.n == 1) {
				*out = 1;
				return ErrorCode::Ok;
		}

		IntSquare minor;
		int_square_minor(a, i, j, &minor);
		std::int64_t det = 0;
		ErrorCode ec = det_exact(minor, &det);
		if (!is_ok(ec))
				return ec;

		if (((i + j) & 1u) != 0) {
				std::int64_t neg = 0;
				if (sub_overflow(std::int64_t{0}, det, &neg))
						return ErrorCode::Overflow;
				det = neg;
		}
		*out = det;
		return ErrorCode::Ok;
}

std::int64_t det_mod(const IntSquare& a, std::int64_t m) noexcept {
		if (a.n == 1)
				return mod_normalize(a.at(0, 0), m);

		std::int64_t acc = 0;
		for (std::uint8_t j = 0; j < a.n; j++) {
				const std::int64_t entry = mod_normalize(a.at(0, j), m);
				if (entry == 0)
						continue;
				acc = mod_add(acc, mod_mul(entry, cofactor_mod(a, 0, j, m), m), m);
		}
		return acc;
}

std::int64_t cofactor_mod(const IntSquare& a, std::uint8_t i, std::uint8_t j, std::int64_t m) noexcept {
		if (a.n == 1)
				return mod_normalize(1, m);

		IntSquare minor;
		int_square_minor(a, i, j, &minor);
		const std::int64_t d = det_mod(minor, m);
		if (((i + j) & 1u) != 0)
				return mod_normalize(-d, m);
		return d;
}

ErrorCode rref_mod_prime(IntSquare& a, std::int64_t p, std::uint8_t* pivot_cols, std::uint8_t* out_rank) noexcept {
		if (!pivot_cols || !out_rank)
				return ErrorCode::Internal;
		const std::uint8_t n = a.n;
		std::uint8_t rank = 0;
		for (std::uint8_t col = 0; col < n && rank < n; col++) {
				std::uint8_t pivot_row = n;
				for (std::uint8_t row = rank; row < n; row++) {
						if (a.at(row, col) != 0) {
								pivot_row = row;
								break;
						}
				}
				if (pivot_row == n)
						continue;

				if (pivot_row != rank) {
						for (std::uint8_t c = 0; c < n; c++) {
								const std::int64_t t = a.at(rank, c);
								a.at_mut(rank, c) = a.at(pivot_row, c);
								a.at_mut(pivot_row, c) = t;
						}
				}

				// p is prime, every nonzero residue is a unit
				std::int64_t inv = 0;
				Error err = mod_inverse_scalar(a.at(rank, col), p, &inv);
				if (!is_ok(err))
						return err.code;
				for (std::uint8_t c = 0; c < n; c++)
						a.at_mut(rank, c) = mod_mul(a.at(rank, c), inv, p);

				for (std::uint8_t row = 0; row < n; row++) {
						if (row == rank)
								continue;
						const std::int64_t f = a.at(row, col);
						if (f == 0)
								continue;
						for (std::uint8_t c = 0; c < n; c++)
								a.at_mut(row, c) = mod_add(a.at(row, c), -mod_mul(f, a.at(rank, c), p), p);
				}

				pivot_cols[rank] = col;
				rank++;
		}
		*out_rank = rank;
		return ErrorCode::Ok;
}

ErrorCode rank_mod_primes(const IntSquare& a, std::uint8_t* pivot_cols, std::uint8_t* out_rank) noexcept {
		if (!pivot_cols || !out_rank)
				return ErrorCode::Internal;

		// best[c]: largest rank of columns 0..c seen over any prime
		std::uint8_t best[kMaxDim]{};
		for (const std::int64_t p : kRankPrimes) {
				IntSquare r = a;
				for (std::size_t i = 0; i < static_cast<std::size_t>(a.n) * a.n; i++)
						r.a[i] = mod_normalize(r.a[i], p);

				std::uint8_t cols[kMaxDim]{};
				std::uint8_t rank = 0;
				ErrorCode ec = rref_mod_prime(r, p, cols, &rank);
				if (!is_ok(ec))
						return ec;

				std::uint8_t seen = 0;
				for (std::uint8_t c = 0; c < a.n; c++) {
						if (seen < rank && cols[seen] == c)
								seen++;
						if (seen > best[c])
								best[c] = seen;
				}
		}

		std::uint8_t rank = 0;
		for (std::uint8_t c = 0; c < a.n; c++) {
				if (best[c] > rank)
						pivot_cols[rank++] = c;
		}
		*out_rank = rank;
		return ErrorCode::Ok;
}

} // namespace hill_core::detail
