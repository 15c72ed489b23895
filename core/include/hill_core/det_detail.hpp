#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/config.hpp"
#include "hill_core/error.hpp"
#include "hill_core/matrix.hpp"

namespace hill_core::detail {

// dense integer copy of a validated key, row major with stride n
struct IntSquare {
		std::uint8_t n = 0;
		std::int64_t a[kMaxEntries]{};

		std::int64_t at(std::uint8_t r, std::uint8_t c) const noexcept { return a[static_cast<std::size_t>(r) * n + c]; }
		std::int64_t& at_mut(std::uint8_t r, std::uint8_t c) noexcept { return a[static_cast<std::size_t>(r) * n + c]; }
};

// NotInteger if any entry has den != 1
ErrorCode int_square_from(In MatrixView m, Out IntSquare* out) noexcept;

// a with row del_r and column del_c removed (a.n >= 2)
void int_square_minor(In const IntSquare& a, In std::uint8_t del_r, In std::uint8_t del_c, Out IntSquare* out) noexcept;

// exact integer determinant. closed forms for n <= 3 (the six term rule for
// 3x3), laplace expansion along the first row above that
ErrorCode det_exact(In const IntSquare& a, Out std::int64_t* out) noexcept;

// signed cofactor (-1)^(i+j) det(minor(a, i, j)), exact. 1x1 cofactor is 1
ErrorCode cofactor_exact(In const IntSquare& a, In std::uint8_t i, In std::uint8_t j, Out std::int64_t* out) noexcept;

// determinant reduced mod m, result in [0, m). never overflows: entries are
// reduced first and all arithmetic stays mod m
std::int64_t det_mod(In const IntSquare& a, In std::int64_t m) noexcept;

// signed cofactor mod m, result in [0, m)
std::int64_t cofactor_mod(In const IntSquare& a, In std::uint8_t i, In std::uint8_t j, In std::int64_t m) noexcept;

// reduced row echelon form over GF(p) in place, p prime. entries must be
// residues in [0, p). pivot_cols receives out_rank column indices
ErrorCode rref_mod_prime(InOut IntSquare& a, In std::int64_t p, Out std::uint8_t* pivot_cols, Out std::uint8_t* out_rank) noexcept;

// rank over the rationals without rational arithmetic: the largest rank over
// GF(p) across a fixed set of primes near 2^31. exact for any int64 entries,
// their product exceeds the hadamard bound of every minor up to kMaxDim.
// pivot_cols follow the same largest-prefix-rank rule, so they match
// gaussian elimination over the rationals
ErrorCode rank_mod_primes(In const IntSquare& a, Out std::uint8_t* pivot_cols, Out std::uint8_t* out_rank) noexcept;

} // namespace hill_core::detail
