#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/arena.hpp"
#include "hill_core/config.hpp"
#include "hill_core/error.hpp"
#include "hill_core/explanation.hpp"
#include "hill_core/matrix.hpp"
#include "hill_core/rational.hpp"

namespace hill_core {

// indices in these APIs are 0 based (consistent with m.at(r, c))
//
// memory model:
// - matrix data must outlive any Explanation created from it
// - when opts.enable==true, opts.persist must be a valid long lived arena for
//   the explanation context
// - step rendering requires StepRenderBuffers::scratch to be a valid arena, it
//   is cleared by the renderer on each call
//
// every key consuming op runs key_check() first: NotSquare, InvalidDimension
// or NotInteger come back before any arithmetic happens

// exact integer determinant (no floating point, no reduction). Overflow when
// the value does not fit int64
//
// when opts.enable==true, explanation steps are:
//   |K| -> a_{1j} C_{1j} for each j -> det(K)
Error op_det(In MatrixView key, Out std::int64_t* out, Out Explanation* expl, In const ExplainOptions& opts) noexcept;

struct RankInfo {
		std::uint8_t cols = 0;
		std::uint8_t rank = 0;
		std::uint8_t nullity = 0; // cols - rank
		std::uint8_t pivot_cols[kMaxDim]{};
};

// rank over the rationals by gaussian elimination with largest |entry|
// pivoting. accepts any rational matrix, square or not. when the fractions
// overflow int64, square integer matrices fall back to an exact rank over
// several large primes, other matrices fail with Overflow
//
// when opts.enable==true, explanation steps are:
//   A -> after each row op -> rank and nullity
// the fallback has no row ops, only the first and last step
Error op_rank(In MatrixView a, InOut Arena& scratch, Out RankInfo* out, Out Explanation* expl, In const ExplainOptions& opts) noexcept;

// cols - rank
Error op_nullity(In MatrixView a, InOut Arena& scratch, Out std::uint8_t* out) noexcept;

struct KeyResidue {
		std::int64_t modulus = 0;
		std::int64_t det_mod = 0; // det(K) mod m in [0, m)
		std::int64_t gcd = 0;     // gcd(det_mod, m)
		bool valid = false;       // gcd == 1
};

// the cipher's invertibility predicate: gcd(det(K) mod m, m) == 1.
// computed entirely mod m, so it is defined even when det(K) overflows int64.
// InvalidModulus when m < 2
Error op_key_residue(In MatrixView key, In std::int64_t m, Out KeyResidue* out) noexcept;
Error op_key_valid(In MatrixView key, In std::int64_t m, Out bool* out) noexcept;

// K^{-1} mod m = det^{-1} * adj(K) mod m, entries in [0, m).
// NotInvertible (with gcd and modulus set) when the key fails op_key_valid
//
// when opts.enable==true, explanation steps are:
//   K -> det(K) -> det mod m, gcd -> det^{-1} -> adj(K) mod m -> K^{-1} mod m
Error op_mod_inverse_matrix(
        In MatrixView key, In std::int64_t m, Out MatrixMutView out, Out Explanation* expl, In const ExplainOptions& opts) noexcept;

// nonzero w in Z_m^n with K w == 0 (mod m), for keys that fail op_key_valid.
// for every plaintext block x, x and x + w encrypt to the same block.
//
// writes key.rows values in [0, m) to out.
// KeyInvertible when the key is valid (no such w exists),
// InvalidModulus unless 2 <= m <= kMaxModulus
Error op_collision_witness(In MatrixView key, In std::int64_t m, Out std::uint16_t* out) noexcept;

} // namespace hill_core
