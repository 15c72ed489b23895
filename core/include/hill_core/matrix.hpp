#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "hill_core/arena.hpp"
#include "hill_core/config.hpp"
#include "hill_core/error.hpp"
#include "hill_core/rational.hpp"

namespace hill_core {

// row major window over Rational entries. keys are n x n with integer
// entries; elimination and inverse work matrices may hold fractions
struct MatrixView {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
		std::uint8_t stride = 0;
		const Rational* data = nullptr;

		constexpr Dim dim() const noexcept { return {rows, cols}; }
		constexpr bool square() const noexcept { return rows == cols; }
		constexpr std::size_t offset(std::uint8_t r, std::uint8_t c) const noexcept {
				return static_cast<std::size_t>(r) * stride + c;
		}

		const Rational& at(std::uint8_t r, std::uint8_t c) const noexcept {
				assert(data && r < rows && c < cols);
				return data[offset(r, c)];
		}
};

struct MatrixMutView {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
		std::uint8_t stride = 0;
		Rational* data = nullptr;

		MatrixView view() const noexcept { return {rows, cols, stride, data}; }
		constexpr Dim dim() const noexcept { return {rows, cols}; }

		const Rational& at(std::uint8_t r, std::uint8_t c) const noexcept { return view().at(r, c); }

		Rational& at_mut(std::uint8_t r, std::uint8_t c) noexcept {
				assert(data && r < rows && c < cols);
				return data[view().offset(r, c)];
		}
};

constexpr bool same_shape(MatrixView a, MatrixView b) noexcept {
		return a.rows == b.rows && a.cols == b.cols;
}

// rows, cols in [1, kMaxDim]; entries start at zero. Overflow when the arena
// is exhausted
ErrorCode matrix_alloc(InOut Arena& arena, In std::uint8_t rows, In std::uint8_t cols, Out MatrixMutView* out) noexcept;

// fresh copy of src in arena, used as the work matrix of an elimination
ErrorCode matrix_clone(InOut Arena& arena, In MatrixView src, Out MatrixMutView* out) noexcept;

// shape and entry checks shared by every key consuming operation:
// square, n in [1, kMaxDim], every entry an integer.
// expected_n == 0 accepts any n
Error key_check(In MatrixView key, In std::uint8_t expected_n) noexcept;

} // namespace hill_core
