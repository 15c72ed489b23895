#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/error.hpp"
#include "hill_core/matrix.hpp"
#include "hill_core/rational.hpp"
#include "hill_core/writer.hpp"

// LaTeX fragments for explanation steps. matrices keep their rational
// entries (\frac{p}{q}), block values are plain integers
namespace hill_core::latex {
struct Buffer {
		char* data = nullptr;
		std::size_t cap = 0;
};

// bmatrix for keys and inverses, vmatrix for determinants, pmatrix for blocks
enum class MatrixBrackets : std::uint8_t {
		BMatrix,
		PMatrix,
		VMatrix,
};

ErrorCode append_matrix(InOut Writer& w, In MatrixView m, In MatrixBrackets brackets) noexcept;

// \begin{pmatrix}7 \\ 8\end{pmatrix}
ErrorCode append_block(InOut Writer& w, In const std::uint16_t* values, In std::size_t count) noexcept;

// " \pmod{m}"
ErrorCode append_pmod(InOut Writer& w, In std::int64_t m) noexcept;

// out is overwritten. the display form wraps the matrix in $$ $$
ErrorCode write_matrix(In MatrixView m, In MatrixBrackets brackets, Out Buffer out) noexcept;
ErrorCode write_matrix_display(In MatrixView m, In MatrixBrackets brackets, Out Buffer out) noexcept;
} // namespace hill_core::latex
