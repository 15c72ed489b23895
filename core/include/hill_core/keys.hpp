#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/arena.hpp"
#include "hill_core/error.hpp"
#include "hill_core/matrix.hpp"

namespace hill_core {

enum class KeyPreset : std::uint8_t {
		Invertible, // [[2,1,1],[1,2,0],[0,1,2]], det 7
		Singular,   // [[1,2,3],[2,4,6],[0,1,2]], det 0, row 2 = 2 * row 1
};

// n x n key from row major integers, allocated in arena
Error key_from_ints(InOut Arena& arena, In std::uint8_t n, In const std::int64_t* values, Out MatrixMutView* out) noexcept;

// n x n key from n*n decimal strings (row major). a field that is empty, has
// trailing characters or does not fit int64 gives NotInteger with its row
// and column in err.i, err.j
Error key_parse(InOut Arena& arena, In std::uint8_t n, In const char* const* fields, Out MatrixMutView* out) noexcept;

Error key_preset(InOut Arena& arena, In KeyPreset preset, Out MatrixMutView* out) noexcept;

} // namespace hill_core
