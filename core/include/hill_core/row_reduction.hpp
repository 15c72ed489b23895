#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/config.hpp"
#include "hill_core/error.hpp"
#include "hill_core/matrix.hpp"
#include "hill_core/rational.hpp"

namespace hill_core {

// the two row operations forward elimination needs. pivots are never
// scaled, so there is no scale op
enum class RowOpKind : std::uint8_t {
		Swap,   // R_target <-> R_source
		AddMul, // R_target <- R_target + scalar R_source
};

struct RowOp {
		RowOpKind kind = RowOpKind::Swap;
		std::uint8_t target_row = 0;
		std::uint8_t source_row = 0;
		Rational scalar = Rational::from_int(0);
};

// LaTeX caption with 1 based rows, e.g. "$R_{1} <-> R_{3}$"
ErrorCode row_op_caption(In const RowOp& op, Out char* out, In std::size_t cap) noexcept;

// counts ops as they are applied. elimination stops right after op number
// target (1 based), which is how explanation steps replay a prefix of it
struct OpObserver {
		std::size_t target = static_cast<std::size_t>(-1);
		std::size_t count = 0;
		RowOp last_op{};

		bool on_op(const RowOp& op) noexcept {
				last_op = op;
				return ++count != target;
		}
};

struct RankResult {
		std::uint8_t rank = 0;
		std::uint8_t pivot_cols[kMaxDim]{}; // [0..rank) are valid
		bool stopped = false;               // observer target reached before the end
};

// forward gaussian elimination over the rationals, in place.
//
// pivot rule: the entry of largest absolute value in the remaining part of
// the column (ties keep the upper row). rows below the pivot are cleared with
// AddMul ops
ErrorCode rank_eliminate(InOut MatrixMutView m, InOut OpObserver* obs, Out RankResult* out) noexcept;

} // namespace hill_core
