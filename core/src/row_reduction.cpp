#include "hill_core/row_reduction.hpp"

#include <utility>

namespace hill_core {
namespace {

// row index of the largest |entry| in column col at or below row from,
// false when the remaining column is all zero
bool find_pivot(MatrixView m, std::uint8_t from, std::uint8_t col, std::uint8_t* out) noexcept {
		bool found = false;
		for (std::uint8_t row = from; row < m.rows; row++) {
				const Rational& v = m.at(row, col);
				if (v.is_zero())
						continue;
				if (!found || rational_cmp_abs(v, m.at(*out, col)) > 0) {
						*out = row;
						found = true;
				}
		}
		return found;
}

// R_dst <- R_dst + k R_src
ErrorCode add_multiple(MatrixMutView m, std::uint8_t dst, std::uint8_t src, const Rational& k) noexcept {
		for (std::uint8_t col = 0; col < m.cols; col++) {
				Rational term;
				ErrorCode ec = rational_mul(m.at(src, col), k, &term);
				if (!is_ok(ec))
						return ec;
				Rational sum;
				ec = rational_add(m.at(dst, col), term, &sum);
				if (!is_ok(ec))
						return ec;
				m.at_mut(dst, col) = sum;
		}
		return ErrorCode::Ok;
}

// reports op to the observer, false once its target is reached
bool notify(OpObserver* obs, RowOpKind kind, std::uint8_t target, std::uint8_t source, const Rational& scalar) noexcept {
		if (!obs)
				return true;
		RowOp op;
		op.kind = kind;
		op.target_row = target;
		op.source_row = source;
		op.scalar = scalar;
		return obs->on_op(op);
}

} // namespace

ErrorCode rank_eliminate(MatrixMutView m, OpObserver* obs, RankResult* out) noexcept {
		if (!out || !m.data)
				return ErrorCode::Internal;
		if (m.rows > kMaxDim || m.cols > kMaxDim)
				return ErrorCode::InvalidDimension;

		RankResult res{};
		const Rational zero = Rational::from_int(0);
		for (std::uint8_t col = 0; col < m.cols && res.rank < m.rows; col++) {
				const std::uint8_t top = res.rank;
				std::uint8_t best = top;
				if (!find_pivot(m.view(), top, col, &best))
						continue;

				if (best != top) {
						for (std::uint8_t c = 0; c < m.cols; c++)
								std::swap(m.at_mut(top, c), m.at_mut(best, c));
						if (!notify(obs, RowOpKind::Swap, top, best, zero)) {
								res.stopped = true;
								break;
						}
				}

				for (std::uint8_t row = static_cast<std::uint8_t>(top + 1); row < m.rows && !res.stopped; row++) {
						if (m.at(row, col).is_zero())
								continue;

						// factor = -(entry / pivot)
						Rational ratio;
						ErrorCode ec = rational_div(m.at(row, col), m.at(top, col), &ratio);
						if (!is_ok(ec))
								return ec;
						Rational factor;
						ec = rational_neg(ratio, &factor);
						if (!is_ok(ec))
								return ec;
						ec = add_multiple(m, row, top, factor);
						if (!is_ok(ec))
								return ec;
						res.stopped = !notify(obs, RowOpKind::AddMul, row, top, factor);
				}
				if (res.stopped)
						break;

				res.pivot_cols[res.rank++] = col;
		}

		*out = res;
		return ErrorCode::Ok;
}

} // namespace hill_core
