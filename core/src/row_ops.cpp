#include "hill_core/row_reduction.hpp"

#include "hill_core/writer.hpp"

namespace hill_core {
namespace {
ErrorCode append_row(Writer& w, std::uint8_t row) noexcept {
		ErrorCode ec = w.append("R_{");
		if (!is_ok(ec))
				return ec;
		ec = w.append_index1(row);
		if (!is_ok(ec))
				return ec;
		return w.put('}');
}

ErrorCode append_scalar(Writer& w, const Rational& k) noexcept {
		ErrorCode ec = w.put('(');
		if (!is_ok(ec))
				return ec;
		ec = w.append_rational_latex(k);
		if (!is_ok(ec))
				return ec;
		return w.append(") ");
}
} // namespace

ErrorCode row_op_caption(const RowOp& op, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return ErrorCode::BufferTooSmall;
		out[0] = '\0';

		Writer w{out, cap, 0};
		ErrorCode ec = w.put('$');
		if (!is_ok(ec))
				return ec;
		ec = append_row(w, op.target_row);
		if (!is_ok(ec))
				return ec;

		switch (op.kind) {
		case RowOpKind::Swap:
				ec = w.append(" <-> ");
				if (is_ok(ec))
						ec = append_row(w, op.source_row);
				break;
		case RowOpKind::AddMul:
				ec = w.append(" \\leftarrow ");
				if (is_ok(ec))
						ec = append_row(w, op.target_row);
				if (is_ok(ec))
						ec = w.append(" + ");
				if (is_ok(ec))
						ec = append_scalar(w, op.scalar);
				if (is_ok(ec))
						ec = append_row(w, op.source_row);
				break;
		default:
				return ErrorCode::Internal;
		}
		if (!is_ok(ec))
				return ec;
		return w.put('$');
}

} // namespace hill_core
