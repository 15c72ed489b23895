#include "hill_core/error.hpp"

#include "hill_core/text.hpp"
#include "hill_core/writer.hpp"

namespace hill_core {
namespace {

static_assert(static_cast<std::uint16_t>(TextId::ErrInternal) - static_cast<std::uint16_t>(TextId::ErrOk) ==
                      static_cast<std::uint16_t>(ErrorCode::Internal),
        "error text entries must follow ErrorCode order");

ErrorCode append_dim(Writer& w, Dim d) noexcept {
		ErrorCode ec = w.append_u64(d.rows);
		if (!is_ok(ec))
				return ec;
		ec = w.put('x');
		if (!is_ok(ec))
				return ec;
		return w.append_u64(d.cols);
}

} // namespace

const char* error_text(ErrorCode code) noexcept {
		if (static_cast<std::uint8_t>(code) > static_cast<std::uint8_t>(ErrorCode::Internal))
				return tr(TextId::ErrInternal);
		const auto id = static_cast<TextId>(static_cast<std::uint16_t>(TextId::ErrOk) + static_cast<std::uint16_t>(code));
		return tr(id);
}

ErrorCode format_error(const Error& err, char* out, std::size_t cap) noexcept {
		Writer w{out, cap, 0};
		if (w.data && w.cap)
				w.data[0] = '\0';

		ErrorCode ec = ErrorCode::Ok;
		switch (err.code) {
		case ErrorCode::InvalidSymbol:
				if (err.symbol == '\0') {
						ec = w.append("block value out of range at index ");
						if (!is_ok(ec))
								return ec;
						return w.append_u64(err.pos);
				}
				ec = w.append("invalid symbol '");
				if (!is_ok(ec))
						return ec;
				ec = w.put(err.symbol);
				if (!is_ok(ec))
						return ec;
				ec = w.append("' at position ");
				if (!is_ok(ec))
						return ec;
				return w.append_u64(err.pos);
		case ErrorCode::NotInvertible:
				ec = w.append("key is not invertible mod ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(err.modulus);
				if (!is_ok(ec))
						return ec;
				ec = w.append(" (gcd = ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(err.gcd);
				if (!is_ok(ec))
						return ec;
				return w.put(')');
		case ErrorCode::InvalidModulus:
				ec = w.append("invalid modulus ");
				if (!is_ok(ec))
						return ec;
				return w.append_i64(err.modulus);
		case ErrorCode::NotSquare:
		case ErrorCode::InvalidDimension:
				ec = w.append(error_text(err.code));
				if (!is_ok(ec))
						return ec;
				ec = w.append(" (");
				if (!is_ok(ec))
						return ec;
				ec = append_dim(w, err.a);
				if (!is_ok(ec))
						return ec;
				return w.put(')');
		case ErrorCode::DimensionMismatch:
				// block sequences carry their length, never 0 for a mismatch
				if (err.pos != 0) {
						ec = w.append("sequence length ");
						if (!is_ok(ec))
								return ec;
						ec = w.append_u64(err.pos);
						if (!is_ok(ec))
								return ec;
						ec = w.append(" is not a multiple of the block size ");
						if (!is_ok(ec))
								return ec;
						return w.append_u64(err.a.rows);
				}
				ec = w.append("dimension mismatch (");
				if (!is_ok(ec))
						return ec;
				ec = append_dim(w, err.a);
				if (!is_ok(ec))
						return ec;
				ec = w.append(" vs ");
				if (!is_ok(ec))
						return ec;
				ec = append_dim(w, err.b);
				if (!is_ok(ec))
						return ec;
				return w.put(')');
		case ErrorCode::NotInteger:
				ec = w.append("key entry (");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(err.i);
				if (!is_ok(ec))
						return ec;
				ec = w.append(", ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(err.j);
				if (!is_ok(ec))
						return ec;
				return w.append(") is not an integer");
		default:
				return w.append(error_text(err.code));
		}
}

} // namespace hill_core
