#include "hill_core/latex.hpp"

namespace hill_core::latex {
namespace {

const char* env_name(MatrixBrackets b) noexcept {
		switch (b) {
		case MatrixBrackets::BMatrix:
				return "bmatrix";
		case MatrixBrackets::PMatrix:
				return "pmatrix";
		case MatrixBrackets::VMatrix:
				return "vmatrix";
		}
		return nullptr;
}

// \begin{name} or \end{name}
ErrorCode append_env(Writer& w, const char* keyword, const char* name) noexcept {
		ErrorCode ec = w.put('\\');
		if (!is_ok(ec))
				return ec;
		ec = w.append(keyword);
		if (!is_ok(ec))
				return ec;
		ec = w.put('{');
		if (!is_ok(ec))
				return ec;
		ec = w.append(name);
		if (!is_ok(ec))
				return ec;
		return w.put('}');
}

Writer reset(Buffer out) noexcept {
		Writer w{out.data, out.cap, 0};
		if (w.data && w.cap)
				w.data[0] = '\0';
		return w;
}

} // namespace

ErrorCode append_matrix(Writer& w, MatrixView m, MatrixBrackets brackets) noexcept {
		const char* name = env_name(brackets);
		if (!m.data || !name)
				return ErrorCode::Internal;

		ErrorCode ec = append_env(w, "begin", name);
		for (std::uint8_t r = 0; r < m.rows && is_ok(ec); r++) {
				if (r != 0)
						ec = w.append(" \\\\ ");
				for (std::uint8_t c = 0; c < m.cols && is_ok(ec); c++) {
						if (c != 0)
								ec = w.append(" & ");
						if (is_ok(ec))
								ec = w.append_rational_latex(m.at(r, c));
				}
		}
		if (!is_ok(ec))
				return ec;
		return append_env(w, "end", name);
}

ErrorCode append_block(Writer& w, const std::uint16_t* values, std::size_t count) noexcept {
		if (!values || count == 0)
				return ErrorCode::Internal;

		ErrorCode ec = append_env(w, "begin", "pmatrix");
		for (std::size_t i = 0; i < count && is_ok(ec); i++) {
				if (i != 0)
						ec = w.append(" \\\\ ");
				if (is_ok(ec))
						ec = w.append_u64(values[i]);
		}
		if (!is_ok(ec))
				return ec;
		return append_env(w, "end", "pmatrix");
}

ErrorCode append_pmod(Writer& w, std::int64_t m) noexcept {
		ErrorCode ec = w.append(" \\pmod{");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(m);
		if (!is_ok(ec))
				return ec;
		return w.put('}');
}

ErrorCode write_matrix(MatrixView m, MatrixBrackets brackets, Buffer out) noexcept {
		Writer w = reset(out);
		return append_matrix(w, m, brackets);
}

ErrorCode write_matrix_display(MatrixView m, MatrixBrackets brackets, Buffer out) noexcept {
		Writer w = reset(out);
		ErrorCode ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = append_matrix(w, m, brackets);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

} // namespace hill_core::latex
