#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/error.hpp"
#include "hill_core/rational.hpp"

namespace hill_core {

// appends text to a caller buffer of cap bytes, keeping it NUL terminated.
// a write that does not fit fails with BufferTooSmall; the text written so
// far stays in place
struct Writer {
		char* data = nullptr;
		std::size_t cap = 0;
		std::size_t len = 0;

		ErrorCode put(char ch) noexcept {
				if (!data || len + 1 >= cap)
						return ErrorCode::BufferTooSmall;
				data[len] = ch;
				data[++len] = '\0';
				return ErrorCode::Ok;
		}

		ErrorCode append(const char* s) noexcept {
				if (!s)
						return ErrorCode::Internal;
				ErrorCode ec = ErrorCode::Ok;
				while (*s != '\0' && is_ok(ec))
						ec = put(*s++);
				return ec;
		}

		ErrorCode append_u64(std::uint64_t v) noexcept {
				char digits[20];
				std::size_t n = 0;
				do {
						digits[n++] = static_cast<char>('0' + v % 10u);
						v /= 10u;
				} while (v != 0u);

				ErrorCode ec = ErrorCode::Ok;
				while (n > 0 && is_ok(ec))
						ec = put(digits[--n]);
				return ec;
		}

		ErrorCode append_i64(std::int64_t v) noexcept {
				if (v >= 0)
						return append_u64(static_cast<std::uint64_t>(v));
				ErrorCode ec = put('-');
				if (!is_ok(ec))
						return ec;
				// -(v + 1) + 1 stays in range for INT64_MIN
				return append_u64(static_cast<std::uint64_t>(-(v + 1)) + 1u);
		}

		// row and column numbers are shown 1 based
		ErrorCode append_index1(std::uint8_t v) noexcept { return append_u64(static_cast<std::uint64_t>(v) + 1u); }

		// "7" or "\frac{-1}{3}"
		ErrorCode append_rational_latex(const Rational& r) noexcept {
				if (r.is_integer())
						return append_i64(r.num());
				ErrorCode ec = append("\\frac{");
				if (is_ok(ec))
						ec = append_i64(r.num());
				if (is_ok(ec))
						ec = append("}{");
				if (is_ok(ec))
						ec = append_i64(r.den());
				if (is_ok(ec))
						ec = put('}');
				return ec;
		}

		// "[7 8 25]", blocks in plain text
		ErrorCode append_block(const std::uint16_t* values, std::size_t count) noexcept {
				if (!values && count != 0)
						return ErrorCode::Internal;
				ErrorCode ec = put('[');
				for (std::size_t i = 0; i < count && is_ok(ec); i++) {
						if (i != 0)
								ec = put(' ');
						if (is_ok(ec))
								ec = append_u64(values[i]);
				}
				if (!is_ok(ec))
						return ec;
				return put(']');
		}
};

} // namespace hill_core
