#pragma once

#include <cstddef>
#include <cstdint>

// parameter direction annotations
#define In
#define Out
#define InOut

namespace hill_core {
struct Dim {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
};

enum class ErrorCode : std::uint8_t {
		Ok = 0,
		FeatureDisabled,
		InvalidDimension,
		DimensionMismatch,
		NotSquare,
		NotInteger,
		InvalidModulus,
		InvalidConfig,
		InvalidSymbol,
		NotInvertible,
		KeyInvertible,
		DivisionByZero,
		Overflow,
		BufferTooSmall,
		IndexOutOfRange,
		StepOutOfRange,
		Internal,
};

// a, b: operand dimensions for shape errors
// i, j: entry index for NotInteger
// pos, symbol: message position and offending character for InvalidSymbol,
//   symbol '\0' when a block value is out of range (pos is then its index)
//   pos: sequence length for a DimensionMismatch on block sequences
// gcd, modulus: for NotInvertible, gcd(det mod m, m) and m
struct Error {
		ErrorCode code = ErrorCode::Ok;
		Dim a{};
		Dim b{};
		std::uint8_t i = 0;
		std::uint8_t j = 0;
		std::uint16_t pos = 0;
		char symbol = '\0';
		std::int64_t gcd = 0;
		std::int64_t modulus = 0;
};

constexpr bool is_ok(ErrorCode code) noexcept {
		return code == ErrorCode::Ok;
}
constexpr bool is_ok(const Error& err) noexcept {
		return is_ok(err.code);
}

// shape failures grouped as one dimension error
constexpr bool is_dimension_error(ErrorCode code) noexcept {
		return code == ErrorCode::NotSquare || code == ErrorCode::DimensionMismatch || code == ErrorCode::InvalidDimension;
}

constexpr Error err_code(ErrorCode code) noexcept {
		Error e;
		e.code = code;
		return e;
}
constexpr Error err_dim_mismatch(Dim a, Dim b) noexcept {
		Error e;
		e.code = ErrorCode::DimensionMismatch;
		e.a = a;
		e.b = b;
		return e;
}
constexpr Error err_length_mismatch(std::uint16_t len, std::uint8_t n) noexcept {
		Error e;
		e.code = ErrorCode::DimensionMismatch;
		e.a = Dim{n, n};
		e.pos = len;
		return e;
}
constexpr Error err_not_square(Dim a) noexcept {
		Error e;
		e.code = ErrorCode::NotSquare;
		e.a = a;
		return e;
}
constexpr Error err_invalid_dim(Dim a) noexcept {
		Error e;
		e.code = ErrorCode::InvalidDimension;
		e.a = a;
		return e;
}
constexpr Error err_not_integer(Dim a, std::uint8_t i, std::uint8_t j) noexcept {
		Error e;
		e.code = ErrorCode::NotInteger;
		e.a = a;
		e.i = i;
		e.j = j;
		return e;
}
constexpr Error err_invalid_modulus(std::int64_t m) noexcept {
		Error e;
		e.code = ErrorCode::InvalidModulus;
		e.modulus = m;
		return e;
}
constexpr Error err_invalid_symbol(std::uint16_t pos, char symbol) noexcept {
		Error e;
		e.code = ErrorCode::InvalidSymbol;
		e.pos = pos;
		e.symbol = symbol;
		return e;
}
constexpr Error err_value_out_of_range(std::uint16_t index) noexcept {
		return err_invalid_symbol(index, '\0');
}
constexpr Error err_not_invertible(std::int64_t gcd, std::int64_t m) noexcept {
		Error e;
		e.code = ErrorCode::NotInvertible;
		e.gcd = gcd;
		e.modulus = m;
		return e;
}
constexpr Error err_overflow() noexcept {
		return err_code(ErrorCode::Overflow);
}
constexpr Error err_feature_disabled() noexcept {
		return err_code(ErrorCode::FeatureDisabled);
}

// short fixed description of a code, never null
const char* error_text(In ErrorCode code) noexcept;

// full description of an error including its payload, e.g.
//   "invalid symbol '#' at position 3"
//   "key is not invertible mod 26 (gcd = 2)"
ErrorCode format_error(In const Error& err, Out char* out, In std::size_t cap) noexcept;
} // namespace hill_core
