#include "hill_core/keys.hpp"

#include "hill_core/detail/debug.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace hill_core {
namespace {

constexpr std::int64_t kInvertibleKey[9] = {2, 1, 1, 1, 2, 0, 0, 1, 2};
constexpr std::int64_t kSingularKey[9] = {1, 2, 3, 2, 4, 6, 0, 1, 2};

bool parse_i64(const char* s, std::int64_t* out) noexcept {
		if (!out || !s || s[0] == '\0')
				return false;

		const char* const end = s + std::strlen(s);
		char* parse_end = nullptr;
		errno = 0;
		const long long v = std::strtoll(s, &parse_end, 10);
		if (errno != 0)
				return false;
		if (parse_end != end)
				return false;
		*out = static_cast<std::int64_t>(v);
		return true;
}

} // namespace

Error key_from_ints(Arena& arena, std::uint8_t n, const std::int64_t* values, MatrixMutView* out) noexcept {
		if (!values || !out)
				return err_code(ErrorCode::Internal);

		MatrixMutView key;
		ErrorCode ec = matrix_alloc(arena, n, n, &key);
		if (!is_ok(ec)) {
				Error err = err_code(ec);
				err.a = Dim{n, n};
				return err;
		}
		for (std::uint8_t row = 0; row < n; row++) {
				for (std::uint8_t col = 0; col < n; col++)
						key.at_mut(row, col) = Rational::from_int(values[static_cast<std::size_t>(row) * n + col]);
		}
		*out = key;
		return {};
}

Error key_parse(Arena& arena, std::uint8_t n, const char* const* fields, MatrixMutView* out) noexcept {
		if (!fields || !out)
				return err_code(ErrorCode::Internal);
		if (n == 0 || n > kMaxDim)
				return err_invalid_dim(Dim{n, n});

		std::int64_t values[kMaxEntries]{};
		const std::size_t count = static_cast<std::size_t>(n) * n;
		for (std::size_t i = 0; i < count; i++) {
				if (!parse_i64(fields[i], &values[i])) {
						HILL_DBG("[hill] key field %u is not an integer\n", static_cast<unsigned>(i));
						return err_not_integer(Dim{n, n}, static_cast<std::uint8_t>(i / n), static_cast<std::uint8_t>(i % n));
				}
		}
		return key_from_ints(arena, n, values, out);
}

Error key_preset(Arena& arena, KeyPreset preset, MatrixMutView* out) noexcept {
		switch (preset) {
		case KeyPreset::Invertible:
				return key_from_ints(arena, 3, kInvertibleKey, out);
		case KeyPreset::Singular:
				return key_from_ints(arena, 3, kSingularKey, out);
		}
		return err_code(ErrorCode::Internal);
}

} // namespace hill_core
