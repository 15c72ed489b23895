#include "hill_core/matrix.hpp"

namespace hill_core {
namespace {
constexpr bool dim_in_range(std::uint8_t v) noexcept {
		return v >= 1 && v <= kMaxDim;
}
} // namespace

ErrorCode matrix_alloc(Arena& arena, std::uint8_t rows, std::uint8_t cols, MatrixMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (!dim_in_range(rows) || !dim_in_range(cols))
				return ErrorCode::InvalidDimension;

		const std::size_t count = static_cast<std::size_t>(rows) * cols;
		auto* data = static_cast<Rational*>(arena.allocate(sizeof(Rational) * count, alignof(Rational)));
		if (!data)
				return ErrorCode::Overflow;
		for (std::size_t i = 0; i < count; i++)
				data[i] = Rational::from_int(0);

		*out = MatrixMutView{rows, cols, cols, data};
		return ErrorCode::Ok;
}

ErrorCode matrix_clone(Arena& arena, MatrixView src, MatrixMutView* out) noexcept {
		if (!out || !src.data)
				return ErrorCode::Internal;

		MatrixMutView work;
		ErrorCode ec = matrix_alloc(arena, src.rows, src.cols, &work);
		if (!is_ok(ec))
				return ec;
		for (std::uint8_t r = 0; r < src.rows; r++) {
				for (std::uint8_t c = 0; c < src.cols; c++)
						work.at_mut(r, c) = src.at(r, c);
		}
		*out = work;
		return ErrorCode::Ok;
}

Error key_check(MatrixView key, std::uint8_t expected_n) noexcept {
		if (!key.data)
				return err_code(ErrorCode::Internal);
		if (!key.square())
				return err_not_square(key.dim());
		if (!dim_in_range(key.rows))
				return err_invalid_dim(key.dim());
		if (expected_n != 0 && key.rows != expected_n)
				return err_dim_mismatch(key.dim(), Dim{expected_n, expected_n});

		// first fractional entry in row major order
		for (std::uint8_t r = 0; r < key.rows; r++) {
				for (std::uint8_t c = 0; c < key.cols; c++) {
						if (!key.at(r, c).is_integer())
								return err_not_integer(key.dim(), r, c);
				}
		}
		return {};
}

} // namespace hill_core
