#include "inverse_core/matrix.hpp"

#include <cmath>

namespace inverse_core {
namespace {
constexpr bool valid_dim(std::uint8_t rows, std::uint8_t cols) noexcept {
		return rows >= 1 && rows <= kMaxDim && cols >= 1 && cols <= kMaxDim;
}
} // namespace

ErrorCode matrix_init(std::uint8_t rows, std::uint8_t cols, Matrix* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (!valid_dim(rows, cols))
				return ErrorCode::InvalidDimension;

		out->rows = rows;
		out->cols = cols;
		for (std::size_t i = 0; i < kMaxEntries; i++)
				out->data[i] = 0.0;
		return ErrorCode::Ok;
}

ErrorCode matrix_from_view(MatrixView src, Matrix* out) noexcept {
		if (!out || !src.data)
				return ErrorCode::Internal;
		ErrorCode ec = matrix_init(src.rows, src.cols, out);
		if (!is_ok(ec))
				return ec;
		return matrix_copy(src, out->mut_view());
}

ErrorCode matrix_copy(MatrixView src, MatrixMutView dst) noexcept {
		if (!src.data || !dst.data)
				return ErrorCode::Internal;
		if (src.rows != dst.rows || src.cols != dst.cols)
				return ErrorCode::DimensionMismatch;

		for (std::uint8_t row = 0; row < src.rows; row++) {
				for (std::uint8_t col = 0; col < src.cols; col++)
						dst.at_mut(row, col) = src.at(row, col);
		}
		return ErrorCode::Ok;
}

void matrix_fill_zero(MatrixMutView m) noexcept {
		if (!m.data)
				return;
		for (std::uint8_t row = 0; row < m.rows; row++) {
				for (std::uint8_t col = 0; col < m.cols; col++)
						m.at_mut(row, col) = 0.0;
		}
}

ErrorCode matrix_set_identity(MatrixMutView m) noexcept {
		if (!m.data)
				return ErrorCode::Internal;
		if (m.rows != m.cols)
				return ErrorCode::InvalidDimension;

		matrix_fill_zero(m);
		for (std::uint8_t i = 0; i < m.rows; i++)
				m.at_mut(i, i) = 1.0;
		return ErrorCode::Ok;
}

ErrorCode matrix_mul(MatrixView a, MatrixView b, MatrixMutView out) noexcept {
		if (!a.data || !b.data || !out.data)
				return ErrorCode::Internal;
		if (a.cols != b.rows)
				return ErrorCode::DimensionMismatch;
		if (out.rows != a.rows || out.cols != b.cols)
				return ErrorCode::DimensionMismatch;

		for (std::uint8_t i = 0; i < out.rows; i++) {
				for (std::uint8_t j = 0; j < out.cols; j++) {
						double sum = 0.0;
						for (std::uint8_t k = 0; k < a.cols; k++)
								sum += a.at(i, k) * b.at(k, j);
						out.at_mut(i, j) = sum;
				}
		}
		return ErrorCode::Ok;
}

ErrorCode matrix_max_abs_diff(MatrixView a, MatrixView b, double* out) noexcept {
		if (!out || !a.data || !b.data)
				return ErrorCode::Internal;
		if (a.rows != b.rows || a.cols != b.cols)
				return ErrorCode::DimensionMismatch;

		double worst = 0.0;
		for (std::uint8_t row = 0; row < a.rows; row++) {
				for (std::uint8_t col = 0; col < a.cols; col++) {
						const double d = std::fabs(a.at(row, col) - b.at(row, col));
						// a nan difference is reported, never skipped
						if (!(d <= worst))
								worst = d;
				}
		}
		*out = worst;
		return ErrorCode::Ok;
}

} // namespace inverse_core
