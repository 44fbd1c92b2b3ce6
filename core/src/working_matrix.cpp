#include "inverse_core/working_matrix.hpp"

#include <cmath>

namespace inverse_core {

Error WorkingMatrix::initialize(MatrixView a, WorkingMatrix* out) noexcept {
		if (!out || !a.data)
				return err_internal();
		if (a.rows != a.cols || a.rows < kMinDim || a.rows > kMaxDim)
				return err_invalid_dim(a.dim());

		for (std::uint8_t row = 0; row < a.rows; row++) {
				for (std::uint8_t col = 0; col < a.cols; col++) {
						if (!std::isfinite(a.at(row, col)))
								return err_invalid_value(a.dim(), row, col);
				}
		}

		Error err;
		ErrorCode ec = matrix_from_view(a, &out->input_);
		if (!is_ok(ec)) {
				err.code = ec;
				err.a = a.dim();
				return err;
		}

		const std::uint8_t n = a.rows;
		out->n_ = n;
		for (std::size_t i = 0; i < kMaxAugEntries; i++)
				out->data_[i] = 0.0;

		MatrixMutView aug = out->view();
		for (std::uint8_t row = 0; row < n; row++) {
				for (std::uint8_t col = 0; col < n; col++)
						aug.at_mut(row, col) = a.at(row, col);
				aug.at_mut(row, static_cast<std::uint8_t>(n + row)) = 1.0;
		}
		return err;
}

Error WorkingMatrix::get(std::uint8_t row, std::uint8_t col, double* out) const noexcept {
		if (!out)
				return err_internal();
		const Dim dim{n_, cols()};
		if (row >= dim.rows || col >= dim.cols)
				return err_index_out_of_range(dim, row, col);
		*out = at(row, col);
		return {};
}

Error WorkingMatrix::set(std::uint8_t row, std::uint8_t col, double value) noexcept {
		const Dim dim{n_, cols()};
		if (row >= dim.rows || col >= dim.cols)
				return err_index_out_of_range(dim, row, col);
		if (!std::isfinite(value))
				return err_invalid_value(dim, row, col);
		view().at_mut(row, col) = value;
		return {};
}

ErrorCode WorkingMatrix::extract_right_half(Matrix* out) const noexcept {
		if (!out)
				return ErrorCode::Internal;
		ErrorCode ec = matrix_init(n_, n_, out);
		if (!is_ok(ec))
				return ec;
		return matrix_copy(right(), out->mut_view());
}

} // namespace inverse_core
