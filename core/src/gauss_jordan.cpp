#include "inverse_core/detail/gauss_jordan.hpp"

#include "inverse_core/debug.hpp"
#include "inverse_core/row_reduction.hpp"

#include <cmath>

namespace inverse_core::detail {
namespace {

ErrorCode apply_and_record(MatrixMutView m, OpLog& log, const RowOp& op) noexcept {
		ErrorCode ec = apply_row_op(m, op);
		if (!is_ok(ec))
				return ec;
		ec = log.record(op);
		if (!is_ok(ec))
				return ErrorCode::Internal;
		return ErrorCode::Ok;
}

} // namespace

ErrorCode gauss_jordan(WorkingMatrix& aug, OpLog& log, EliminationReport* report) noexcept {
		if (!report)
				return ErrorCode::Internal;
		const std::uint8_t n = aug.n();
		if (n < kMinDim || n > kMaxDim)
				return ErrorCode::Internal;

		*report = EliminationReport{};
		MatrixMutView m = aug.view();
		double det = 1.0;

		for (std::uint8_t col = 0; col < n; col++) {
				// partial pivoting: largest |entry| on or below the diagonal, lowest row on ties
				std::uint8_t best_row = col;
				double best_abs = std::fabs(m.at(col, col));
				for (std::uint8_t row = static_cast<std::uint8_t>(col + 1); row < n; row++) {
						const double v = std::fabs(m.at(row, col));
						if (v > best_abs) {
								best_row = row;
								best_abs = v;
						}
				}

				// NaN pivots (overflowed elimination) stop here as well
				if (!(best_abs >= kPivotTolerance)) {
						INVERSE_CORE_DBG("[gauss_jordan] singular at column %u, |pivot|=%g\n", static_cast<unsigned>(col), best_abs);
						report->singular = true;
						report->singular_col = col;
						report->determinant = 0.0;
						return ErrorCode::Ok;
				}

				if (best_row != col) {
						INVERSE_CORE_DBG("[gauss_jordan] column %u: pivot row %u\n", static_cast<unsigned>(col), static_cast<unsigned>(best_row));
						ErrorCode ec = apply_and_record(m, log, RowOp::swap(col, best_row));
						if (!is_ok(ec))
								return ec;
						det = -det;
				}

				// scale is logged even when the pivot is already 1
				const double pivot = m.at(col, col);
				det *= pivot;
				ErrorCode ec = apply_and_record(m, log, RowOp::scale(col, 1.0 / pivot));
				if (!is_ok(ec))
						return ec;

				// eliminate this column for all other rows
				for (std::uint8_t row = 0; row < n; row++) {
						if (row == col)
								continue;

						const double entry = m.at(row, col);
						if (std::fabs(entry) < kPivotTolerance)
								continue;

						ec = apply_and_record(m, log, RowOp::add_multiple(row, col, -entry));
						if (!is_ok(ec))
								return ec;
				}
		}

		report->determinant = det;
		return ErrorCode::Ok;
}

} // namespace inverse_core::detail
