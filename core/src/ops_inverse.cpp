#include "inverse_core/ops.hpp"

#include "inverse_core/debug.hpp"
#include "inverse_core/detail/gauss_jordan.hpp"
#include "inverse_core/latex.hpp"
#include "inverse_core/row_ops.hpp"
#include "inverse_core/row_reduction.hpp"

namespace inverse_core {

Error op_inverse(MatrixView a, InversionResult* out) noexcept {
		if (!out)
				return err_internal();
		*out = InversionResult{};

		WorkingMatrix aug;
		Error err = WorkingMatrix::initialize(a, &aug);
		if (!is_ok(err)) {
				INVERSE_CORE_DBG("[op_inverse] rejected %ux%u input: %s\n", static_cast<unsigned>(a.rows), static_cast<unsigned>(a.cols),
				        error_code_name(err.code));
				return err;
		}

		OpLog log;
		detail::EliminationReport report;
		ErrorCode ec = detail::gauss_jordan(aug, log, &report);
		if (!is_ok(ec)) {
				err.code = ec;
				err.a = a.dim();
				return err;
		}

		if (report.singular) {
				out->outcome = InversionOutcome::Singular;
				out->singular_col = report.singular_col;
				out->log = log.snapshot();
				return err;
		}

		ec = aug.extract_right_half(&out->inverse);
		if (!is_ok(ec)) {
				err.code = ec;
				err.a = a.dim();
				return err;
		}

		out->outcome = InversionOutcome::Inverted;
		out->determinant = report.determinant;
		out->log = log.snapshot();
		return err;
}

Error replay_log(MatrixView a, const OpLog& log, std::size_t count, WorkingMatrix* out) noexcept {
		if (!out)
				return err_internal();
		if (count > log.size())
				return {ErrorCode::StepOutOfRange, a.dim()};

		WorkingMatrix aug;
		Error err = WorkingMatrix::initialize(a, &aug);
		if (!is_ok(err))
				return err;

		for (std::size_t i = 0; i < count; i++) {
				ErrorCode ec = apply_row_op(aug.view(), log[i]);
				if (!is_ok(ec)) {
						err.code = ec;
						err.a = a.dim();
						return err;
				}
		}

		*out = aug;
		return err;
}

std::size_t inverse_step_count(const OpLog& log) noexcept {
		return log.size() + 1;
}

ErrorCode render_inverse_step(MatrixView a, const OpLog& log, std::size_t index, const StepRenderBuffers& out) noexcept {
		if (out.caption && out.caption_cap)
				out.caption[0] = '\0';
		if (out.latex && out.latex_cap)
				out.latex[0] = '\0';

		if (index >= inverse_step_count(log))
				return ErrorCode::StepOutOfRange;

		// steps are rebuilt from [A | I] on demand, the log is the only state kept
		WorkingMatrix aug;
		Error err = replay_log(a, log, index, &aug);
		if (!is_ok(err))
				return err.code;

		if (index > 0 && out.caption) {
				ErrorCode ec = row_op_caption(log[index - 1], out.caption, out.caption_cap);
				if (!is_ok(ec))
						return ec;
		}

		return latex::write_augmented_matrix_display(aug.left(), aug.right(), {out.latex, out.latex_cap});
}

} // namespace inverse_core
