#include "inverse_shell/app.hpp"

#include "inverse_shell/detail/app_internal.hpp"
#include "inverse_shell/text.hpp"

#include "inverse_core/latex.hpp"
#include "inverse_core/row_ops.hpp"
#include "inverse_core/writer.hpp"

#include <cmath>
#include <cstring>

namespace inverse_shell {
namespace {

using detail::dbg_print_matrix;
using detail::fail_fast;

constexpr int kCellWidth = 12;
// determinants at or above this print like format_number, not %.6f
constexpr double kFixedDeterminantLimit = 1.0e15;

} // namespace

ArgsStatus parse_args(In int argc, In const char* const* argv, Out Options* out, Out const char** bad_arg) noexcept {
		if (!out || !bad_arg)
				fail_fast("parse_args: null output");
		*out = Options{};
		*bad_arg = nullptr;

		for (int i = 1; i < argc; i++) {
				const char* a = argv[i];
				if (std::strcmp(a, "--latex") == 0) {
						out->latex = true;
				} else if (std::strcmp(a, "--steps-latex") == 0) {
						out->steps_latex = true;
				} else if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
						return ArgsStatus::Help;
				} else if (a[0] == '-' && a[1] != '\0') {
						*bad_arg = a;
						return ArgsStatus::UnknownOption;
				} else if (out->path) {
						*bad_arg = a;
						return ArgsStatus::ExtraArgument;
				} else {
						out->path = a;
				}
		}
		return ArgsStatus::Ok;
}

void print_usage(std::FILE* f) noexcept {
		std::fprintf(f, "%s\n%s\n", tr(TextId::Usage), tr(TextId::UsageDetail));
}

int App::run(const Options& opts) noexcept {
		if (!opts.path || std::strcmp(opts.path, "-") == 0)
				return run_stream(opts, stdin);

		std::FILE* in = std::fopen(opts.path, "rb");
		if (!in) {
				SHELL_DBG("[io] fopen failed: %s\n", opts.path);
				std::fprintf(err_, "%s: %s\n", tr(TextId::ErrOpen), opts.path);
				return static_cast<int>(ExitCode::InputError);
		}
		const int rc = run_stream(opts, in);
		std::fclose(in);
		return rc;
}

int App::run_stream(const Options& opts, std::FILE* in) noexcept {
		if (!read_all(in))
				return static_cast<int>(ExitCode::InputError);
		return run_text(opts, text_);
}

bool App::read_all(std::FILE* in) noexcept {
		if (!in)
				fail_fast("read_all: null stream");

		std::size_t len = 0;
		for (;;) {
				const std::size_t room = kMaxInputBytes - len;
				if (room == 0) {
						// one more byte tells a full buffer from an oversized input
						if (std::fgetc(in) != EOF) {
								report_error(tr(TextId::TitleInputError), tr(TextId::ErrTooLarge));
								return false;
						}
						break;
				}
				const std::size_t n = std::fread(text_ + len, 1, room, in);
				len += n;
				if (n == 0)
						break;
		}
		text_[len] = '\0';

		if (std::ferror(in)) {
				report_error(tr(TextId::TitleInputError), tr(TextId::ErrRead));
				return false;
		}
		if (std::memchr(text_, '\0', len) != nullptr) {
				report_error(tr(TextId::TitleInputError), tr(TextId::ErrRead));
				return false;
		}
		SHELL_DBG("[io] read %u bytes\n", (unsigned)len);
		return true;
}

int App::run_text(const Options& opts, const char* text) noexcept {
		result_ = inverse_core::InversionResult{};

		parse_matrix_text(text, &input_);
		if (!input_.ok()) {
				report_input_error();
				return static_cast<int>(ExitCode::InputError);
		}

		const inverse_core::MatrixView a = input_.matrix.view();
		dbg_print_matrix("input", a);

		const inverse_core::Error err = inverse_core::op_inverse(a, &result_);
		if (!inverse_core::is_ok(err)) {
				SHELL_DBG("[calc] op_inverse failed: %s\n", inverse_core::error_code_name(err.code));
				std::fprintf(err_, "%s: %s (%s)\n", tr(TextId::TitleCalcError), tr(TextId::ErrEngine), inverse_core::error_code_name(err.code));
				return static_cast<int>(ExitCode::Internal);
		}

		render_matrix(tr(TextId::HeadInput), a);

		if (result_.inverted()) {
				dbg_print_matrix("inverse", result_.inverse.view());
				render_matrix(tr(TextId::HeadInverse), result_.inverse.view());
		} else {
				SHELL_DBG("[calc] singular at column %u after %u ops\n", (unsigned)result_.singular_col, (unsigned)result_.log.size());
		}

		render_determinant(result_.determinant);
		render_steps(result_.log);

		if (opts.latex && result_.inverted())
				render_latex(a, result_.inverse.view());

		if (opts.steps_latex && !render_steps_latex(a, result_.log))
				return static_cast<int>(ExitCode::Internal);

		if (result_.singular()) {
				report_error(tr(TextId::TitleCalcError), tr(TextId::MsgSingular));
				return static_cast<int>(ExitCode::Singular);
		}

		std::fprintf(out_, "%s\n", tr(TextId::MsgSuccess));
		return static_cast<int>(ExitCode::Ok);
}

void App::render_matrix(const char* title, inverse_core::MatrixView m) noexcept {
		std::fprintf(out_, "%s\n", title);
		for (std::uint8_t r = 0; r < m.rows; r++) {
				for (std::uint8_t c = 0; c < m.cols; c++) {
						const inverse_core::ErrorCode ec = inverse_core::format_number(m.at(r, c), {fmt_buf_, sizeof(fmt_buf_)});
						REQUIRE(inverse_core::is_ok(ec), "format_number overflowed the cell buffer");
						std::fprintf(out_, "%*s", kCellWidth, fmt_buf_);
				}
				std::fputc('\n', out_);
		}
		std::fputc('\n', out_);
}

void App::render_determinant(double det) noexcept {
		inverse_core::ErrorCode ec = inverse_core::ErrorCode::Ok;
		if (std::isfinite(det) && std::fabs(det) < kFixedDeterminantLimit) {
				fmt_buf_[0] = '\0';
				inverse_core::Writer w{fmt_buf_, sizeof(fmt_buf_)};
				ec = w.append_f64(det, 6);
		} else {
				// exponent form from 1e15, nan/inf spelled out
				ec = inverse_core::format_number(det, {fmt_buf_, sizeof(fmt_buf_)});
		}
		REQUIRE(inverse_core::is_ok(ec), "determinant does not fit");
		std::fprintf(out_, "%s: %s\n\n", tr(TextId::HeadDet), fmt_buf_);
}

void App::render_steps(const inverse_core::OpLog& log) noexcept {
		std::fprintf(out_, "%s\n", tr(TextId::HeadSteps));
		if (log.empty()) {
				std::fprintf(out_, "%s\n\n", tr(TextId::NoSteps));
				return;
		}

		std::fprintf(out_, "%4s | %s | %s\n", "#", tr(TextId::ColType), tr(TextId::ColOperation));
		std::size_t idx = 0;
		for (const inverse_core::RowOp& op : log) {
				idx++;
				const inverse_core::ErrorCode ec = inverse_core::row_op_elementary(op, step_elem_, sizeof(step_elem_));
				REQUIRE(inverse_core::is_ok(ec), "elementary notation does not fit");
				std::fprintf(out_,
				        "%4u | %4u | %s   %s\n",
				        static_cast<unsigned>(idx),
				        static_cast<unsigned>(inverse_core::row_op_type(op)),
				        step_elem_,
				        op.description());
		}
		std::fputc('\n', out_);
}

void App::render_latex(inverse_core::MatrixView a, inverse_core::MatrixView inv) noexcept {
		std::fprintf(out_, "%s\n", tr(TextId::HeadLatex));

		inverse_core::ErrorCode ec =
		        inverse_core::latex::write_matrix(a, inverse_core::latex::MatrixBrackets::BMatrix, {step_latex_, sizeof(step_latex_)});
		REQUIRE(inverse_core::is_ok(ec), "latex buffer too small");
		std::fprintf(out_, "A = %s\n", step_latex_);

		ec = inverse_core::latex::write_matrix(inv, inverse_core::latex::MatrixBrackets::BMatrix, {step_latex_, sizeof(step_latex_)});
		REQUIRE(inverse_core::is_ok(ec), "latex buffer too small");
		std::fprintf(out_, "A^{-1} = %s\n\n", step_latex_);
}

bool App::render_steps_latex(inverse_core::MatrixView a, const inverse_core::OpLog& log) noexcept {
		const inverse_core::StepRenderBuffers bufs{step_caption_, sizeof(step_caption_), step_latex_, sizeof(step_latex_)};
		const std::size_t count = inverse_core::inverse_step_count(log);
		for (std::size_t i = 0; i < count; i++) {
				const inverse_core::ErrorCode ec = inverse_core::render_inverse_step(a, log, i, bufs);
				if (!inverse_core::is_ok(ec)) {
						SHELL_DBG("[steps] render step %u failed: %s\n", (unsigned)i, inverse_core::error_code_name(ec));
						std::fprintf(err_, "%s: %s (%s)\n", tr(TextId::TitleCalcError), tr(TextId::ErrEngine), inverse_core::error_code_name(ec));
						return false;
				}
				std::fprintf(out_, "%s %u: %s\n%s\n", tr(TextId::HeadStep), static_cast<unsigned>(i), step_caption_, step_latex_);
		}
		std::fputc('\n', out_);
		return true;
}

void App::report_input_error() noexcept {
		const TextId id = input_status_text(input_.status);
		SHELL_DBG("[input] %s\n", text_key(id));
		const char* msg = tr(id);
		if (input_.status == InputStatus::InvalidValue) {
				std::fprintf(err_,
				        "%s: %s (%u, %u)\n",
				        tr(TextId::TitleInputError),
				        msg,
				        static_cast<unsigned>(input_.row) + 1u,
				        static_cast<unsigned>(input_.col) + 1u);
				return;
		}
		report_error(tr(TextId::TitleInputError), msg);
}

void App::report_error(const char* title, const char* msg) noexcept {
		std::fprintf(err_, "%s: %s\n", title, msg);
}

} // namespace inverse_shell
