#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "inverse_core/error.hpp"
#include "inverse_core/matrix.hpp"
#include "inverse_core/op_log.hpp"
#include "inverse_core/ops.hpp"

#include "inverse_shell/config.hpp"
#include "inverse_shell/input.hpp"

namespace inverse_shell {

enum class ExitCode : int {
		Ok = 0,
		Singular = 1,
		InputError = 2,
		Internal = 3,
};

struct Options {
		bool latex = false;       // --latex: A and its inverse as bmatrix
		bool steps_latex = false; // --steps-latex: every augmented step
		const char* path = nullptr; // nullptr or "-" reads stdin
};

enum class ArgsStatus : std::uint8_t {
		Ok,
		Help,
		UnknownOption,
		ExtraArgument,
};

// *bad_arg names the offending argument when the status is not Ok/Help
ArgsStatus parse_args(In int argc, In const char* const* argv, Out Options* out, Out const char** bad_arg) noexcept;
void print_usage(std::FILE* f) noexcept;

class App {
	  public:
		App(std::FILE* out, std::FILE* err) noexcept : out_(out), err_(err) {}

		int run(const Options& opts) noexcept;
		int run_stream(const Options& opts, std::FILE* in) noexcept;
		int run_text(const Options& opts, const char* text) noexcept;

		const inverse_core::InversionResult& result() const noexcept { return result_; }

	  private:
		std::FILE* out_ = nullptr;
		std::FILE* err_ = nullptr;

		ParsedInput input_{};
		inverse_core::InversionResult result_{};

		char text_[kMaxInputBytes + 1]{};
		char fmt_buf_[64]{};
		char step_elem_[64]{};
		char step_caption_[128]{};
		char step_latex_[8192]{};

		[[nodiscard]] bool read_all(std::FILE* in) noexcept;

		void render_matrix(const char* title, inverse_core::MatrixView m) noexcept;
		void render_determinant(double det) noexcept;
		void render_steps(const inverse_core::OpLog& log) noexcept;
		void render_latex(inverse_core::MatrixView a, inverse_core::MatrixView inv) noexcept;
		[[nodiscard]] bool render_steps_latex(inverse_core::MatrixView a, const inverse_core::OpLog& log) noexcept;

		void report_input_error() noexcept;
		void report_error(const char* title, const char* msg) noexcept;
};

} // namespace inverse_shell
