#include "inverse_core/latex.hpp"
#include "inverse_core/writer.hpp"

#include <cstdint>

namespace inverse_core::latex {
namespace {

struct Environment {
		const char* open = nullptr;
		const char* close = nullptr;
};

Environment environment_for(MatrixBrackets b) noexcept {
		switch (b) {
		case MatrixBrackets::BMatrix:
				return {"\\begin{bmatrix}", "\\end{bmatrix}"};
		case MatrixBrackets::PMatrix:
				return {"\\begin{pmatrix}", "\\end{pmatrix}"};
		case MatrixBrackets::VMatrix:
				return {"\\begin{vmatrix}", "\\end{vmatrix}"};
		}
		return {};
}

// entries of [left | right] row by row; right.cols == 0 writes left alone
ErrorCode write_rows(MatrixView left, MatrixView right, Writer& w) noexcept {
		const std::uint8_t total_cols = static_cast<std::uint8_t>(left.cols + right.cols);
		for (std::uint8_t row = 0; row < left.rows; row++) {
				if (row != 0) {
						ErrorCode ec = w.append(" \\\\ ");
						if (!is_ok(ec))
								return ec;
				}
				for (std::uint8_t col = 0; col < total_cols; col++) {
						if (col != 0) {
								ErrorCode ec = w.append(" & ");
								if (!is_ok(ec))
										return ec;
						}
						const double v = (col < left.cols) ? left.at(row, col) : right.at(row, static_cast<std::uint8_t>(col - left.cols));
						ErrorCode ec = w.append_number(v);
						if (!is_ok(ec))
								return ec;
				}
		}
		return ErrorCode::Ok;
}

// "{rr|rr}": right aligned columns with a bar at the split
ErrorCode write_column_spec(std::uint8_t left_cols, std::uint8_t right_cols, Writer& w) noexcept {
		ErrorCode ec = w.put('{');
		for (std::uint8_t i = 0; is_ok(ec) && i < left_cols + right_cols; i++) {
				if (i == left_cols)
						ec = w.put('|');
				if (is_ok(ec))
						ec = w.put('r');
		}
		if (!is_ok(ec))
				return ec;
		return w.put('}');
}

ErrorCode write_bracketed(MatrixView m, MatrixBrackets brackets, Writer& w) noexcept {
		if (!m.data)
				return ErrorCode::Internal;
		const Environment env = environment_for(brackets);
		if (!env.open)
				return ErrorCode::Internal;

		ErrorCode ec = w.append(env.open);
		if (is_ok(ec))
				ec = write_rows(m, MatrixView{m.rows, 0, 0, m.data}, w);
		if (!is_ok(ec))
				return ec;
		return w.append(env.close);
}

ErrorCode write_augmented(MatrixView left, MatrixView right, Writer& w) noexcept {
		if (!left.data || !right.data)
				return ErrorCode::Internal;
		if (left.rows != right.rows)
				return ErrorCode::DimensionMismatch;
		if (left.cols == 0 || right.cols == 0)
				return ErrorCode::InvalidDimension;

		ErrorCode ec = w.append("\\left[\\begin{array}");
		if (is_ok(ec))
				ec = write_column_spec(left.cols, right.cols, w);
		if (is_ok(ec))
				ec = write_rows(left, right, w);
		if (!is_ok(ec))
				return ec;
		return w.append("\\end{array}\\right]");
}

// clears out, then runs body between optional $$ delimiters
template <typename Body> ErrorCode write_to(Buffer out, bool display, Body&& body) noexcept {
		Writer w{out.data, out.cap, 0};
		if (w.data && w.cap)
				w.data[0] = '\0';

		ErrorCode ec = display ? w.append("$$") : ErrorCode::Ok;
		if (is_ok(ec))
				ec = body(w);
		if (is_ok(ec) && display)
				ec = w.append("$$");
		return ec;
}

} // namespace

ErrorCode write_matrix(MatrixView m, MatrixBrackets brackets, Buffer out) noexcept {
		return write_to(out, false, [&](Writer& w) noexcept { return write_bracketed(m, brackets, w); });
}

ErrorCode write_matrix_display(MatrixView m, MatrixBrackets brackets, Buffer out) noexcept {
		return write_to(out, true, [&](Writer& w) noexcept { return write_bracketed(m, brackets, w); });
}

ErrorCode write_augmented_matrix(MatrixView left, MatrixView right, Buffer out) noexcept {
		return write_to(out, false, [&](Writer& w) noexcept { return write_augmented(left, right, w); });
}

ErrorCode write_augmented_matrix_display(MatrixView left, MatrixView right, Buffer out) noexcept {
		return write_to(out, true, [&](Writer& w) noexcept { return write_augmented(left, right, w); });
}

} // namespace inverse_core::latex
