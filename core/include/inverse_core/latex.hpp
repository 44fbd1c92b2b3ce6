#pragma once

#include <cstdint>

#include "inverse_core/error.hpp"
#include "inverse_core/matrix.hpp"
#include "inverse_core/writer.hpp"

namespace inverse_core::latex {
enum class MatrixBrackets : std::uint8_t {
		BMatrix,
		PMatrix,
		VMatrix,
};

ErrorCode write_matrix(In MatrixView m, In MatrixBrackets brackets, Out Buffer out) noexcept;
ErrorCode write_matrix_display(In MatrixView m, In MatrixBrackets brackets, Out Buffer out) noexcept;

// writes an augmented matrix [L | R] using the latex array environment
//
// example:
//   \\left[\\begin{array}{rr|rr} ... \\end{array}\\right]
ErrorCode write_augmented_matrix(In MatrixView left, In MatrixView right, Out Buffer out) noexcept;
ErrorCode write_augmented_matrix_display(In MatrixView left, In MatrixView right, Out Buffer out) noexcept;
} // namespace inverse_core::latex
