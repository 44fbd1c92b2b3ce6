#pragma once

#include <cstdint>
#include <utility>

#include "inverse_core/error.hpp"
#include "inverse_core/matrix.hpp"
#include "inverse_core/row_ops.hpp"

namespace inverse_core {

// swap rows r1 and r2 of matrix m
inline void apply_swap(MatrixMutView m, std::uint8_t r1, std::uint8_t r2) noexcept {
		if (r1 == r2)
				return;
		for (std::uint8_t col = 0; col < m.cols; col++)
				std::swap(m.at_mut(r1, col), m.at_mut(r2, col));
}

// scale row r by k: R_r <- k * R_r
inline void apply_scale(MatrixMutView m, std::uint8_t row, double k) noexcept {
		for (std::uint8_t col = 0; col < m.cols; col++)
				m.at_mut(row, col) *= k;
}

// add a scaled row: R_dst <- R_dst + k * R_src
inline void apply_addmul(MatrixMutView m, std::uint8_t dst, std::uint8_t src, double k) noexcept {
		for (std::uint8_t col = 0; col < m.cols; col++)
				m.at_mut(dst, col) = m.at(dst, col) + k * m.at(src, col);
}

// applies op to m. the elimination engine and log replay both go through here
// so a replayed log reproduces the engine's working matrix exactly
ErrorCode apply_row_op(InOut MatrixMutView m, In const RowOp& op) noexcept;

} // namespace inverse_core
