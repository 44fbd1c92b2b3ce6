#pragma once

#include <cstddef>
#include <cstdint>

#include "inverse_core/config.hpp"
#include "inverse_core/error.hpp"

namespace inverse_core {
enum class RowOpKind : std::uint8_t {
		Swap,   // R_i <-> R_j
		Scale,  // R_i <- k R_i
		AddMul, // R_i <- R_i + k R_j
};

// one elementary row operation, fixed at creation
//
// rows are 0 based, the description uses 1 based rows:
//   "R1 <-> R2", "R1 <- (0.2500) R1", "R2 <- R2 + (-2) R1"
class RowOp {
	  public:
		RowOp() noexcept = default;

		static RowOp swap(std::uint8_t r1, std::uint8_t r2) noexcept;
		static RowOp scale(std::uint8_t row, double k) noexcept;
		static RowOp add_multiple(std::uint8_t target, std::uint8_t source, double k) noexcept;

		RowOpKind kind() const noexcept { return kind_; }
		std::uint8_t target_row() const noexcept { return target_; }
		// second row of a Swap, the added row of an AddMul, target_row() for a Scale
		std::uint8_t source_row() const noexcept { return source_; }
		// 0 for a Swap
		double factor() const noexcept { return factor_; }
		const char* description() const noexcept { return description_; }

	  private:
		RowOp(RowOpKind kind, std::uint8_t target, std::uint8_t source, double factor) noexcept;

		RowOpKind kind_ = RowOpKind::Swap;
		std::uint8_t target_ = 0;
		std::uint8_t source_ = 0;
		double factor_ = 0.0;
		char description_[kDescriptionCap]{};
};

// elementary matrix type: 1 = swap, 2 = scale, 3 = add multiple
std::uint8_t row_op_type(In const RowOp& op) noexcept;

// LaTeX caption for a RowOp (1 based row indices)
ErrorCode row_op_caption(In const RowOp& op, Out char* out, In std::size_t cap) noexcept;

// elementary matrix notation with UTF-8 subscripts: E₁,₂  E₁(0.2500)  E₂,₁(-2)
ErrorCode row_op_elementary(In const RowOp& op, Out char* out, In std::size_t cap) noexcept;

} // namespace inverse_core
