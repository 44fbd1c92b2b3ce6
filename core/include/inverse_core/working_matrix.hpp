#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "inverse_core/config.hpp"
#include "inverse_core/error.hpp"
#include "inverse_core/matrix.hpp"

namespace inverse_core {
// the n x 2n augmented matrix [A | I] mutated during elimination, plus a copy
// of the n x n input it was built from
class WorkingMatrix {
	  public:
		// A must be square with n in [kMinDim, kMaxDim] and hold only finite values
		static Error initialize(In MatrixView a, Out WorkingMatrix* out) noexcept;

		std::uint8_t n() const noexcept { return n_; }
		std::uint8_t cols() const noexcept { return static_cast<std::uint8_t>(2u * n_); }

		// bounds checked access over the full n x 2n matrix, failures carry the position
		Error get(In std::uint8_t row, In std::uint8_t col, Out double* out) const noexcept;
		Error set(In std::uint8_t row, In std::uint8_t col, In double value) noexcept;

		// writes the n x n block at columns [n, 2n)
		ErrorCode extract_right_half(Out Matrix* out) const noexcept;

		MatrixMutView view() noexcept { return {n_, cols(), kMaxAugCols, data_}; }
		MatrixView view() const noexcept { return {n_, cols(), kMaxAugCols, data_}; }
		MatrixView left() const noexcept { return {n_, n_, kMaxAugCols, data_}; }
		MatrixView right() const noexcept { return {n_, n_, kMaxAugCols, data_ + n_}; }
		MatrixView input() const noexcept { return input_.view(); }

		const double& at(std::uint8_t r, std::uint8_t c) const noexcept {
				assert(r < n_ && c < cols());
				return data_[static_cast<std::size_t>(r) * kMaxAugCols + c];
		}

	  private:
		std::uint8_t n_ = 0;
		double data_[kMaxAugEntries]{};
		Matrix input_{};
};
} // namespace inverse_core
