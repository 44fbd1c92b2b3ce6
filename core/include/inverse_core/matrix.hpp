#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "inverse_core/config.hpp"
#include "inverse_core/error.hpp"

namespace inverse_core {
struct MatrixView {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
		std::uint8_t stride = 0;
		const double* data = nullptr;

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		const double& at(std::uint8_t r, std::uint8_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}
};

struct MatrixMutView {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
		std::uint8_t stride = 0;
		double* data = nullptr;

		MatrixView view() const noexcept { return {rows, cols, stride, data}; }

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		const double& at(std::uint8_t r, std::uint8_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}

		double& at_mut(std::uint8_t r, std::uint8_t c) noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}
};

// owning matrix with inline storage for up to kMaxDim x kMaxDim entries
struct Matrix {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
		double data[kMaxEntries]{};

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		MatrixView view() const noexcept { return {rows, cols, cols, data}; }
		MatrixMutView mut_view() noexcept { return {rows, cols, cols, data}; }

		const double& at(std::uint8_t r, std::uint8_t c) const noexcept { return view().at(r, c); }
		double& at_mut(std::uint8_t r, std::uint8_t c) noexcept { return mut_view().at_mut(r, c); }
};

ErrorCode matrix_init(In std::uint8_t rows, In std::uint8_t cols, Out Matrix* out) noexcept;
ErrorCode matrix_from_view(In MatrixView src, Out Matrix* out) noexcept;
ErrorCode matrix_copy(In MatrixView src, Out MatrixMutView dst) noexcept;
void matrix_fill_zero(Out MatrixMutView m) noexcept;
ErrorCode matrix_set_identity(Out MatrixMutView m) noexcept;

ErrorCode matrix_mul(In MatrixView a, In MatrixView b, Out MatrixMutView out) noexcept;

// largest |a(i,j) - b(i,j)|
ErrorCode matrix_max_abs_diff(In MatrixView a, In MatrixView b, Out double* out) noexcept;

} // namespace inverse_core
