#pragma once

#include <cstdint>

// parameter direction annotations
#define In
#define Out
#define InOut

namespace inverse_core {
struct Dim {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
};

enum class ErrorCode : std::uint8_t {
		Ok = 0,
		InvalidDimension,
		InvalidValue,
		DimensionMismatch,
		IndexOutOfRange,
		StepOutOfRange,
		BufferTooSmall,
		Overflow,
		Internal,
};

// i/j hold the 0 based position for InvalidValue and IndexOutOfRange
struct Error {
		ErrorCode code = ErrorCode::Ok;
		Dim a{};
		std::uint8_t i = 0;
		std::uint8_t j = 0;
};

constexpr bool is_ok(ErrorCode code) noexcept {
		return code == ErrorCode::Ok;
}
constexpr bool is_ok(const Error& err) noexcept {
		return is_ok(err.code);
}

constexpr Error err_invalid_dim(Dim a) noexcept {
		return {ErrorCode::InvalidDimension, a};
}
constexpr Error err_invalid_value(Dim a, std::uint8_t i, std::uint8_t j) noexcept {
		return {ErrorCode::InvalidValue, a, i, j};
}
constexpr Error err_index_out_of_range(Dim a, std::uint8_t i, std::uint8_t j) noexcept {
		return {ErrorCode::IndexOutOfRange, a, i, j};
}
constexpr Error err_internal() noexcept {
		return {ErrorCode::Internal};
}

const char* error_code_name(ErrorCode code) noexcept;
} // namespace inverse_core
