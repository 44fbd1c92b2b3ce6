#pragma once

#include <cstddef>
#include <cstdint>

#include "inverse_core/error.hpp"
#include "inverse_core/matrix.hpp"

#include "inverse_shell/text.hpp"

namespace inverse_shell {

constexpr std::size_t kMaxInputBytes = 16u * 1024u;
constexpr std::size_t kMaxTokenLen = 47;

enum class InputStatus : std::uint8_t {
		Ok,
		Empty,
		BadSize,        // first token is not an integer
		SizeOutOfRange, // N outside [kMinDim, kMaxDim]
		InvalidValue,   // row/col name the offending entry
		MissingValues,
		TrailingData,
};

struct ParsedInput {
		InputStatus status = InputStatus::Empty;
		std::uint8_t row = 0; // 0-based
		std::uint8_t col = 0; // 0-based
		inverse_core::Matrix matrix{};

		bool ok() const noexcept { return status == InputStatus::Ok; }
};

// Splits on whitespace, ',' and ';'. Returns false at end of text.
class Tokenizer {
	  public:
		explicit Tokenizer(const char* text) noexcept : p_(text) {}

		// tok receives at most kMaxTokenLen chars; *truncated is set when the token was longer.
		bool next(char* tok, std::size_t cap, bool* truncated) noexcept;

	  private:
		const char* p_ = nullptr;
};

bool parse_i64(const char* s, std::int64_t* out) noexcept;
bool parse_f64(const char* s, double* out) noexcept; // rejects nan and inf

void parse_matrix_text(In const char* text, Out ParsedInput* out) noexcept;

TextId input_status_text(InputStatus s) noexcept;

} // namespace inverse_shell
