#include "inverse_shell/input.hpp"

#include "inverse_shell/detail/app_internal.hpp"

#include "inverse_core/config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace inverse_shell {
namespace {


bool is_separator(char c) noexcept {
		return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f' || c == ',' || c == ';';
}

} // namespace

bool Tokenizer::next(char* tok, std::size_t cap, bool* truncated) noexcept {
		if (!tok || cap == 0 || !truncated)
				detail::fail_fast("Tokenizer::next: bad buffer");
		tok[0] = '\0';
		*truncated = false;
		if (!p_)
				return false;

		while (*p_ != '\0' && is_separator(*p_))
				++p_;
		if (*p_ == '\0')
				return false;

		std::size_t len = 0;
		while (*p_ != '\0' && !is_separator(*p_)) {
				if (len + 1 < cap)
						tok[len++] = *p_;
				else
						*truncated = true;
				++p_;
		}
		tok[len] = '\0';
		return true;
}

bool parse_i64(const char* s, std::int64_t* out) noexcept {
		if (!out || !s || s[0] == '\0')
				return false;

		const char* const end = s + std::strlen(s);
		char* parse_end = nullptr;
		errno = 0;
		const long long v = std::strtoll(s, &parse_end, 10);
		if (errno != 0)
				return false;
		if (parse_end != end)
				return false;
		*out = static_cast<std::int64_t>(v);
		return true;
}

bool parse_f64(const char* s, double* out) noexcept {
		if (!out || !s || s[0] == '\0')
				return false;

		const char* const end = s + std::strlen(s);
		char* parse_end = nullptr;
		errno = 0;
		const double v = std::strtod(s, &parse_end);
		if (errno == ERANGE && std::isinf(v))
				return false;
		if (parse_end != end)
				return false;
		if (!std::isfinite(v))
				return false;
		*out = v;
		return true;
}

void parse_matrix_text(In const char* text, Out ParsedInput* out) noexcept {
		if (!out)
				detail::fail_fast("parse_matrix_text: out is null");
		*out = ParsedInput{};

		Tokenizer tz{text};
		char tok[kMaxTokenLen + 1];
		bool truncated = false;

		if (!tz.next(tok, sizeof(tok), &truncated)) {
				out->status = InputStatus::Empty;
				return;
		}

		std::int64_t n = 0;
		if (truncated || !parse_i64(tok, &n)) {
				out->status = InputStatus::BadSize;
				return;
		}
		if (n < inverse_core::kMinDim || n > inverse_core::kMaxDim) {
				SHELL_DBG("[input] size %lld out of range\n", static_cast<long long>(n));
				out->status = InputStatus::SizeOutOfRange;
				return;
		}

		const auto dim = static_cast<std::uint8_t>(n);
		const inverse_core::ErrorCode ec = inverse_core::matrix_init(dim, dim, &out->matrix);
		REQUIRE(inverse_core::is_ok(ec), "matrix_init rejected a checked size");

		for (std::uint8_t i = 0; i < dim; i++) {
				for (std::uint8_t j = 0; j < dim; j++) {
						if (!tz.next(tok, sizeof(tok), &truncated)) {
								out->status = InputStatus::MissingValues;
								out->row = i;
								out->col = j;
								return;
						}
						double v = 0.0;
						if (truncated || !parse_f64(tok, &v)) {
								SHELL_DBG("[input] bad value '%s' at (%u,%u)\n", tok, (unsigned)i, (unsigned)j);
								out->status = InputStatus::InvalidValue;
								out->row = i;
								out->col = j;
								return;
						}
						out->matrix.at_mut(i, j) = v;
				}
		}

		if (tz.next(tok, sizeof(tok), &truncated)) {
				out->status = InputStatus::TrailingData;
				return;
		}

		out->status = InputStatus::Ok;
}

TextId input_status_text(InputStatus s) noexcept {
		switch (s) {
		case InputStatus::Ok:
				return TextId::None;
		case InputStatus::Empty:
				return TextId::ErrEmpty;
		case InputStatus::BadSize:
				return TextId::ErrSize;
		case InputStatus::SizeOutOfRange:
				return TextId::ErrSizeRange;
		case InputStatus::InvalidValue:
				return TextId::ErrInvalidValue;
		case InputStatus::MissingValues:
				return TextId::ErrMissing;
		case InputStatus::TrailingData:
				return TextId::ErrTrailing;
		}
		return TextId::None;
}

} // namespace inverse_shell
