#pragma once

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include "inverse_core/config.hpp"
#include "inverse_core/error.hpp"

namespace inverse_core {

// caller owned output buffer for the text producing APIs
struct Buffer {
		char* data = nullptr;
		std::size_t cap = 0;
};

// string builder helper that writes to a fixed capacity buffer
// all operations are noexcept and return ErrorCode on overflow
struct Writer {
		char* data = nullptr;
		std::size_t cap = 0;
		std::size_t len = 0;

		ErrorCode put(char ch) noexcept {
				if (!data || cap == 0)
						return ErrorCode::BufferTooSmall;
				if (len + 1 >= cap)
						return ErrorCode::BufferTooSmall;
				data[len++] = ch;
				data[len] = '\0';
				return ErrorCode::Ok;
		}

		ErrorCode append(const char* s) noexcept {
				if (!s)
						return ErrorCode::Internal;
				for (std::size_t i = 0; s[i] != '\0'; i++) {
						ErrorCode ec = put(s[i]);
						if (!is_ok(ec))
								return ec;
				}
				return ErrorCode::Ok;
		}

		ErrorCode append_u64(std::uint64_t v) noexcept {
				char buf[32];
				std::size_t n = 0;
				do {
						buf[n++] = static_cast<char>('0' + (v % 10u));
						v /= 10u;
				} while (v != 0u);

				for (std::size_t i = 0; i < n; i++) {
						ErrorCode ec = put(buf[n - 1 - i]);
						if (!is_ok(ec))
								return ec;
				}
				return ErrorCode::Ok;
		}

		ErrorCode append_i64(std::int64_t v) noexcept {
				std::uint64_t mag = (v < 0) ? (static_cast<std::uint64_t>(-(v + 1)) + 1u) : static_cast<std::uint64_t>(v);
				if (v < 0) {
						ErrorCode ec = put('-');
						if (!is_ok(ec))
								return ec;
				}
				return append_u64(mag);
		}

		// append a 1 based index (v+1) as decimal
		ErrorCode append_index1(std::uint8_t v) noexcept { return append_u64(static_cast<std::uint64_t>(v) + 1u); }

		// fixed point with the given number of decimals
		ErrorCode append_f64(double v, int decimals) noexcept {
				if (!std::isfinite(v))
						return ErrorCode::InvalidValue;
				char buf[64];
				const int n = std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
				if (n < 0 || static_cast<std::size_t>(n) >= sizeof(buf))
						return ErrorCode::BufferTooSmall;
				return append(buf);
		}

		// display form of a matrix entry or factor:
		//   ~0 -> "0", ~integer -> "3", otherwise 4 decimals "0.3333"
		//   inf, -inf and nan print as such
		ErrorCode append_number(double v) noexcept {
				if (std::isnan(v))
						return append("nan");
				if (std::isinf(v))
						return append(v < 0 ? "-inf" : "inf");
				if (std::fabs(v) < kPivotTolerance)
						return put('0');
				const double rounded = std::round(v);
				if (std::fabs(v - rounded) < kPivotTolerance && std::fabs(rounded) < 9.0e15)
						return append_i64(static_cast<std::int64_t>(rounded));
				if (std::fabs(v) >= 1.0e15) {
						char buf[32];
						const int n = std::snprintf(buf, sizeof(buf), "%.6e", v);
						if (n < 0 || static_cast<std::size_t>(n) >= sizeof(buf))
								return ErrorCode::BufferTooSmall;
						return append(buf);
				}
				return append_f64(v, 4);
		}
};

// Writer wrapper that fail-fast aborts on the first error.
// Intended for cases where overflows indicate a programmer error.
struct CheckedWriter final {
		explicit CheckedWriter(char* data, std::size_t cap) noexcept : w{data, cap, 0} {}

		void put(char ch) noexcept { check(w.put(ch)); }
		void append(const char* s) noexcept { check(w.append(s)); }
		void append_u64(std::uint64_t v) noexcept { check(w.append_u64(v)); }
		void append_i64(std::int64_t v) noexcept { check(w.append_i64(v)); }
		void append_index1(std::uint8_t v) noexcept { check(w.append_index1(v)); }
		void append_f64(double v, int decimals) noexcept { check(w.append_f64(v, decimals)); }
		void append_number(double v) noexcept { check(w.append_number(v)); }

		Writer w{};

	  private:
		[[noreturn]] static void die(ErrorCode ec) noexcept {
				(void)ec;
				assert(false && "inverse_core::CheckedWriter failure");
				std::abort();
		}

		static void check(ErrorCode ec) noexcept {
				if (!is_ok(ec))
						die(ec);
		}
};

// writes the display form of v (see Writer::append_number)
ErrorCode format_number(In double v, Out Buffer out) noexcept;

} // namespace inverse_core
