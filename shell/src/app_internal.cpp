#include "inverse_shell/detail/app_internal.hpp"

#include <cassert>
#include <cstdlib>

namespace inverse_shell::detail {

[[noreturn]] void fail_fast(const char* msg) noexcept {
		assert(msg);
		std::fprintf(stderr, "[fatal] %s\n", msg);
		assert(false && "inverse_shell fail_fast");
		std::abort();
}

[[noreturn]] void fail_fast(const char* func, const char* msg) noexcept {
		assert(func);
		assert(msg);
		std::fprintf(stderr, "[fatal] %s: %s\n", func, msg);
		assert(false && "inverse_shell fail_fast");
		std::abort();
}

void require_impl(bool ok, const char* func, const char* msg) noexcept {
		if (!ok)
				fail_fast(func, msg);
}

void dbg_print_matrix(const char* tag, inverse_core::MatrixView m) noexcept {
#if INVERSE_SHELL_ENABLE_DEBUG
		if (!tag)
				tag = "(null)";
		SHELL_DBG("[%s] %ux%u stride=%u data=%p\n", tag, m.rows, m.cols, m.stride, (const void*)m.data);
		if (!m.data)
				return;

		for (std::uint8_t r = 0; r < m.rows; r++) {
				SHELL_DBG("  ");
				for (std::uint8_t c = 0; c < m.cols; c++)
						SHELL_DBG(" %.17g", m.at(r, c));
				SHELL_DBG("\n");
		}
#else
		(void)tag;
		(void)m;
#endif
}

} // namespace inverse_shell::detail
