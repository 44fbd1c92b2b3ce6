#pragma once

#include "inverse_shell/config.hpp"

#include "inverse_core/matrix.hpp"

#include <cstdio>

#if INVERSE_SHELL_ENABLE_DEBUG
#define SHELL_DBG(...) std::fprintf(stderr, __VA_ARGS__)
#else
#define SHELL_DBG(...) \
		do {            \
		} while (0)
#endif

namespace inverse_shell::detail {

[[noreturn]] void fail_fast(const char* msg) noexcept;
[[noreturn]] void fail_fast(const char* func, const char* msg) noexcept;
void require_impl(bool ok, const char* func, const char* msg) noexcept;

void dbg_print_matrix(const char* tag, inverse_core::MatrixView m) noexcept;

} // namespace inverse_shell::detail

#define REQUIRE(ok, msg) ::inverse_shell::detail::require_impl((ok), __func__, (msg))
