#pragma once

#include <cstdint>

namespace inverse_shell {

enum class TextId : std::uint16_t {
		None = 0,
#define INVERSE_SHELL_TEXT_ENTRY(id, key, en, fr) id,
#include "inverse_shell/text_catalog.inc"
#undef INVERSE_SHELL_TEXT_ENTRY
		Count
};

// message in the catalog language chosen at build time (INVERSE_SHELL_LANG_FR)
// "" for None and out of range ids
const char* tr(TextId id) noexcept;

// catalog key such as "err.size_range", for debug traces
const char* text_key(TextId id) noexcept;

} // namespace inverse_shell
