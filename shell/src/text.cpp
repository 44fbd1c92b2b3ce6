#include "inverse_shell/text.hpp"

#include "inverse_shell/config.hpp"

#include <cstddef>

namespace inverse_shell {
namespace {

struct TextEntry {
		const char* key;
		const char* en;
		const char* fr;
};

constexpr TextEntry kEntries[] = {
		{"", "", ""},
#define INVERSE_SHELL_TEXT_ENTRY(id, key, en, fr) {key, en, fr},
#include "inverse_shell/text_catalog.inc"
#undef INVERSE_SHELL_TEXT_ENTRY
};

constexpr std::size_t kEntryCount = static_cast<std::size_t>(TextId::Count);
static_assert((sizeof(kEntries) / sizeof(kEntries[0])) == kEntryCount, "kEntries count mismatch");

const TextEntry& entry(TextId id) noexcept {
		const auto idx = static_cast<std::size_t>(id);
		return kEntries[idx < kEntryCount ? idx : 0];
}

} // namespace

const char* tr(TextId id) noexcept {
#if INVERSE_SHELL_LANG_FR
		return entry(id).fr;
#else
		return entry(id).en;
#endif
}

const char* text_key(TextId id) noexcept {
		return entry(id).key;
}

} // namespace inverse_shell
