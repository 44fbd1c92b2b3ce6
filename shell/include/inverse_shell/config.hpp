#pragma once

// -----------------------------------------------------------------------------
// Feature flags
// -----------------------------------------------------------------------------
#ifndef INVERSE_SHELL_ENABLE_DEBUG
#define INVERSE_SHELL_ENABLE_DEBUG 0
#endif

#ifndef INVERSE_SHELL_LANG_FR
#define INVERSE_SHELL_LANG_FR 0
#endif
