#pragma once

#include <cstddef>
#include <cstdint>

namespace inverse_core {
// the shell only offers 2..10, the engine validates the same range
constexpr std::uint8_t kMinDim = 2;
constexpr std::uint8_t kMaxDim = 10;
constexpr std::uint8_t kMaxAugCols = static_cast<std::uint8_t>(2u * kMaxDim);
constexpr std::size_t kMaxEntries = static_cast<std::size_t>(kMaxDim) * static_cast<std::size_t>(kMaxDim);
constexpr std::size_t kMaxAugEntries = static_cast<std::size_t>(kMaxDim) * static_cast<std::size_t>(kMaxAugCols);

// |pivot| below this is treated as zero, entries below it are not eliminated
constexpr double kPivotTolerance = 1e-10;

// worst case per inversion: (n-1) swaps + n scales + n(n-1) eliminations
constexpr std::size_t kMaxRowOps = kMaxEntries + kMaxDim;

constexpr std::size_t kDescriptionCap = 64;
} // namespace inverse_core

#ifndef INVERSE_CORE_ENABLE_DEBUG
#define INVERSE_CORE_ENABLE_DEBUG 0
#endif
