#pragma once

#include <cstddef>
#include <cstdint>

namespace hill_core {
// key matrices are square, n in [1, kMaxDim]
constexpr std::uint8_t kMaxDim = 6;
constexpr std::size_t kMaxEntries = static_cast<std::size_t>(kMaxDim) * static_cast<std::size_t>(kMaxDim);

// symbol count of a prepared message, padding included
constexpr std::size_t kMaxMessageLen = 240;

// block values are stored as uint16, so block level moduli are capped here.
// matrix level queries (determinant residue, key validity) accept any m >= 2
constexpr std::int64_t kMaxModulus = 65535;
constexpr std::int64_t kDefaultModulus = 26;
} // namespace hill_core

#ifndef HILL_CORE_ENABLE_WITNESS
#define HILL_CORE_ENABLE_WITNESS 1
#endif

// dbg_printf tracing, only available with the CE toolchain
#ifndef HILL_CORE_ENABLE_DEBUG
#define HILL_CORE_ENABLE_DEBUG 0
#endif
