#pragma once

#include <cstdint>

namespace hill_core {

enum class TextId : std::uint16_t {
		None = 0,
#define HILL_CORE_TEXT_ENTRY(id, en) id,
#include "hill_core/text_catalog.inc"
#undef HILL_CORE_TEXT_ENTRY
		Count
};

const char* tr(TextId id) noexcept;

} // namespace hill_core
