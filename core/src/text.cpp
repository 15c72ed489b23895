#include "hill_core/text.hpp"

#include <cstddef>

namespace hill_core {
namespace {

constexpr const char* kText[] = {
        "",
#define HILL_CORE_TEXT_ENTRY(id, en) en,
#include "hill_core/text_catalog.inc"
#undef HILL_CORE_TEXT_ENTRY
};

constexpr std::size_t kTextCount = static_cast<std::size_t>(TextId::Count);
static_assert((sizeof(kText) / sizeof(kText[0])) == kTextCount, "kText count mismatch");

} // namespace

const char* tr(TextId id) noexcept {
		const auto idx = static_cast<std::size_t>(id);
		if (idx >= kTextCount)
				return "";
		return kText[idx];
}

} // namespace hill_core
