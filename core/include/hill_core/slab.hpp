#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include "hill_core/arena.hpp"
#include "hill_core/error.hpp"

namespace hill_core {

// heap block behind a session's two arenas. the only heap allocation the
// library makes, and it is the caller's
class Slab {
	  public:
		Slab() noexcept = default;
		Slab(const Slab&) = delete;
		Slab& operator=(const Slab&) = delete;
		~Slab() { release(); }

		// InvalidDimension for 0 bytes, Overflow when malloc fails.
		// on-device test builds clamp the request to what the CE heap can give
		ErrorCode init(std::size_t bytes) noexcept {
				release();
				if (bytes == 0)
						return ErrorCode::InvalidDimension;
#if defined(HILL_CE_TESTS)
				if (bytes > kCeTestHeapBytes)
						bytes = kCeTestHeapBytes;
#endif
				data_ = static_cast<std::uint8_t*>(std::malloc(bytes));
				if (!data_)
						return ErrorCode::Overflow;
				size_ = bytes;
				return ErrorCode::Ok;
		}

		// persist gets the lower half, scratch the rest
		void split(Arena* persist, Arena* scratch) noexcept {
				const std::size_t lower = size_ / 2;
				if (persist)
						persist->reset(data_, lower);
				if (scratch)
						scratch->reset(data_ ? data_ + lower : nullptr, size_ - lower);
		}

		std::uint8_t* data() noexcept { return data_; }
		std::size_t size() const noexcept { return size_; }

	  private:
#if defined(HILL_CE_TESTS)
		static constexpr std::size_t kCeTestHeapBytes = 48u * 1024u;
#endif
		std::uint8_t* data_ = nullptr;
		std::size_t size_ = 0;

		void release() noexcept {
				std::free(data_);
				data_ = nullptr;
				size_ = 0;
		}
};
} // namespace hill_core
