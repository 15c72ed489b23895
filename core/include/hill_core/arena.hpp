#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <new>

namespace hill_core {

// linear allocator over memory it does not own (usually one half of a Slab).
// the persist arena holds keys and explanation contexts, the scratch arena
// holds elimination work matrices and is wiped by every op that uses it
class Arena {
	  public:
		Arena() noexcept = default;
		Arena(void* buffer, std::size_t capacity) noexcept { reset(buffer, capacity); }

		void reset(void* buffer, std::size_t capacity) noexcept {
				base_ = static_cast<std::uint8_t*>(buffer);
				cap_ = base_ ? capacity : 0;
				used_ = 0;
		}

		std::size_t used() const noexcept { return used_; }
		std::size_t capacity() const noexcept { return cap_; }

		// a mark is just the fill level; rewinding to a later mark is a no-op
		std::size_t mark() const noexcept { return used_; }
		void rewind(std::size_t mark) noexcept { used_ = mark < used_ ? mark : used_; }
		void clear() noexcept { used_ = 0; }

		// nullptr for size 0 or when the aligned block does not fit
		void* allocate(std::size_t size, std::size_t align) noexcept {
				if (size == 0 || cap_ == 0)
						return nullptr;
				const std::uintptr_t start = reinterpret_cast<std::uintptr_t>(base_);
				const std::uintptr_t mask = static_cast<std::uintptr_t>(align ? align : 1) - 1u;
				const std::uintptr_t at = (start + used_ + mask) & ~mask;
				const std::size_t offset = static_cast<std::size_t>(at - start);
				if (offset > cap_ || size > cap_ - offset)
						return nullptr;
				used_ = offset + size;
				return base_ + offset;
		}

		// value initialized T. no destructor ever runs, so T must not need one
		template <typename T> T* make() noexcept {
				void* mem = allocate(sizeof(T), alignof(T));
				return mem ? new (mem) T{} : nullptr;
		}

	  private:
		std::uint8_t* base_ = nullptr;
		std::size_t cap_ = 0;
		std::size_t used_ = 0;
};

// all or nothing allocation in the persist arena: everything allocated while
// the scope is open is released again unless commit() is reached
class ArenaScope final {
	  public:
		explicit ArenaScope(Arena& arena) noexcept : arena_(arena), mark_(arena.mark()) {}
		ArenaScope(const ArenaScope&) = delete;
		ArenaScope& operator=(const ArenaScope&) = delete;

		~ArenaScope() noexcept {
				if (committed_)
						return;
				// an inner scope must not have rewound below our mark
				assert(arena_.used() >= mark_);
				arena_.rewind(mark_);
		}

		void commit() noexcept { committed_ = true; }

	  private:
		Arena& arena_;
		std::size_t mark_;
		bool committed_ = false;
};

// wipes a scratch arena when an op starts using it
class ArenaScratchScope final {
	  public:
		explicit ArenaScratchScope(Arena& arena) noexcept { arena.clear(); }
		ArenaScratchScope(const ArenaScratchScope&) = delete;
		ArenaScratchScope& operator=(const ArenaScratchScope&) = delete;
};
} // namespace hill_core
