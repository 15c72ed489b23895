#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/arena.hpp"
#include "hill_core/error.hpp"

namespace hill_core {

// caller owned output of one rendered step. scratch is cleared before each
// render and holds replayed work matrices
struct StepRenderBuffers {
		char* caption = nullptr;
		std::size_t caption_cap = 0;
		char* latex = nullptr;
		std::size_t latex_cap = 0;
		Arena* scratch = nullptr;
};

// per operation step source. ctx is the operation's context struct in the
// persist arena; destroy may be null for trivially destructible contexts
struct ExplanationVTable {
		std::size_t (*step_count)(In const void* ctx) noexcept;
		ErrorCode (*render_step)(In const void* ctx, In std::size_t index, In const StepRenderBuffers& out) noexcept;
		void (*destroy)(InOut void* ctx) noexcept;
};

// the worked steps behind a result (determinant expansion, elimination,
// modular inverse, block encryption). nothing is rendered until asked for,
// one step at a time. move only
class Explanation {
	  public:
		Explanation() noexcept = default;
		Explanation(const Explanation&) = delete;
		Explanation& operator=(const Explanation&) = delete;
		Explanation(Explanation&& other) noexcept;
		Explanation& operator=(Explanation&& other) noexcept;
		~Explanation();

		static Explanation make(void* ctx, const ExplanationVTable* vtable) noexcept;

		bool available() const noexcept { return ctx_ && vtable_; }
		std::size_t step_count() const noexcept;

		// StepOutOfRange past the last step, BufferTooSmall when a buffer
		// cannot hold the text
		ErrorCode render_step(In std::size_t index, In const StepRenderBuffers& out) const noexcept;

	  private:
		void* ctx_ = nullptr;
		const ExplanationVTable* vtable_ = nullptr;

		void reset() noexcept;
};

// opts.persist must outlive the Explanation when enable is set
struct ExplainOptions {
		bool enable = false;
		Arena* persist = nullptr;
};

} // namespace hill_core
