#include "hill_core/explanation.hpp"

#include <utility>

namespace hill_core {

Explanation Explanation::make(void* ctx, const ExplanationVTable* vtable) noexcept {
		Explanation e;
		e.ctx_ = ctx;
		e.vtable_ = vtable;
		return e;
}

Explanation::Explanation(Explanation&& other) noexcept
        : ctx_(std::exchange(other.ctx_, nullptr)), vtable_(std::exchange(other.vtable_, nullptr)) {}

Explanation& Explanation::operator=(Explanation&& other) noexcept {
		if (this != &other) {
				reset();
				ctx_ = std::exchange(other.ctx_, nullptr);
				vtable_ = std::exchange(other.vtable_, nullptr);
		}
		return *this;
}

Explanation::~Explanation() {
		reset();
}

void Explanation::reset() noexcept {
		if (available() && vtable_->destroy)
				vtable_->destroy(ctx_);
		ctx_ = nullptr;
		vtable_ = nullptr;
}

std::size_t Explanation::step_count() const noexcept {
		return available() ? vtable_->step_count(ctx_) : 0;
}

ErrorCode Explanation::render_step(std::size_t index, const StepRenderBuffers& out) const noexcept {
		if (!available())
				return ErrorCode::Internal;
		if (!out.scratch)
				return vtable_->render_step(ctx_, index, out);

		ArenaScratchScope scope(*out.scratch);
		return vtable_->render_step(ctx_, index, out);
}

} // namespace hill_core
