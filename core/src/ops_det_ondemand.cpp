#include "hill_core/ops.hpp"

#include "hill_core/det_detail.hpp"
#include "hill_core/detail/checked_int.hpp"
#include "hill_core/latex.hpp"
#include "hill_core/text.hpp"
#include "hill_core/writer.hpp"

namespace hill_core {
namespace {
struct DetCtx {
		MatrixView input;
		std::int64_t det = 0;
};

std::size_t det_step_count(const void* vctx) noexcept {
		const auto* ctx = static_cast<const DetCtx*>(vctx);
		// 0: |K|, 1..n: first row cofactor terms, last: det value
		return static_cast<std::size_t>(ctx->input.rows) + 2;
}

ErrorCode append_subscript(Writer& w, const char* sym, std::uint8_t i, std::uint8_t j) noexcept {
		ErrorCode ec = w.append(sym);
		if (!is_ok(ec))
				return ec;
		ec = w.append("_{");
		if (!is_ok(ec))
				return ec;
		ec = w.append_index1(i);
		if (!is_ok(ec))
				return ec;
		ec = w.put(',');
		if (!is_ok(ec))
				return ec;
		ec = w.append_index1(j);
		if (!is_ok(ec))
				return ec;
		return w.put('}');
}

// $$a_{1,j} C_{1,j} = a \cdot (c) = t$$
ErrorCode render_term(const detail::IntSquare& k, std::uint8_t j, Writer& w) noexcept {
		std::int64_t cof = 0;
		ErrorCode ec = detail::cofactor_exact(k, 0, j, &cof);
		if (!is_ok(ec))
				return ec;
		const std::int64_t entry = k.at(0, j);
		std::int64_t term = 0;
		if (detail::mul_overflow(entry, cof, &term))
				return ErrorCode::Overflow;

		ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = append_subscript(w, "a", 0, j);
		if (!is_ok(ec))
				return ec;
		ec = w.put(' ');
		if (!is_ok(ec))
				return ec;
		ec = append_subscript(w, "C", 0, j);
		if (!is_ok(ec))
				return ec;
		ec = w.append(" = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(entry);
		if (!is_ok(ec))
				return ec;
		ec = w.append(" \\cdot (");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(cof);
		if (!is_ok(ec))
				return ec;
		ec = w.append(") = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(term);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

ErrorCode det_render_step(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto* ctx = static_cast<const DetCtx*>(vctx);
		if (!ctx->input.data)
				return ErrorCode::Internal;

		if (out.caption && out.caption_cap)
				out.caption[0] = '\0';
		if (out.latex && out.latex_cap)
				out.latex[0] = '\0';

		const std::size_t total = det_step_count(vctx);
		if (index >= total)
				return ErrorCode::StepOutOfRange;

		if (index == 0)
				return latex::write_matrix_display(ctx->input, latex::MatrixBrackets::VMatrix, {out.latex, out.latex_cap});

		Writer w{out.latex, out.latex_cap, 0};
		if (index == total - 1) {
				if (out.caption) {
						Writer cw{out.caption, out.caption_cap, 0};
						ErrorCode ec = cw.append(tr(TextId::StepDeterminant));
						if (!is_ok(ec))
								return ec;
				}
				ErrorCode ec = w.append("$$\\det(K) = ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(ctx->det);
				if (!is_ok(ec))
						return ec;
				return w.append("$$");
		}

		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(ctx->input, &k);
		if (!is_ok(ec))
				return ec;

		if (out.caption) {
				Writer cw{out.caption, out.caption_cap, 0};
				ec = cw.append(tr(TextId::StepCofactorTerm));
				if (!is_ok(ec))
						return ec;
		}
		return render_term(k, static_cast<std::uint8_t>(index - 1), w);
}

constexpr ExplanationVTable kDetVTable = {
        .step_count = &det_step_count,
        .render_step = &det_render_step,
        .destroy = nullptr,
};

} // namespace

Error op_det(MatrixView key, std::int64_t* out, Explanation* expl, const ExplainOptions& opts) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		Error err = key_check(key, 0);
		if (!is_ok(err))
				return err;

		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(key, &k);
		if (!is_ok(ec))
				return err_code(ec);

		std::int64_t det = 0;
		ec = detail::det_exact(k, &det);
		if (!is_ok(ec)) {
				err.code = ec;
				err.a = key.dim();
				return err;
		}
		*out = det;

		if (opts.enable) {
				if (!opts.persist || !expl)
						return err_code(ErrorCode::Internal);

				ArenaScope tx(*opts.persist);
				auto* ctx = opts.persist->make<DetCtx>();
				if (!ctx)
						return err_overflow();
				ctx->input = key;
				ctx->det = det;
				*expl = Explanation::make(ctx, &kDetVTable);
				tx.commit();
		}

		return err;
}

} // namespace hill_core
