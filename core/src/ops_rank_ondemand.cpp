#include "hill_core/ops.hpp"

#include "hill_core/det_detail.hpp"
#include "hill_core/latex.hpp"
#include "hill_core/row_reduction.hpp"
#include "hill_core/text.hpp"
#include "hill_core/writer.hpp"

namespace hill_core {
namespace {
struct RankCtx {
		MatrixView input;
		std::size_t op_count = 0;
		std::uint8_t rank = 0;
		std::uint8_t nullity = 0;
};

std::size_t rank_step_count(const void* vctx) noexcept {
		const auto* ctx = static_cast<const RankCtx*>(vctx);
		// 0: input, 1..op_count: after each row op, last: rank and nullity
		return ctx->op_count + 2;
}

ErrorCode rank_render_result(const RankCtx& ctx, const StepRenderBuffers& out) noexcept {
		if (out.caption) {
				Writer cw{out.caption, out.caption_cap, 0};
				ErrorCode ec = cw.append(tr(TextId::StepRankResult));
				if (!is_ok(ec))
						return ec;
		}

		Writer w{out.latex, out.latex_cap, 0};
		ErrorCode ec = w.append("$$\\operatorname{rank}(K) = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_u64(ctx.rank);
		if (!is_ok(ec))
				return ec;
		ec = w.append(", \\quad \\operatorname{nullity}(K) = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_u64(ctx.input.cols);
		if (!is_ok(ec))
				return ec;
		ec = w.append(" - ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_u64(ctx.rank);
		if (!is_ok(ec))
				return ec;
		ec = w.append(" = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_u64(ctx.nullity);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

ErrorCode rank_render_step(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto* ctx = static_cast<const RankCtx*>(vctx);
		if (!ctx->input.data)
				return ErrorCode::Internal;
		if (!out.scratch)
				return ErrorCode::Internal;

		if (out.caption && out.caption_cap)
				out.caption[0] = '\0';
		if (out.latex && out.latex_cap)
				out.latex[0] = '\0';

		const std::size_t total = rank_step_count(vctx);
		if (index >= total)
				return ErrorCode::StepOutOfRange;

		if (index == total - 1)
				return rank_render_result(*ctx, out);

		if (index == 0)
				return latex::write_matrix_display(ctx->input, latex::MatrixBrackets::BMatrix, {out.latex, out.latex_cap});

		// replay the elimination up to the requested op
		MatrixMutView work;
		ErrorCode ec = matrix_clone(*out.scratch, ctx->input, &work);
		if (!is_ok(ec))
				return ec;

		OpObserver obs;
		obs.target = index;
		RankResult ignored;
		ec = rank_eliminate(work, &obs, &ignored);
		if (!is_ok(ec))
				return ec;
		if (obs.count < index)
				return ErrorCode::StepOutOfRange;

		if (out.caption) {
				ec = row_op_caption(obs.last_op, out.caption, out.caption_cap);
				if (!is_ok(ec))
						return ec;
		}

		return latex::write_matrix_display(work.view(), latex::MatrixBrackets::BMatrix, {out.latex, out.latex_cap});
}

ErrorCode rank_integer_key(MatrixView a, RankResult* out) noexcept {
		if (!a.square())
				return ErrorCode::Overflow;
		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(a, &k);
		if (ec == ErrorCode::NotInteger)
				return ErrorCode::Overflow;
		if (!is_ok(ec))
				return ec;

		RankResult res{};
		ec = detail::rank_mod_primes(k, res.pivot_cols, &res.rank);
		if (!is_ok(ec))
				return ec;
		*out = res;
		return ErrorCode::Ok;
}

constexpr ExplanationVTable kRankVTable = {
        .step_count = &rank_step_count,
        .render_step = &rank_render_step,
        .destroy = nullptr,
};

} // namespace

Error op_rank(MatrixView a, Arena& scratch, RankInfo* out, Explanation* expl, const ExplainOptions& opts) noexcept {
		Error err;
		if (!out || !a.data)
				return err_code(ErrorCode::Internal);

		ArenaScratchScope scratch_scope(scratch);
		MatrixMutView work;
		ErrorCode ec = matrix_clone(scratch, a, &work);
		if (!is_ok(ec)) {
				err.code = ec;
				err.a = a.dim();
				return err;
		}

		OpObserver obs;
		RankResult res;
		ec = rank_eliminate(work, &obs, &res);
		if (ec == ErrorCode::Overflow) {
				// fractions outgrew int64, integer keys still get an exact rank
				// over GF(p) for several large p. no row ops to replay then
				ec = rank_integer_key(a, &res);
				obs.count = 0;
		}
		if (!is_ok(ec)) {
				err.code = ec;
				err.a = a.dim();
				return err;
		}

		RankInfo info;
		info.cols = a.cols;
		info.rank = res.rank;
		info.nullity = static_cast<std::uint8_t>(a.cols - res.rank);
		for (std::uint8_t i = 0; i < res.rank; i++)
				info.pivot_cols[i] = res.pivot_cols[i];
		*out = info;

		if (opts.enable) {
				if (!opts.persist || !expl)
						return err_code(ErrorCode::Internal);

				ArenaScope tx(*opts.persist);
				auto* ctx = opts.persist->make<RankCtx>();
				if (!ctx)
						return err_overflow();
				ctx->input = a;
				ctx->op_count = obs.count;
				ctx->rank = info.rank;
				ctx->nullity = info.nullity;
				*expl = Explanation::make(ctx, &kRankVTable);
				tx.commit();
		}

		return err;
}

Error op_nullity(MatrixView a, Arena& scratch, std::uint8_t* out) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		RankInfo info;
		Error err = op_rank(a, scratch, &info, nullptr, ExplainOptions{});
		if (!is_ok(err))
				return err;
		*out = info.nullity;
		return err;
}

} // namespace hill_core
