#include "hill_core/ops.hpp"

#include "hill_core/det_detail.hpp"
#include "hill_core/detail/debug.hpp"
#include "hill_core/latex.hpp"
#include "hill_core/modular.hpp"
#include "hill_core/text.hpp"
#include "hill_core/writer.hpp"

namespace hill_core {
namespace {

// adj(K)[i][j] = C_{j,i} mod m
void adjugate_mod(const detail::IntSquare& k, std::int64_t m, MatrixMutView out) noexcept {
		for (std::uint8_t row = 0; row < k.n; row++) {
				for (std::uint8_t col = 0; col < k.n; col++)
						out.at_mut(row, col) = Rational::from_int(detail::cofactor_mod(k, col, row, m));
		}
}

void scale_mod(MatrixMutView a, std::int64_t s, std::int64_t m) noexcept {
		for (std::uint8_t row = 0; row < a.rows; row++) {
				for (std::uint8_t col = 0; col < a.cols; col++)
						a.at_mut(row, col) = Rational::from_int(mod_mul(a.at(row, col).num(), s, m));
		}
}

ErrorCode residue_of(const detail::IntSquare& k, std::int64_t m, KeyResidue* out) noexcept {
		if (m < 2)
				return ErrorCode::InvalidModulus;
		KeyResidue r;
		r.modulus = m;
		r.det_mod = detail::det_mod(k, m);
		r.gcd = gcd_i64(r.det_mod, m);
		r.valid = r.gcd == 1;
		*out = r;
		return ErrorCode::Ok;
}

struct ModInverseCtx {
		MatrixView input;
		KeyResidue residue;
		std::int64_t det = 0;
		bool det_exact = false; // false when det(K) does not fit int64
		std::int64_t det_inv = 0;
};

std::size_t mod_inverse_step_count(const void*) noexcept {
		// K, det, det mod m, det^-1, adj mod m, K^-1 mod m
		return 6;
}

ErrorCode write_caption(const StepRenderBuffers& out, TextId id) noexcept {
		if (!out.caption)
				return ErrorCode::Ok;
		Writer cw{out.caption, out.caption_cap, 0};
		return cw.append(tr(id));
}

ErrorCode render_det(const ModInverseCtx& ctx, Writer& w) noexcept {
		ErrorCode ec = w.append("$$\\det(K) ");
		if (!is_ok(ec))
				return ec;
		if (!ctx.det_exact) {
				ec = w.append("\\equiv ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(ctx.residue.det_mod);
				if (!is_ok(ec))
						return ec;
				ec = latex::append_pmod(w, ctx.residue.modulus);
				if (!is_ok(ec))
						return ec;
				return w.append("$$");
		}
		ec = w.append("= ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(ctx.det);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

// $$\det(K) \equiv r \pmod{m}, \quad \gcd(r, m) = g$$
ErrorCode render_residue(const ModInverseCtx& ctx, Writer& w) noexcept {
		const KeyResidue& r = ctx.residue;
		ErrorCode ec = w.append("$$\\det(K) \\equiv ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(r.det_mod);
		if (!is_ok(ec))
				return ec;
		ec = latex::append_pmod(w, r.modulus);
		if (!is_ok(ec))
				return ec;
		ec = w.append(", \\quad \\gcd(");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(r.det_mod);
		if (!is_ok(ec))
				return ec;
		ec = w.append(", ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(r.modulus);
		if (!is_ok(ec))
				return ec;
		ec = w.append(") = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(r.gcd);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

// $$r^{-1} \equiv x \pmod{m}$$
ErrorCode render_det_inverse(const ModInverseCtx& ctx, Writer& w) noexcept {
		ErrorCode ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(ctx.residue.det_mod);
		if (!is_ok(ec))
				return ec;
		ec = w.append("^{-1} \\equiv ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(ctx.det_inv);
		if (!is_ok(ec))
				return ec;
		ec = latex::append_pmod(w, ctx.residue.modulus);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

ErrorCode render_matrix_mod(const ModInverseCtx& ctx, const char* lhs, MatrixView m, Writer& w) noexcept {
		ErrorCode ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = w.append(lhs);
		if (!is_ok(ec))
				return ec;
		ec = w.append(" \\equiv ");
		if (!is_ok(ec))
				return ec;
		ec = latex::append_matrix(w, m, latex::MatrixBrackets::BMatrix);
		if (!is_ok(ec))
				return ec;
		ec = latex::append_pmod(w, ctx.residue.modulus);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

ErrorCode mod_inverse_render_step(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto* ctx = static_cast<const ModInverseCtx*>(vctx);
		if (!ctx->input.data)
				return ErrorCode::Internal;
		if (!out.scratch)
				return ErrorCode::Internal;

		if (out.caption && out.caption_cap)
				out.caption[0] = '\0';
		if (out.latex && out.latex_cap)
				out.latex[0] = '\0';

		if (index >= mod_inverse_step_count(vctx))
				return ErrorCode::StepOutOfRange;

		Writer w{out.latex, out.latex_cap, 0};
		ErrorCode ec = ErrorCode::Ok;
		switch (index) {
		case 0:
				ec = write_caption(out, TextId::StepKeyMatrix);
				if (!is_ok(ec))
						return ec;
				ec = w.append("$$K = ");
				if (!is_ok(ec))
						return ec;
				ec = latex::append_matrix(w, ctx->input, latex::MatrixBrackets::BMatrix);
				if (!is_ok(ec))
						return ec;
				return w.append("$$");
		case 1:
				ec = write_caption(out, TextId::StepDeterminant);
				if (!is_ok(ec))
						return ec;
				return render_det(*ctx, w);
		case 2:
				ec = write_caption(out, TextId::StepReduceMod);
				if (!is_ok(ec))
						return ec;
				return render_residue(*ctx, w);
		case 3:
				ec = write_caption(out, TextId::StepDetInverse);
				if (!is_ok(ec))
						return ec;
				return render_det_inverse(*ctx, w);
		default:
				break;
		}

		detail::IntSquare k;
		ec = detail::int_square_from(ctx->input, &k);
		if (!is_ok(ec))
				return ec;

		MatrixMutView m;
		ec = matrix_alloc(*out.scratch, k.n, k.n, &m);
		if (!is_ok(ec))
				return ec;
		adjugate_mod(k, ctx->residue.modulus, m);

		if (index == 4) {
				ec = write_caption(out, TextId::StepAdjugate);
				if (!is_ok(ec))
						return ec;
				return render_matrix_mod(*ctx, "\\operatorname{adj}(K)", m.view(), w);
		}

		scale_mod(m, ctx->det_inv, ctx->residue.modulus);
		ec = write_caption(out, TextId::StepInverse);
		if (!is_ok(ec))
				return ec;
		return render_matrix_mod(*ctx, "K^{-1}", m.view(), w);
}

constexpr ExplanationVTable kModInverseVTable = {
        .step_count = &mod_inverse_step_count,
        .render_step = &mod_inverse_render_step,
        .destroy = nullptr,
};

} // namespace

Error op_key_residue(MatrixView key, std::int64_t m, KeyResidue* out) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		Error err = key_check(key, 0);
		if (!is_ok(err))
				return err;
		if (m < 2)
				return err_invalid_modulus(m);

		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(key, &k);
		if (!is_ok(ec))
				return err_code(ec);
		ec = residue_of(k, m, out);
		if (!is_ok(ec))
				return err_code(ec);
		return err;
}

Error op_key_valid(MatrixView key, std::int64_t m, bool* out) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		KeyResidue r;
		Error err = op_key_residue(key, m, &r);
		if (!is_ok(err))
				return err;
		*out = r.valid;
		return err;
}

Error op_mod_inverse_matrix(MatrixView key, std::int64_t m, MatrixMutView out, Explanation* expl, const ExplainOptions& opts) noexcept {
		Error err = key_check(key, 0);
		if (!is_ok(err))
				return err;
		if (!out.data)
				return err_code(ErrorCode::Internal);
		if (!same_shape(key, out.view()))
				return err_dim_mismatch(key.dim(), out.dim());

		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(key, &k);
		if (!is_ok(ec))
				return err_code(ec);

		KeyResidue r;
		ec = residue_of(k, m, &r);
		if (!is_ok(ec))
				return err_invalid_modulus(m);

		std::int64_t det_inv = 0;
		err = mod_inverse_scalar(r.det_mod, m, &det_inv);
		if (!is_ok(err)) {
				HILL_DBG("[hill] key not invertible mod %lld (gcd %lld)\n", static_cast<long long>(m), static_cast<long long>(r.gcd));
				return err;
		}

		adjugate_mod(k, m, out);
		scale_mod(out, det_inv, m);

		if (opts.enable) {
				if (!opts.persist || !expl)
						return err_code(ErrorCode::Internal);

				ArenaScope tx(*opts.persist);
				auto* ctx = opts.persist->make<ModInverseCtx>();
				if (!ctx)
						return err_overflow();
				ctx->input = key;
				ctx->residue = r;
				ctx->det_exact = is_ok(detail::det_exact(k, &ctx->det));
				ctx->det_inv = det_inv;
				*expl = Explanation::make(ctx, &kModInverseVTable);
				tx.commit();
		}

		return err;
}

} // namespace hill_core
