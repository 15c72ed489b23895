#include "hill_core/cipher.hpp"

#include "hill_core/det_detail.hpp"
#include "hill_core/detail/debug.hpp"
#include "hill_core/latex.hpp"
#include "hill_core/modular.hpp"
#include "hill_core/ops.hpp"
#include "hill_core/text.hpp"
#include "hill_core/writer.hpp"

namespace hill_core {
namespace {

// out = (k v) mod m for one block of k.n values
void apply_block(const detail::IntSquare& k, std::int64_t m, const std::uint16_t* v, std::uint16_t* out) noexcept {
		for (std::uint8_t row = 0; row < k.n; row++) {
				std::int64_t acc = 0;
				for (std::uint8_t col = 0; col < k.n; col++)
						acc = mod_add(acc, mod_mul(k.at(row, col), v[col], m), m);
				out[row] = static_cast<std::uint16_t>(acc);
		}
}

Error check_blocks(const BlockSeq& seq, std::uint8_t n, std::int64_t m) noexcept {
		if (seq.len > kMaxMessageLen)
				return err_overflow();
		if (seq.len % n != 0)
				return err_length_mismatch(seq.len, n);
		for (std::uint16_t i = 0; i < seq.len; i++) {
				if (static_cast<std::int64_t>(seq.values[i]) >= m)
						return err_value_out_of_range(i);
		}
		return {};
}

void apply_blocks(const detail::IntSquare& k, std::int64_t m, const BlockSeq& in, BlockSeq* out) noexcept {
		BlockSeq res;
		res.len = in.len;
		for (std::uint16_t off = 0; off < in.len; off = static_cast<std::uint16_t>(off + k.n))
				apply_block(k, m, &in.values[off], &res.values[off]);
		*out = res;
}

struct EncodeCtx {
		MatrixView key;
		std::int64_t modulus = 0;
		BlockSeq plain;
};

std::size_t encode_step_count(const void* vctx) noexcept {
		const auto* ctx = static_cast<const EncodeCtx*>(vctx);
		if (ctx->key.rows == 0)
				return 0;
		return ctx->plain.len / ctx->key.rows;
}

// $$K \begin{pmatrix}v\end{pmatrix} \equiv \begin{pmatrix}c\end{pmatrix} \pmod{m}$$
ErrorCode encode_render_step(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto* ctx = static_cast<const EncodeCtx*>(vctx);
		if (!ctx->key.data)
				return ErrorCode::Internal;

		if (out.caption && out.caption_cap)
				out.caption[0] = '\0';
		if (out.latex && out.latex_cap)
				out.latex[0] = '\0';

		if (index >= encode_step_count(vctx))
				return ErrorCode::StepOutOfRange;

		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(ctx->key, &k);
		if (!is_ok(ec))
				return ec;

		const std::uint16_t* v = &ctx->plain.values[index * k.n];
		std::uint16_t c[kMaxDim]{};
		apply_block(k, ctx->modulus, v, c);

		if (out.caption) {
				Writer cw{out.caption, out.caption_cap, 0};
				ec = cw.append(tr(TextId::StepEncodeBlock));
				if (!is_ok(ec))
						return ec;
				ec = cw.put(' ');
				if (!is_ok(ec))
						return ec;
				ec = cw.append_u64(static_cast<std::uint64_t>(index) + 1u);
				if (!is_ok(ec))
						return ec;
		}

		Writer w{out.latex, out.latex_cap, 0};
		ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = latex::append_matrix(w, ctx->key, latex::MatrixBrackets::BMatrix);
		if (!is_ok(ec))
				return ec;
		ec = latex::append_block(w, v, k.n);
		if (!is_ok(ec))
				return ec;
		ec = w.append(" \\equiv ");
		if (!is_ok(ec))
				return ec;
		ec = latex::append_block(w, c, k.n);
		if (!is_ok(ec))
				return ec;
		ec = latex::append_pmod(w, ctx->modulus);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

constexpr ExplanationVTable kEncodeVTable = {
        .step_count = &encode_step_count,
        .render_step = &encode_render_step,
        .destroy = nullptr,
};

Error text_to_blocks(const char* text, const CipherConfig& cfg, BlockSeq* out) noexcept {
		BlockSeq seq;
		for (std::size_t i = 0; text[i] != '\0'; i++) {
				if (i >= kMaxMessageLen)
						return err_overflow();
				std::uint16_t v = 0;
				if (!is_ok(symbol_value(cfg, text[i], &v)))
						return err_invalid_symbol(static_cast<std::uint16_t>(i), text[i]);
				seq.values[seq.len++] = v;
		}
		*out = seq;
		return {};
}

} // namespace

Error op_encode_blocks(
        MatrixView key, std::int64_t m, const BlockSeq& plain, BlockSeq* out, Explanation* expl, const ExplainOptions& opts) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		Error err = key_check(key, 0);
		if (!is_ok(err))
				return err;
		if (m < 2 || m > kMaxModulus)
				return err_invalid_modulus(m);
		err = check_blocks(plain, key.rows, m);
		if (!is_ok(err))
				return err;

		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(key, &k);
		if (!is_ok(ec))
				return err_code(ec);
		apply_blocks(k, m, plain, out);

		if (opts.enable) {
				if (!opts.persist || !expl)
						return err_code(ErrorCode::Internal);

				ArenaScope tx(*opts.persist);
				auto* ctx = opts.persist->make<EncodeCtx>();
				if (!ctx)
						return err_overflow();
				ctx->key = key;
				ctx->modulus = m;
				ctx->plain = plain;
				*expl = Explanation::make(ctx, &kEncodeVTable);
				tx.commit();
		}

		return err;
}

Error op_decode_blocks(MatrixView key, std::int64_t m, const BlockSeq& cipher, BlockSeq* out) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		Error err = key_check(key, 0);
		if (!is_ok(err))
				return err;
		if (m < 2 || m > kMaxModulus)
				return err_invalid_modulus(m);

		Rational inv_data[kMaxEntries];
		MatrixMutView inv{key.rows, key.cols, key.cols, inv_data};
		err = op_mod_inverse_matrix(key, m, inv, nullptr, ExplainOptions{});
		if (!is_ok(err))
				return err;

		err = check_blocks(cipher, key.rows, m);
		if (!is_ok(err))
				return err;

		detail::IntSquare k_inv;
		ErrorCode ec = detail::int_square_from(inv.view(), &k_inv);
		if (!is_ok(ec))
				return err_code(ec);
		apply_blocks(k_inv, m, cipher, out);
		return err;
}

Error op_encode(const char* text, MatrixView key, const CipherConfig& cfg, EncodedMessage* out) noexcept {
		if (!text || !out)
				return err_code(ErrorCode::Internal);
		Error err = config_validate(cfg);
		if (!is_ok(err))
				return err;
		err = key_check(key, cfg.key_dim);
		if (!is_ok(err))
				return err;

		err = prepare_message(text, cfg, key.rows, &out->plain);
		if (!is_ok(err))
				return err;
		err = op_encode_blocks(key, cfg.modulus, out->plain.symbols, &out->cipher, nullptr, ExplainOptions{});
		if (!is_ok(err))
				return err;

		ErrorCode ec = blocks_to_text(out->cipher, cfg, out->text, sizeof(out->text));
		if (!is_ok(ec))
				return err_code(ec);
		HILL_DBG("[hill] encoded %u symbols -> %s\n", static_cast<unsigned>(out->cipher.len), out->text);
		return err;
}

Error op_decode(const char* cipher_text, MatrixView key, const CipherConfig& cfg, char* out, std::size_t cap) noexcept {
		if (!cipher_text || !out)
				return err_code(ErrorCode::Internal);
		Error err = config_validate(cfg);
		if (!is_ok(err))
				return err;
		err = key_check(key, cfg.key_dim);
		if (!is_ok(err))
				return err;

		// NotInvertible takes precedence over malformed input
		KeyResidue residue;
		err = op_key_residue(key, cfg.modulus, &residue);
		if (!is_ok(err))
				return err;
		if (!residue.valid)
				return err_not_invertible(residue.gcd, cfg.modulus);

		BlockSeq cipher;
		err = text_to_blocks(cipher_text, cfg, &cipher);
		if (!is_ok(err))
				return err;

		BlockSeq plain;
		err = op_decode_blocks(key, cfg.modulus, cipher, &plain);
		if (!is_ok(err))
				return err;

		ErrorCode ec = blocks_to_text(plain, cfg, out, cap);
		if (!is_ok(ec))
				return err_code(ec);
		return err;
}

} // namespace hill_core
