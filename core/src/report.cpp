#include "hill_core/report.hpp"

#include "hill_core/det_detail.hpp"
#include "hill_core/detail/debug.hpp"
#include "hill_core/modular.hpp"
#include "hill_core/ops.hpp"
#include "hill_core/text.hpp"
#include "hill_core/writer.hpp"

namespace hill_core {
namespace {

// "det(K) = -2, det(K) mod 26 = 24, gcd(24, 26) = 2. rank = 2, nullity = 0. "
ErrorCode append_summary(Writer& w, const DiagnosticReport& r) noexcept {
		ErrorCode ec = ErrorCode::Ok;
		if (r.det_exact) {
				ec = w.append("det(K) = ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(r.det);
				if (!is_ok(ec))
						return ec;
				ec = w.append(", ");
				if (!is_ok(ec))
						return ec;
		}
		ec = w.append("det(K) mod ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(r.modulus);
		if (!is_ok(ec))
				return ec;
		ec = w.append(" = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_i64(r.det_mod);
		if (!is_ok(ec))
				return ec;
		ec = w.append(", gcd(");
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
		ec = w.append(". rank = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_u64(r.rank);
		if (!is_ok(ec))
				return ec;
		ec = w.append(", nullity = ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_u64(r.nullity);
		if (!is_ok(ec))
				return ec;
		return w.append(". ");
}

ErrorCode append_verdict(Writer& w, const DiagnosticReport& r) noexcept {
		ErrorCode ec = ErrorCode::Ok;
		switch (r.verdict) {
		case KeyVerdict::Valid:
				ec = w.append(tr(TextId::WhyValidGcd));
				if (!is_ok(ec))
						return ec;
				ec = w.append(" (");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(r.det_mod);
				if (!is_ok(ec))
						return ec;
				ec = w.append("^-1 = ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(r.det_inverse);
				if (!is_ok(ec))
						return ec;
				ec = w.append(" mod ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(r.modulus);
				if (!is_ok(ec))
						return ec;
				ec = w.append(") ");
				if (!is_ok(ec))
						return ec;
				return w.append(tr(TextId::WhyValidInverse));
		case KeyVerdict::SingularOverReals:
				ec = w.append(tr(TextId::WhySingular));
				if (!is_ok(ec))
						return ec;
				ec = w.append(". ");
				if (!is_ok(ec))
						return ec;
				ec = w.append(tr(TextId::WhyNullity));
				if (!is_ok(ec))
						return ec;
				ec = w.put(' ');
				if (!is_ok(ec))
						return ec;
				return w.append(tr(TextId::WhyZeroResidue));
		case KeyVerdict::NotCoprime:
				ec = w.append(tr(TextId::WhyNonzeroDet));
				if (!is_ok(ec))
						return ec;
				ec = w.append(", ");
				if (!is_ok(ec))
						return ec;
				ec = w.append(tr(TextId::WhyCommonFactor));
				if (!is_ok(ec))
						return ec;
				ec = w.append(" (");
				if (!is_ok(ec))
						return ec;
				ec = w.append_i64(r.gcd);
				if (!is_ok(ec))
						return ec;
				ec = w.append("), ");
				if (!is_ok(ec))
						return ec;
				return w.append(tr(TextId::WhyNoModInverse));
		}
		return ErrorCode::Internal;
}

// " Example: the plaintext blocks [0 0] and [13 0] both encrypt to [0 0]."
ErrorCode append_witness(Writer& w, const DiagnosticReport& r) noexcept {
		const std::uint16_t zero[kMaxDim]{};
		ErrorCode ec = w.put(' ');
		if (!is_ok(ec))
				return ec;
		ec = w.append(tr(TextId::WhyWitness));
		if (!is_ok(ec))
				return ec;
		ec = w.put(' ');
		if (!is_ok(ec))
				return ec;
		ec = w.append_block(zero, r.n);
		if (!is_ok(ec))
				return ec;
		ec = w.append(" and ");
		if (!is_ok(ec))
				return ec;
		ec = w.append_block(r.witness, r.n);
		if (!is_ok(ec))
				return ec;
		ec = w.put(' ');
		if (!is_ok(ec))
				return ec;
		ec = w.append(tr(TextId::WhyWitnessSame));
		if (!is_ok(ec))
				return ec;
		ec = w.put(' ');
		if (!is_ok(ec))
				return ec;
		ec = w.append_block(zero, r.n);
		if (!is_ok(ec))
				return ec;
		return w.put('.');
}

ErrorCode write_rationale(DiagnosticReport& r) noexcept {
		Writer w{r.rationale, sizeof(r.rationale), 0};
		w.data[0] = '\0';
		ErrorCode ec = append_summary(w, r);
		if (!is_ok(ec))
				return ec;
		ec = append_verdict(w, r);
		if (!is_ok(ec))
				return ec;
		if (r.has_witness)
				return append_witness(w, r);
		return ErrorCode::Ok;
}

} // namespace

Error op_explain(MatrixView key, std::int64_t m, Arena& scratch, DiagnosticReport* out) noexcept {
		if (!out)
				return err_code(ErrorCode::Internal);
		Error err = key_check(key, 0);
		if (!is_ok(err))
				return err;
		if (m < 2)
				return err_invalid_modulus(m);

		DiagnosticReport r;
		r.n = key.rows;
		r.modulus = m;

		detail::IntSquare k;
		ErrorCode ec = detail::int_square_from(key, &k);
		if (!is_ok(ec))
				return err_code(ec);
		ec = detail::det_exact(k, &r.det);
		if (ec == ErrorCode::Overflow)
				r.det_exact = false;
		else if (!is_ok(ec))
				return err_code(ec);
		else
				r.det_exact = true;

		RankInfo rank;
		err = op_rank(key, scratch, &rank, nullptr, ExplainOptions{});
		if (!is_ok(err))
				return err;
		r.rank = rank.rank;
		r.nullity = rank.nullity;
		r.singular = r.det_exact ? (r.det == 0) : (rank.nullity != 0);

		KeyResidue residue;
		err = op_key_residue(key, m, &residue);
		if (!is_ok(err))
				return err;
		r.det_mod = residue.det_mod;
		r.gcd = residue.gcd;
		r.key_valid = residue.valid;

		if (r.key_valid) {
				r.verdict = KeyVerdict::Valid;
				err = mod_inverse_scalar(r.det_mod, m, &r.det_inverse);
				if (!is_ok(err))
						return err;
		} else {
				r.verdict = r.singular ? KeyVerdict::SingularOverReals : KeyVerdict::NotCoprime;
#if HILL_CORE_ENABLE_WITNESS
				if (m <= kMaxModulus) {
						err = op_collision_witness(key, m, r.witness);
						if (!is_ok(err))
								return err;
						r.has_witness = true;
				}
#endif
		}

		ec = write_rationale(r);
		if (!is_ok(ec))
				return err_code(ec);

		HILL_DBG("[hill] explain n=%u m=%lld gcd=%lld valid=%d\n",
		        static_cast<unsigned>(r.n),
		        static_cast<long long>(m),
		        static_cast<long long>(r.gcd),
		        r.key_valid ? 1 : 0);
		*out = r;
		return err;
}

Error op_encrypt(const char* message, MatrixView key, const CipherConfig& cfg, Arena& scratch, EncryptionResult* out) noexcept {
		if (!message || !out)
				return err_code(ErrorCode::Internal);

		EncryptionResult res;
		Error err = op_encode(message, key, cfg, &res.encoded);
		if (!is_ok(err))
				return err;
		err = op_explain(key, cfg.modulus, scratch, &res.report);
		if (!is_ok(err))
				return err;

		Error dec = op_decode_blocks(key, cfg.modulus, res.encoded.cipher, &res.decoded);
		if (dec.code == ErrorCode::NotInvertible) {
				res.status = DecryptStatus::Impossible;
				res.decrypt_error = dec;
				*out = res;
				return err;
		}
		if (!is_ok(dec))
				return dec;

		res.status = DecryptStatus::Recovered;
		ErrorCode ec = blocks_to_text(res.decoded, cfg, res.padded_text, sizeof(res.padded_text));
		if (!is_ok(ec))
				return err_code(ec);
		ec = restore_text(res.encoded.plain, res.decoded, cfg, res.decoded_text, sizeof(res.decoded_text));
		if (!is_ok(ec))
				return err_code(ec);

		*out = res;
		return err;
}

} // namespace hill_core
