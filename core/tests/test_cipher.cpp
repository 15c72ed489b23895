#include "hill_core/hill_core.hpp"

#include "test_dbg_ce.hpp"

#include <cassert>
#include <cstring>

#if defined(HILL_CE_TESTS)
#include <debug.h>
#endif

using hill_core::Arena;
using hill_core::BlockSeq;
using hill_core::CipherConfig;
using hill_core::EncodedMessage;
using hill_core::ErrorCode;
using hill_core::ExplainOptions;
using hill_core::Explanation;
using hill_core::MatrixMutView;
using hill_core::Slab;
using hill_core::StepRenderBuffers;

static MatrixMutView key(Arena& a, std::uint8_t n, const std::int64_t* values) {
		MatrixMutView m;
		assert(hill_core::is_ok(hill_core::key_from_ints(a, n, values, &m)));
		return m;
}

static BlockSeq blocks(std::uint16_t len, const std::uint16_t* values) {
		BlockSeq seq;
		seq.len = len;
		for (std::uint16_t i = 0; i < len; i++)
				seq.values[i] = values[i];
		return seq;
}

int main() {
#if defined(HILL_CE_TESTS)
#ifdef NDEBUG
		dbg_printf("[test_cipher] NDEBUG defined (asserts off)\n");
#else
		dbg_printf("[test_cipher] NDEBUG not defined (asserts on)\n");
#endif
#endif
		Slab slab;
		assert(slab.init(32 * 1024) == ErrorCode::Ok);
		Arena persist;
		Arena scratch;
		slab.split(&persist, &scratch);

		const std::int64_t k33[4] = {3, 3, 2, 5};
		const MatrixMutView k = key(persist, 2, k33);

		// block level
		{
				const std::uint16_t hi[2] = {7, 8};
				BlockSeq cipher;
				assert(hill_core::is_ok(hill_core::op_encode_blocks(k.view(), 26, blocks(2, hi), &cipher, nullptr, ExplainOptions{})));
				assert(cipher.len == 2 && cipher.values[0] == 19 && cipher.values[1] == 2);

				BlockSeq plain;
				assert(hill_core::is_ok(hill_core::op_decode_blocks(k.view(), 26, cipher, &plain)));
				assert(plain.len == 2 && plain.values[0] == 7 && plain.values[1] == 8);
				hill_test_ce::print_blocks("decoded", plain, 2);

				const std::uint16_t odd[3] = {1, 2, 3};
				auto err = hill_core::op_encode_blocks(k.view(), 26, blocks(3, odd), &cipher, nullptr, ExplainOptions{});
				assert(err.code == ErrorCode::DimensionMismatch);
				assert(err.pos == 3 && err.a.rows == 2);
				char msg[64];
				assert(hill_core::format_error(err, msg, sizeof(msg)) == ErrorCode::Ok);
				assert(std::strcmp(msg, "sequence length 3 is not a multiple of the block size 2") == 0);

				const std::uint16_t big[2] = {1, 26};
				err = hill_core::op_encode_blocks(k.view(), 26, blocks(2, big), &cipher, nullptr, ExplainOptions{});
				assert(err.code == ErrorCode::InvalidSymbol);
				assert(err.pos == 1);

				const std::uint16_t first_big[2] = {30, 0};
				err = hill_core::op_encode_blocks(k.view(), 26, blocks(2, first_big), &cipher, nullptr, ExplainOptions{});
				assert(err.code == ErrorCode::InvalidSymbol);
				assert(err.pos == 0 && err.symbol == '\0');
				assert(hill_core::format_error(err, msg, sizeof(msg)) == ErrorCode::Ok);
				assert(std::strcmp(msg, "block value out of range at index 0") == 0);

				err = hill_core::op_encode_blocks(k.view(), 1, blocks(2, hi), &cipher, nullptr, ExplainOptions{});
				assert(err.code == ErrorCode::InvalidModulus);

				// the key is checked first
				const std::int64_t dep[4] = {1, 2, 2, 4};
				err = hill_core::op_decode_blocks(key(persist, 2, dep).view(), 26, blocks(3, odd), &plain);
				assert(err.code == ErrorCode::NotInvertible);
				assert(err.gcd == 26);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_cipher] after block asserts\n");
#endif

		// one explanation step per block
		{
				const std::uint16_t hiya[4] = {7, 8, 24, 0};
				BlockSeq cipher;
				Explanation expl;
				auto err = hill_core::op_encode_blocks(
				        k.view(), 26, blocks(4, hiya), &cipher, &expl, ExplainOptions{.enable = true, .persist = &persist});
				assert(hill_core::is_ok(err));
				assert(expl.step_count() == 2);

				char caption[64];
				char latex[512];
				StepRenderBuffers bufs{caption, sizeof(caption), latex, sizeof(latex), &scratch};
				assert(expl.render_step(0, bufs) == ErrorCode::Ok);
				assert(std::strcmp(caption, "Encrypt block 1") == 0);
				assert(std::strcmp(latex,
				               "$$\\begin{bmatrix}3 & 3 \\\\ 2 & 5\\end{bmatrix}\\begin{pmatrix}7 \\\\ 8\\end{pmatrix} \\equiv "
				               "\\begin{pmatrix}19 \\\\ 2\\end{pmatrix} \\pmod{26}$$") == 0);

				// 3*24 = 72 == 20, 2*24 = 48 == 22
				assert(expl.render_step(1, bufs) == ErrorCode::Ok);
				assert(std::strcmp(caption, "Encrypt block 2") == 0);
				assert(std::strstr(latex, "\\equiv \\begin{pmatrix}20 \\\\ 22\\end{pmatrix}") != nullptr);
				hill_test_ce::print_str(latex);

				assert(expl.render_step(2, bufs) == ErrorCode::StepOutOfRange);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_cipher] after explanation asserts\n");
#endif

		// text level
		{
				EncodedMessage enc;
				assert(hill_core::is_ok(hill_core::op_encode("hi", k.view(), hill_core::kLatinConfig, &enc)));
				assert(std::strcmp(enc.text, "TC") == 0);

				char plain[hill_core::kMaxMessageLen + 1];
				assert(hill_core::is_ok(hill_core::op_decode("TC", k.view(), hill_core::kLatinConfig, plain, sizeof(plain))));
				assert(std::strcmp(plain, "HI") == 0);

				// odd length is padded with A
				assert(hill_core::is_ok(hill_core::op_encode("HELLO", k.view(), hill_core::kLatinConfig, &enc)));
				assert(enc.cipher.len == 6 && enc.plain.unpadded_len == 5);
				assert(hill_core::is_ok(hill_core::op_decode(enc.text, k.view(), hill_core::kLatinConfig, plain, sizeof(plain))));
				assert(std::strcmp(plain, "HELLOA") == 0);

				MatrixMutView good;
				assert(hill_core::is_ok(hill_core::key_preset(persist, hill_core::KeyPreset::Invertible, &good)));
				assert(hill_core::is_ok(hill_core::op_encode("ACT", good.view(), hill_core::kLatinConfig, &enc)));
				assert(std::strcmp(enc.text, "VEO") == 0);
				assert(hill_core::is_ok(hill_core::op_decode("VEO", good.view(), hill_core::kLatinConfig, plain, sizeof(plain))));
				assert(std::strcmp(plain, "ACT") == 0);

				// the space symbol is enciphered like any other
				assert(hill_core::is_ok(hill_core::op_encode("HI THERE", good.view(), hill_core::kSpacedConfig, &enc)));
				assert(enc.cipher.len == 9);
				assert(hill_core::is_ok(hill_core::op_decode(enc.text, good.view(), hill_core::kSpacedConfig, plain, sizeof(plain))));
				assert(std::strcmp(plain, "HI THERE ") == 0);
				hill_test_ce::print_str(enc.text);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_cipher] after text asserts\n");
#endif

		// a singular key collides and cannot decode
		{
				const std::int64_t dep[4] = {1, 2, 2, 4};
				const MatrixMutView d = key(persist, 2, dep);

				EncodedMessage a;
				EncodedMessage b;
				assert(hill_core::is_ok(hill_core::op_encode("AN", d.view(), hill_core::kLatinConfig, &a)));
				assert(hill_core::is_ok(hill_core::op_encode("AA", d.view(), hill_core::kLatinConfig, &b)));
				assert(std::strcmp(a.text, "AA") == 0);
				assert(std::strcmp(a.text, b.text) == 0);

				char plain[16];
				auto err = hill_core::op_decode("AA", d.view(), hill_core::kLatinConfig, plain, sizeof(plain));
				assert(err.code == ErrorCode::NotInvertible);
				assert(err.gcd == 26 && err.modulus == 26);

				// NotInvertible wins over malformed input
				err = hill_core::op_decode("##", d.view(), hill_core::kLatinConfig, plain, sizeof(plain));
				assert(err.code == ErrorCode::NotInvertible);
		}

		// input and configuration errors
		{
				char plain[16];
				auto err = hill_core::op_decode("T#", k.view(), hill_core::kLatinConfig, plain, sizeof(plain));
				assert(err.code == ErrorCode::InvalidSymbol);
				assert(err.pos == 1 && err.symbol == '#');

				err = hill_core::op_decode("TCA", k.view(), hill_core::kLatinConfig, plain, sizeof(plain));
				assert(err.code == ErrorCode::DimensionMismatch);
				assert(err.pos == 3);

				err = hill_core::op_decode("TC", k.view(), hill_core::kLatinConfig, plain, 2);
				assert(err.code == ErrorCode::BufferTooSmall);

				EncodedMessage enc;
				err = hill_core::op_encode("HI 5", k.view(), hill_core::kLatinConfig, &enc);
				assert(err.code == ErrorCode::InvalidSymbol);
				assert(err.pos == 3 && err.symbol == '5');

				CipherConfig three = hill_core::kLatinConfig;
				three.key_dim = 3;
				err = hill_core::op_encode("HI", k.view(), three, &enc);
				assert(err.code == ErrorCode::DimensionMismatch);
				assert(hill_core::is_dimension_error(err.code));

				MatrixMutView wide;
				assert(hill_core::matrix_alloc(persist, 2, 3, &wide) == ErrorCode::Ok);
				assert(hill_core::op_encode("HI", wide.view(), hill_core::kLatinConfig, &enc).code == ErrorCode::NotSquare);

				CipherConfig broken = hill_core::kLatinConfig;
				broken.modulus = 25;
				assert(hill_core::op_encode("HI", k.view(), broken, &enc).code == ErrorCode::InvalidConfig);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_cipher] after error asserts\n");
#endif

		return 0;
}
