#include "hill_core/hill_core.hpp"

#include "test_dbg_ce.hpp"

#include <cassert>
#include <cstdint>
#include <limits>

#if defined(HILL_CE_TESTS)
#include <debug.h>
#endif

using hill_core::Arena;
using hill_core::ErrorCode;
using hill_core::KeyResidue;
using hill_core::MatrixMutView;
using hill_core::Slab;

static MatrixMutView key(Arena& a, std::uint8_t n, const std::int64_t* values) {
		MatrixMutView m;
		assert(hill_core::is_ok(hill_core::key_from_ints(a, n, values, &m)));
		return m;
}

static std::int64_t inverse(std::int64_t a, std::int64_t m) {
		std::int64_t x = 0;
		auto err = hill_core::mod_inverse_scalar(a, m, &x);
		assert(hill_core::is_ok(err));
		assert(x >= 1 && x < m);
		assert(hill_core::mod_mul(a, x, m) == 1 % m);
		return x;
}

int main() {
#if defined(HILL_CE_TESTS)
#ifdef NDEBUG
		dbg_printf("[test_modular] NDEBUG defined (asserts off)\n");
#else
		dbg_printf("[test_modular] NDEBUG not defined (asserts on)\n");
#endif
#endif

		{
				assert(hill_core::gcd_i64(24, 26) == 2);
				assert(hill_core::gcd_i64(-12, 18) == 6);
				assert(hill_core::gcd_i64(0, 26) == 26);
				assert(hill_core::gcd_i64(0, 0) == 0);

				assert(hill_core::mod_normalize(-2, 26) == 24);
				assert(hill_core::mod_normalize(52, 26) == 0);
				assert(hill_core::mod_add(25, 3, 26) == 2);
				assert(hill_core::mod_mul(-3, 9, 26) == 25);

				// 2^62 == -1 (mod 2^62 + 1), the direct product overflows
				constexpr std::int64_t kTwo62 = std::int64_t{1} << 62;
				assert(hill_core::mod_mul(kTwo62, 4, kTwo62 + 1) == kTwo62 - 3);

				assert(hill_core::smallest_prime_factor(26) == 2);
				assert(hill_core::smallest_prime_factor(9) == 3);
				assert(hill_core::smallest_prime_factor(49) == 7);
				assert(hill_core::smallest_prime_factor(13) == 13);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_modular] after gcd/mod asserts\n");
#endif

		{
				assert(inverse(9, 26) == 3);
				assert(inverse(7, 26) == 15);
				assert(inverse(-1, 26) == 25);
				assert(inverse(1, 2) == 1);
				assert(inverse(3, 65536) == 43691); // 3 * 43691 == 2 * 65536 + 1
				hill_test_ce::print_i64("9^-1 mod 26", inverse(9, 26));

				// moduli up to INT64_MAX
				constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
				constexpr std::int64_t kTwo62 = std::int64_t{1} << 62;
				assert(inverse(2, kTwo62 + 1) == (std::int64_t{1} << 61) + 1);
				assert(inverse(3, kMax) == 6148914691236517205); // (2^64 - 1) / 3
				assert(inverse(kMax - 1, kMax) == kMax - 1);

				std::int64_t x = 0;
				auto err = hill_core::mod_inverse_scalar(24, 26, &x);
				assert(err.code == ErrorCode::NotInvertible);
				assert(err.gcd == 2 && err.modulus == 26);

				err = hill_core::mod_inverse_scalar(0, 26, &x);
				assert(err.code == ErrorCode::NotInvertible);
				assert(err.gcd == 26);

				err = hill_core::mod_inverse_scalar(5, 1, &x);
				assert(err.code == ErrorCode::InvalidModulus);
				assert(err.modulus == 1);
				assert(hill_core::mod_inverse_scalar(5, 0, &x).code == ErrorCode::InvalidModulus);
				assert(hill_core::mod_inverse_scalar(5, 26, nullptr).code == ErrorCode::Internal);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_modular] after scalar inverse asserts\n");
#endif

		// key validity is gcd(det mod m, m) == 1
		{
				Slab slab;
				assert(slab.init(16 * 1024) == ErrorCode::Ok);
				Arena arena(slab.data(), slab.size());

				const std::int64_t k12[4] = {1, 2, 3, 4};
				KeyResidue r;
				assert(hill_core::is_ok(hill_core::op_key_residue(key(arena, 2, k12).view(), 26, &r)));
				assert(r.modulus == 26 && r.det_mod == 24 && r.gcd == 2 && !r.valid);

				// the same key is fine where 2 is not a factor of m
				bool valid = false;
				assert(hill_core::is_ok(hill_core::op_key_valid(key(arena, 2, k12).view(), 27, &valid)));
				assert(valid);

				const std::int64_t k33[4] = {3, 3, 2, 5};
				assert(hill_core::is_ok(hill_core::op_key_residue(key(arena, 2, k33).view(), 26, &r)));
				assert(r.det_mod == 9 && r.gcd == 1 && r.valid);

				// singular keys fail for every modulus
				const std::int64_t dep[4] = {1, 2, 2, 4};
				const MatrixMutView d = key(arena, 2, dep);
				for (std::int64_t m = 2; m <= 64; m++) {
						assert(hill_core::is_ok(hill_core::op_key_valid(d.view(), m, &valid)));
						assert(!valid);
				}

				// det overflows int64, the residue does not
				const std::int64_t huge[4] = {std::numeric_limits<std::int64_t>::max(), 0, 0, 2};
				assert(hill_core::is_ok(hill_core::op_key_residue(key(arena, 2, huge).view(), 26, &r)));
				assert(r.gcd == 2 && !r.valid);

				assert(hill_core::op_key_valid(d.view(), 1, &valid).code == ErrorCode::InvalidModulus);
				MatrixMutView ns;
				assert(hill_core::matrix_alloc(arena, 2, 3, &ns) == ErrorCode::Ok);
				assert(hill_core::op_key_valid(ns.view(), 26, &valid).code == ErrorCode::NotSquare);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_modular] after key validity asserts\n");
#endif

		return 0;
}
