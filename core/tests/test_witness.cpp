#include "hill_core/hill_core.hpp"

#include "test_dbg_ce.hpp"

#include <cassert>

#if defined(HILL_CE_TESTS)
#include <debug.h>
#endif

using hill_core::Arena;
using hill_core::ErrorCode;
using hill_core::MatrixMutView;
using hill_core::MatrixView;
using hill_core::Slab;

static MatrixMutView key(Arena& a, std::uint8_t n, const std::int64_t* values) {
		MatrixMutView m;
		assert(hill_core::is_ok(hill_core::key_from_ints(a, n, values, &m)));
		return m;
}

// w != 0 and K w == 0 (mod m)
static void check_kernel(MatrixView k, const std::uint16_t* w, std::int64_t m) {
		bool nonzero = false;
		for (std::uint8_t r = 0; r < k.rows; r++) {
				assert(w[r] < m);
				nonzero = nonzero || w[r] != 0;
				std::int64_t acc = 0;
				for (std::uint8_t c = 0; c < k.rows; c++)
						acc = hill_core::mod_add(acc, hill_core::mod_mul(k.at(r, c).num(), w[c], m), m);
				assert(acc == 0);
		}
		assert(nonzero);
}

int main() {
#if defined(HILL_CE_TESTS)
#ifdef NDEBUG
		dbg_printf("[test_witness] NDEBUG defined (asserts off)\n");
#else
		dbg_printf("[test_witness] NDEBUG not defined (asserts on)\n");
#endif
#endif
		Slab slab;
		assert(slab.init(16 * 1024) == ErrorCode::Ok);
		Arena arena(slab.data(), slab.size());

		// det -2, gcd 2 with 26: kernel of K mod 2 scaled by 13
		{
				const std::int64_t k12[4] = {1, 2, 3, 4};
				MatrixMutView k = key(arena, 2, k12);
				std::uint16_t w[hill_core::kMaxDim]{};
				assert(hill_core::is_ok(hill_core::op_collision_witness(k.view(), 26, w)));
				assert(w[0] == 0 && w[1] == 13);
				check_kernel(k.view(), w, 26);
		}

		// singular over the reals
		{
				const std::int64_t dep[4] = {1, 2, 2, 4};
				MatrixMutView k = key(arena, 2, dep);
				std::uint16_t w[hill_core::kMaxDim]{};
				assert(hill_core::is_ok(hill_core::op_collision_witness(k.view(), 26, w)));
				assert(w[0] == 0 && w[1] == 13);
				check_kernel(k.view(), w, 26);

				const std::int64_t bad[9] = {1, 2, 3, 2, 4, 6, 0, 1, 2};
				MatrixMutView b = key(arena, 3, bad);
				assert(hill_core::is_ok(hill_core::op_collision_witness(b.view(), 26, w)));
				assert(w[0] == 13 && w[1] == 0 && w[2] == 13);
				check_kernel(b.view(), w, 26);
		}

		// odd prime factors and a zero first column mod p
		{
				const std::int64_t k30[4] = {3, 0, 0, 1};
				MatrixMutView k = key(arena, 2, k30);
				std::uint16_t w[hill_core::kMaxDim]{};
				assert(hill_core::is_ok(hill_core::op_collision_witness(k.view(), 27, w)));
				assert(w[0] == 9 && w[1] == 0);
				check_kernel(k.view(), w, 27);

				const std::int64_t k23[4] = {2, 0, 0, 3};
				MatrixMutView k2 = key(arena, 2, k23);
				assert(hill_core::is_ok(hill_core::op_collision_witness(k2.view(), 12, w)));
				assert(w[0] == 6 && w[1] == 0);
				check_kernel(k2.view(), w, 12);
				hill_test_ce::print_i64("w0", w[0]);
		}

		// largest block modulus
		{
				const std::int64_t k[9] = {2, 4, 6, 1, 3, 5, 7, 9, 11};
				MatrixMutView km = key(arena, 3, k);
				std::uint16_t w[hill_core::kMaxDim]{};
				assert(hill_core::is_ok(hill_core::op_collision_witness(km.view(), hill_core::kMaxModulus, w)));
				check_kernel(km.view(), w, hill_core::kMaxModulus);
		}

		{
				const std::int64_t k33[4] = {3, 3, 2, 5};
				MatrixMutView k = key(arena, 2, k33);
				std::uint16_t w[hill_core::kMaxDim]{};
				assert(hill_core::op_collision_witness(k.view(), 26, w).code == ErrorCode::KeyInvertible);
				assert(hill_core::op_collision_witness(k.view(), 1, w).code == ErrorCode::InvalidModulus);
				assert(hill_core::op_collision_witness(k.view(), hill_core::kMaxModulus + 1, w).code == ErrorCode::InvalidModulus);
				assert(hill_core::op_collision_witness(k.view(), 26, nullptr).code == ErrorCode::Internal);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_witness] after witness asserts\n");
#endif

		return 0;
}
