#include "hill_core/hill_core.hpp"

#include "hill_core/det_detail.hpp"

#include "test_dbg_ce.hpp"

#include <cassert>
#include <cstring>
#include <limits>
#include <utility>

#if defined(HILL_CE_TESTS)
#include <debug.h>
#endif

using hill_core::Arena;
using hill_core::ErrorCode;
using hill_core::ExplainOptions;
using hill_core::Explanation;
using hill_core::MatrixMutView;
using hill_core::Rational;
using hill_core::Slab;
using hill_core::StepRenderBuffers;

static MatrixMutView key(Arena& a, std::uint8_t n, const std::int64_t* values) {
		MatrixMutView m;
		assert(hill_core::is_ok(hill_core::key_from_ints(a, n, values, &m)));
		return m;
}

static std::int64_t det_of(Arena& a, std::uint8_t n, const std::int64_t* values) {
		std::int64_t det = 0;
		auto err = hill_core::op_det(key(a, n, values).view(), &det, nullptr, ExplainOptions{});
		assert(hill_core::is_ok(err));
		return det;
}

int main() {
#if defined(HILL_CE_TESTS)
#ifdef NDEBUG
		dbg_printf("[test_det] NDEBUG defined (asserts off)\n");
#else
		dbg_printf("[test_det] NDEBUG not defined (asserts on)\n");
#endif
#endif
		{
				Slab slab;
				assert(slab.init(64 * 1024) == ErrorCode::Ok);
				Arena persist;
				Arena scratch;
				slab.split(&persist, &scratch);

				const std::int64_t k2[4] = {1, 2, 3, 4};
				MatrixMutView a = key(persist, 2, k2);
				std::int64_t det = 0;
				Explanation expl;
				auto err = hill_core::op_det(a.view(), &det, &expl, ExplainOptions{.enable = true, .persist = &persist});
				assert(hill_core::is_ok(err));
				assert(det == -2);
				assert(expl.available());
				hill_test_ce::print_i64("det", det);

				char caption[128];
				char latex[512];
				StepRenderBuffers bufs{caption, sizeof(caption), latex, sizeof(latex), &scratch};

				// |K|, two cofactor terms, value
				const std::size_t nsteps = expl.step_count();
				assert(nsteps == 4);
				assert(expl.render_step(0, bufs) == ErrorCode::Ok);
				assert(std::strcmp(latex, "$$\\begin{vmatrix}1 & 2 \\\\ 3 & 4\\end{vmatrix}$$") == 0);
				assert(expl.render_step(1, bufs) == ErrorCode::Ok);
				assert(std::strcmp(latex, "$$a_{1,1} C_{1,1} = 1 \\cdot (4) = 4$$") == 0);
				assert(std::strcmp(caption, hill_core::tr(hill_core::TextId::StepCofactorTerm)) == 0);
				assert(expl.render_step(2, bufs) == ErrorCode::Ok);
				assert(std::strcmp(latex, "$$a_{1,2} C_{1,2} = 2 \\cdot (-3) = -6$$") == 0);
				assert(expl.render_step(3, bufs) == ErrorCode::Ok);
				assert(std::strcmp(latex, "$$\\det(K) = -2$$") == 0);
				hill_test_ce::print_str(latex);

				StepRenderBuffers tiny{nullptr, 0, latex, 8, &scratch};
				assert(expl.render_step(nsteps - 1, tiny) == ErrorCode::BufferTooSmall);
				assert(expl.render_step(nsteps, bufs) == ErrorCode::StepOutOfRange);

				Explanation moved = std::move(expl);
				assert(!expl.available());
				assert(moved.step_count() == nsteps);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_det] after det steps asserts\n");
#endif

		{
				Slab slab;
				assert(slab.init(32 * 1024) == ErrorCode::Ok);
				Arena arena(slab.data(), slab.size());

				const std::int64_t k1[1] = {5};
				assert(det_of(arena, 1, k1) == 5);

				const std::int64_t good[9] = {2, 1, 1, 1, 2, 0, 0, 1, 2};
				assert(det_of(arena, 3, good) == 7);
				const std::int64_t bad[9] = {1, 2, 3, 2, 4, 6, 0, 1, 2};
				assert(det_of(arena, 3, bad) == 0);

				const std::int64_t diag4[16] = {2, 0, 0, 0, 0, 3, 0, 0, 0, 0, 4, 0, 0, 0, 0, 5};
				assert(det_of(arena, 4, diag4) == 120);
				const std::int64_t blocks4[16] = {1, 2, 0, 0, 3, 4, 0, 0, 0, 0, 1, 1, 0, 0, 1, 2};
				assert(det_of(arena, 4, blocks4) == -2);

				// row swap of the identity
				const std::int64_t perm5[25] = {0, 1, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 1};
				assert(det_of(arena, 5, perm5) == -1);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_det] after value asserts\n");
#endif

		// shape, entry and overflow errors
		{
				Slab slab;
				assert(slab.init(32 * 1024) == ErrorCode::Ok);
				Arena arena(slab.data(), slab.size());
				std::int64_t det = 0;

				MatrixMutView ns;
				assert(hill_core::matrix_alloc(arena, 2, 3, &ns) == ErrorCode::Ok);
				auto err = hill_core::op_det(ns.view(), &det, nullptr, ExplainOptions{});
				assert(err.code == ErrorCode::NotSquare);
				assert(hill_core::is_dimension_error(err.code));
				assert(err.a.rows == 2 && err.a.cols == 3);

				MatrixMutView frac;
				assert(hill_core::matrix_alloc(arena, 2, 2, &frac) == ErrorCode::Ok);
				assert(Rational::make(1, 2, &frac.at_mut(1, 0)) == ErrorCode::Ok);
				err = hill_core::op_det(frac.view(), &det, nullptr, ExplainOptions{});
				assert(err.code == ErrorCode::NotInteger);
				assert(err.i == 1 && err.j == 0);

				Rational big[49];
				hill_core::MatrixView seven{7, 7, 7, big};
				err = hill_core::op_det(seven, &det, nullptr, ExplainOptions{});
				assert(err.code == ErrorCode::InvalidDimension);

				const std::int64_t huge[4] = {std::numeric_limits<std::int64_t>::max(), 0, 0, 2};
				err = hill_core::op_det(key(arena, 2, huge).view(), &det, nullptr, ExplainOptions{});
				assert(err.code == ErrorCode::Overflow);

				// enable without a persist arena
				const std::int64_t k2[4] = {1, 2, 3, 4};
				Explanation expl;
				err = hill_core::op_det(key(arena, 2, k2).view(), &det, &expl, ExplainOptions{.enable = true, .persist = nullptr});
				assert(err.code == ErrorCode::Internal);
				assert(!expl.available());
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_det] after error asserts\n");
#endif

		// cofactors, exact and mod m
		{
				hill_core::detail::IntSquare k;
				k.n = 3;
				const std::int64_t good[9] = {2, 1, 1, 1, 2, 0, 0, 1, 2};
				for (int i = 0; i < 9; i++)
						k.a[i] = good[i];

				std::int64_t c = 0;
				assert(hill_core::detail::cofactor_exact(k, 0, 1, &c) == ErrorCode::Ok);
				assert(c == -2);
				assert(hill_core::detail::cofactor_mod(k, 0, 1, 26) == 24);
				assert(hill_core::detail::det_mod(k, 26) == 7);
				assert(hill_core::detail::det_mod(k, 7) == 0);

				// residue survives where the exact value would overflow
				hill_core::detail::IntSquare h;
				h.n = 2;
				h.a[0] = std::numeric_limits<std::int64_t>::max();
				h.a[3] = 2;
				std::int64_t exact = 0;
				assert(hill_core::detail::det_exact(h, &exact) == ErrorCode::Overflow);
				assert(hill_core::detail::det_mod(h, 10) == 4); // ...807 * 2 mod 10
		}

		// row op captions
		{
				char buf[64];
				hill_core::RowOp op;
				op.kind = hill_core::RowOpKind::Swap;
				op.target_row = 0;
				op.source_row = 1;
				assert(hill_core::row_op_caption(op, buf, sizeof(buf)) == ErrorCode::Ok);
				assert(std::strcmp(buf, "$R_{1} <-> R_{2}$") == 0);

				op.kind = hill_core::RowOpKind::AddMul;
				op.target_row = 1;
				op.source_row = 0;
				assert(Rational::make(1, 2, &op.scalar) == ErrorCode::Ok);
				assert(hill_core::row_op_caption(op, buf, sizeof(buf)) == ErrorCode::Ok);
				assert(std::strcmp(buf, "$R_{2} \\leftarrow R_{2} + (\\frac{1}{2}) R_{1}$") == 0);

				assert(hill_core::row_op_caption(op, nullptr, 0) == ErrorCode::BufferTooSmall);
				assert(hill_core::row_op_caption(op, buf, 1) == ErrorCode::BufferTooSmall);
		}

#if defined(HILL_CE_TESTS)
		dbg_printf("[test_det] after cofactor/caption asserts\n");
#endif

		return 0;
}
