#include "hill_core/ops.hpp"

#if !HILL_CORE_ENABLE_WITNESS
namespace hill_core {

Error op_collision_witness(MatrixView key, std::int64_t m, std::uint16_t* out) noexcept {
		(void)key;
		(void)m;
		(void)out;
		return err_feature_disabled();
}

} // namespace hill_core
#endif // !HILL_CORE_ENABLE_WITNESS
