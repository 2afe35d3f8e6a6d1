#include "rope/linear_rope_scaling.hpp"
#include "rope/rope_scaling_registry.hpp"

namespace rotary_core::rope {

    RopeFrequencies LinearRopeScaling::compute_frequencies(const RopeConfig& config, int) const {
        return RopeFrequencies{
            .inv_freq = compute_default_inv_freq(config.head_dim, config.base),
            .attention_scaling = 1.0f
        };
    }

    float LinearRopeScaling::position_divisor(const RopeConfig& config) const noexcept {
        return config.scaling.has_value() ? config.scaling->factor_value() : 1.0f;
    }

    namespace {
        RopeScalingRegistrar<LinearRopeScaling> registrar(RopeScalingType::LINEAR);
    }

} // namespace rotary_core::rope
