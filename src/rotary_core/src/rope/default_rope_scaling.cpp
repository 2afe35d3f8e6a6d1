#include "rope/default_rope_scaling.hpp"
#include "rope/rope_scaling_registry.hpp"
#include <cmath>

namespace rotary_core::rope {

    std::vector<float> compute_default_inv_freq(int head_dim, float base) {
        std::vector<float> inv_freq;
        inv_freq.reserve(head_dim / 2);
        for (int i = 0; i < head_dim; i += 2) {
            float exponent = static_cast<float>(i) / static_cast<float>(head_dim);
            inv_freq.push_back(1.0f / std::pow(base, exponent));
        }
        return inv_freq;
    }

    RopeFrequencies DefaultRopeScaling::compute_frequencies(const RopeConfig& config, int) const {
        return RopeFrequencies{
            .inv_freq = compute_default_inv_freq(config.head_dim, config.base),
            .attention_scaling = 1.0f
        };
    }

    namespace {
        RopeScalingRegistrar<DefaultRopeScaling> registrar(RopeScalingType::NONE);
    }

} // namespace rotary_core::rope
