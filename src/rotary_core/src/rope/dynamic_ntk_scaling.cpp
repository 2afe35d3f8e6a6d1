#include "rope/dynamic_ntk_scaling.hpp"
#include "rope/rope_scaling_registry.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace rotary_core::rope {

    double DynamicNtkRopeScaling::scaled_base(const RopeConfig& config, int seq_len) {
        double factor = config.scaling.has_value() ? config.scaling->factor_value() : 1.0;
        double dim = static_cast<double>(config.head_dim);
        double ratio = (factor * seq_len / config.max_position_embeddings) - (factor - 1.0);
        return static_cast<double>(config.base) * std::pow(ratio, dim / (dim - 2.0));
    }

    RopeFrequencies DynamicNtkRopeScaling::compute_frequencies(const RopeConfig& config, int seq_len) const {
        if (seq_len <= config.max_position_embeddings) {
            return RopeFrequencies{
                .inv_freq = compute_default_inv_freq(config.head_dim, config.base),
                .attention_scaling = 1.0f
            };
        }

        double base = scaled_base(config, seq_len);
        spdlog::debug("DynamicNtkRopeScaling: seq_len={} exceeds max_position_embeddings={}, base {} -> {}",
                      seq_len, config.max_position_embeddings, config.base, base);
        return RopeFrequencies{
            .inv_freq = compute_default_inv_freq(config.head_dim, static_cast<float>(base)),
            .attention_scaling = 1.0f
        };
    }

    namespace {
        RopeScalingRegistrar<DynamicNtkRopeScaling> registrar(RopeScalingType::DYNAMIC);
    }

} // namespace rotary_core::rope
