#include "rope/llama3_rope_scaling.hpp"
#include "rope/rope_scaling_registry.hpp"
#include <numbers>

namespace rotary_core::rope {

    RopeFrequencies Llama3RopeScaling::compute_frequencies(const RopeConfig& config, int) const {
        if (!config.scaling.has_value() || !config.scaling->original_max_position_embeddings.has_value()) {
            throw RopeConfigError("llama3 rope scaling requires original_max_position_embeddings");
        }
        const auto& scaling = *config.scaling;
        const float factor = scaling.factor_value();
        const float old_context_len = static_cast<float>(*scaling.original_max_position_embeddings);
        const float low_freq_wavelen = old_context_len / scaling.low_freq_factor;
        const float high_freq_wavelen = old_context_len / scaling.high_freq_factor;

        std::vector<float> inv_freq = compute_default_inv_freq(config.head_dim, config.base);
        for (float& freq : inv_freq) {
            float wavelen = 2.0f * std::numbers::pi_v<float> / freq;
            if (wavelen < high_freq_wavelen) {
                continue;
            }
            if (wavelen > low_freq_wavelen) {
                freq = freq / factor;
                continue;
            }
            float smooth = (old_context_len / wavelen - scaling.low_freq_factor) /
                           (scaling.high_freq_factor - scaling.low_freq_factor);
            freq = (1.0f - smooth) * freq / factor + smooth * freq;
        }

        return RopeFrequencies{
            .inv_freq = std::move(inv_freq),
            .attention_scaling = 1.0f
        };
    }

    namespace {
        RopeScalingRegistrar<Llama3RopeScaling> registrar(RopeScalingType::LLAMA3);
    }

} // namespace rotary_core::rope
