#include "rope/yarn_rope_scaling.hpp"
#include "rope/rope_scaling_registry.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <spdlog/spdlog.h>

namespace rotary_core::rope {

    double YarnRopeScaling::get_mscale(double scale, double mscale) {
        if (scale <= 1.0) {
            return 1.0;
        }
        return 0.1 * mscale * std::log(scale) + 1.0;
    }

    double YarnRopeScaling::find_correction_dim(double num_rotations, int dim, double base, int max_position_embeddings) {
        return (dim * std::log(max_position_embeddings / (num_rotations * 2.0 * std::numbers::pi))) /
               (2.0 * std::log(base));
    }

    std::pair<double, double> YarnRopeScaling::find_correction_range(
        double low_rot, double high_rot, int dim, double base, int max_position_embeddings, bool truncate
    ) {
        double low = find_correction_dim(low_rot, dim, base, max_position_embeddings);
        double high = find_correction_dim(high_rot, dim, base, max_position_embeddings);
        if (truncate) {
            low = std::floor(low);
            high = std::ceil(high);
        }
        return {std::max(low, 0.0), std::min(high, static_cast<double>(dim - 1))};
    }

    RopeFrequencies YarnRopeScaling::compute_frequencies(const RopeConfig& config, int) const {
        RopeScalingConfig scaling = config.scaling.value_or(RopeScalingConfig{.type = RopeScalingType::YARN});
        const int dim = config.head_dim;
        const double base = config.base;

        double factor = scaling.factor_value();
        int original_max = config.max_position_embeddings;
        if (scaling.original_max_position_embeddings.has_value()) {
            original_max = *scaling.original_max_position_embeddings;
            factor = static_cast<double>(config.max_position_embeddings) / original_max;
        }

        double attention_factor;
        if (scaling.attention_factor.has_value()) {
            attention_factor = *scaling.attention_factor;
        } else if (scaling.mscale.has_value() && scaling.mscale_all_dim.has_value()) {
            attention_factor = get_mscale(factor, *scaling.mscale) / get_mscale(factor, *scaling.mscale_all_dim);
        } else {
            attention_factor = get_mscale(factor);
        }

        auto [low, high] = find_correction_range(scaling.beta_fast, scaling.beta_slow, dim, base, original_max,
                                                 scaling.truncate);
        if (low == high) {
            high += 0.001; // Prevent singularity
        }

        const int half_dim = dim / 2;
        std::vector<float> inv_freq(half_dim);
        for (int i = 0; i < half_dim; ++i) {
            float pos_freq = std::pow(static_cast<float>(base), static_cast<float>(2 * i) / static_cast<float>(dim));
            float extrapolation = 1.0f / pos_freq;
            float interpolation = 1.0f / (static_cast<float>(factor) * pos_freq);

            float ramp = static_cast<float>(std::clamp((i - low) / (high - low), 0.0, 1.0));
            float extrapolation_factor = 1.0f - ramp;
            inv_freq[i] = interpolation * (1.0f - extrapolation_factor) + extrapolation * extrapolation_factor;
        }

        spdlog::debug("YarnRopeScaling: factor={} original_max={} correction_range=[{}, {}] attention_factor={}",
                      factor, original_max, low, high, attention_factor);
        return RopeFrequencies{
            .inv_freq = std::move(inv_freq),
            .attention_scaling = static_cast<float>(attention_factor)
        };
    }

    namespace {
        RopeScalingRegistrar<YarnRopeScaling> registrar(RopeScalingType::YARN);
    }

} // namespace rotary_core::rope
