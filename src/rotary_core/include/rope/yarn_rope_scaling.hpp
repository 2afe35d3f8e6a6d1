#pragma once

#include "rope/irope_scaling.hpp"
#include <utility>

namespace rotary_core::rope {

    /**
     * @brief YaRN scaling (https://arxiv.org/abs/2309.00071).
     *
     * Blends extrapolated frequencies (1 / pos_freq) with interpolated ones
     * (1 / (factor * pos_freq)) over a linear ramp between the correction dimensions
     * found for beta_fast and beta_slow, and returns an attention temperature that
     * multiplies the cos/sin tables. Every position is affected.
     *
     * If original_max_position_embeddings is given, the effective factor is
     * max_position_embeddings / original_max_position_embeddings.
     */
    class YarnRopeScaling : public IRopeScaling {
    public:
        RopeFrequencies compute_frequencies(const RopeConfig& config, int seq_len) const override;

        // 0.1 * mscale * ln(scale) + 1, or 1 for scale <= 1.
        static double get_mscale(double scale, double mscale = 1.0);

        static double find_correction_dim(double num_rotations, int dim, double base, int max_position_embeddings);

        // [low, high] dimension range, clamped to [0, dim - 1].
        static std::pair<double, double> find_correction_range(double low_rot, double high_rot, int dim, double base,
                                                               int max_position_embeddings, bool truncate);
    };

} // namespace rotary_core::rope
