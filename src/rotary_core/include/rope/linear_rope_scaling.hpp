#pragma once

#include "rope/irope_scaling.hpp"

namespace rotary_core::rope {

    /**
     * @brief Position interpolation.
     *
     * Frequencies are untouched; every position is divided by `factor`, so position
     * `x * factor` lands exactly where unscaled position `x` did.
     */
    class LinearRopeScaling : public IRopeScaling {
    public:
        RopeFrequencies compute_frequencies(const RopeConfig& config, int seq_len) const override;
        float position_divisor(const RopeConfig& config) const noexcept override;
    };

} // namespace rotary_core::rope
