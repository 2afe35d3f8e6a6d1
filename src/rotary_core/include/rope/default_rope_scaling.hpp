#pragma once

#include "rope/irope_scaling.hpp"

namespace rotary_core::rope {

    // Unscaled RoPE: base inverse frequencies, positions used as-is.
    class DefaultRopeScaling : public IRopeScaling {
    public:
        RopeFrequencies compute_frequencies(const RopeConfig& config, int seq_len) const override;
    };

} // namespace rotary_core::rope
