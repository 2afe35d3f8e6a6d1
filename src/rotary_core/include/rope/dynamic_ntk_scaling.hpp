#pragma once

#include "rope/irope_scaling.hpp"

namespace rotary_core::rope {

    /**
     * @brief Dynamic NTK-aware scaling.
     *
     * Returns the base frequencies while seq_len <= max_position_embeddings. Beyond that
     * the base is stretched to
     *
     *   base' = base * ((factor * seq_len / max_pos) - (factor - 1)) ^ (head_dim / (head_dim - 2))
     *
     * and the frequencies are rederived from base'.
     */
    class DynamicNtkRopeScaling : public IRopeScaling {
    public:
        RopeFrequencies compute_frequencies(const RopeConfig& config, int seq_len) const override;
        bool extends_with_length() const noexcept override { return true; }

        static double scaled_base(const RopeConfig& config, int seq_len);
    };

} // namespace rotary_core::rope
