#pragma once

#include "rope/irope_scaling.hpp"

namespace rotary_core::rope {

    /**
     * @brief Llama 3.1 frequency scaling.
     *
     * With old_len = original_max_position_embeddings and wavelen = 2*pi / inv_freq:
     *   wavelen > old_len / low_freq_factor  -> inv_freq / factor
     *   wavelen < old_len / high_freq_factor -> inv_freq
     *   otherwise                            -> smooth blend of the two
     */
    class Llama3RopeScaling : public IRopeScaling {
    public:
        RopeFrequencies compute_frequencies(const RopeConfig& config, int seq_len) const override;
    };

} // namespace rotary_core::rope
