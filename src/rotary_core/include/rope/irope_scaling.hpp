#pragma once

#include "rope/rope_config.hpp"
#include <vector>

namespace rotary_core::rope {

    /**
     * @brief Inverse frequencies plus the multiplier applied to the resulting cos/sin tables.
     */
    struct RopeFrequencies {
        std::vector<float> inv_freq;
        float attention_scaling = 1.0f;
    };

    // Abstract base class for all RoPE scaling policies.
    class IRopeScaling {
    public:
        virtual ~IRopeScaling() = default;

        /**
         * @brief Computes the inverse-frequency vector for a given sequence length.
         * @param config The (validated) rope configuration.
         * @param seq_len Sequence length the frequencies must cover. Policies that do not
         *        depend on the length ignore it.
         */
        virtual RopeFrequencies compute_frequencies(const RopeConfig& config, int seq_len) const = 0;

        // Positions are divided by this before meeting the frequencies.
        virtual float position_divisor(const RopeConfig&) const noexcept { return 1.0f; }

        // True if compute_frequencies must be re-run once seq_len exceeds max_position_embeddings.
        virtual bool extends_with_length() const noexcept { return false; }
    };

    /**
     * @brief inv_freq[i] = 1 / base^(2i / head_dim) for i in [0, head_dim / 2).
     */
    std::vector<float> compute_default_inv_freq(int head_dim, float base);

} // namespace rotary_core::rope
