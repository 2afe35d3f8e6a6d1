#pragma once

#include "rope/irope_scaling.hpp"
#include "rope/rope_config.hpp"
#include <mlx/mlx.h>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace mx = mlx::core;

namespace rotary_core::layers {

    /**
     * @brief cos/sin tables of shape position_ids.shape + [head_dim].
     */
    struct RotaryTables {
        mx::array cos;
        mx::array sin;
    };

    /**
     * @brief Computes rotary position embedding tables under a configurable scaling policy.
     *
     * The instance keeps one piece of state. Policies whose frequencies grow with the
     * sequence (dynamic NTK) move from Base to Extended the first time a call covers more
     * than max_position_embeddings positions, and never move back. While Extended, calls
     * that fit in max_position_embeddings still use the original frequencies. All other
     * policies stay in Base for their lifetime.
     *
     * Safe to call from several threads; the state transition happens under a lock.
     */
    class RotaryEmbedding {
    public:
        struct BaseState {};

        struct ExtendedState {
            int effective_max;
            std::vector<float> inv_freq;
        };

        using ExtensionState = std::variant<BaseState, ExtendedState>;

        /**
         * @brief Validates the config and computes the initial inverse frequencies.
         * @param config Rope configuration.
         * @throws rope::RopeConfigError if the config is invalid or its scaling type is not registered.
         */
        explicit RotaryEmbedding(const rope::RopeConfig& config);

        RotaryEmbedding(const RotaryEmbedding&) = delete;
        RotaryEmbedding& operator=(const RotaryEmbedding&) = delete;
        RotaryEmbedding(RotaryEmbedding&&) = delete;
        RotaryEmbedding& operator=(RotaryEmbedding&&) = delete;
        ~RotaryEmbedding() = default;

        /**
         * @brief Builds the cos/sin tables for a batch of position ids.
         * @param position_ids Integer tensor of non-negative positions, typically [batch, seq_len].
         * @param dtype Precision of the returned tables.
         * @param s Stream or device the tables are computed on.
         * @return cos and sin, each of shape position_ids.shape + [head_dim].
         * @throws std::invalid_argument if a position id is negative or too large for a
         *         sequence length to be represented as an int.
         */
        RotaryTables forward(const mx::array& position_ids,
                             mx::Dtype dtype = mx::float32,
                             mx::StreamOrDevice s = {});
        RotaryTables operator()(const mx::array& position_ids,
                                mx::Dtype dtype = mx::float32,
                                mx::StreamOrDevice s = {}) {
            return forward(position_ids, dtype, s);
        }

        /**
         * @brief Returns the frequencies that cover seq_len positions, advancing the
         *        extension state if the policy requires it.
         */
        rope::RopeFrequencies frequencies_for_length(int seq_len);

        // Positions are divided by this before meeting the frequencies (factor for linear).
        float position_divisor() const noexcept { return position_divisor_; }

        // Reciprocal of position_divisor(), the form mx::fast::rope takes.
        float position_scale() const noexcept { return 1.0f / position_divisor_; }

        float attention_scaling() const noexcept { return attention_scaling_; }

        // Most recently computed frequencies: the extended ones once Extended.
        std::vector<float> inv_freq() const;

        const std::vector<float>& original_inv_freq() const noexcept { return original_inv_freq_; }

        bool is_extended() const;

        // max_position_embeddings while Base, the longest sequence seen once Extended.
        int effective_max_length() const;

        const rope::RopeConfig& config() const noexcept { return config_; }

    private:
        rope::RopeConfig config_;
        std::unique_ptr<rope::IRopeScaling> scaling_;
        std::vector<float> original_inv_freq_;
        float attention_scaling_;
        float position_divisor_;

        mutable std::mutex state_mutex_;
        ExtensionState state_;
    };

} // namespace rotary_core::layers
