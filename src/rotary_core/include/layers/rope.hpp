#pragma once

#include "layers/rotary_embedding.hpp"
#include "rope/rope_config.hpp"
#include <mlx/mlx.h>
#include <utility>

namespace mx = mlx::core;

namespace rotary_core::layers {

    /**
     * @brief Rotates half the hidden dims: concat(-x[..., d/2:], x[..., :d/2]).
     */
    mx::array rotate_half(const mx::array& x);

    /**
     * @brief Applies precomputed rotary tables to query and key tensors.
     * @param queries Query tensor, typically [B, H, L, D].
     * @param keys Key tensor, typically [B, H_kv, L, D].
     * @param tables cos/sin of shape [B, L, D] as returned by RotaryEmbedding::forward.
     * @param unsqueeze_dim Axis inserted into cos/sin so they broadcast over the heads. Default: 1.
     * @return The rotated (queries, keys).
     */
    std::pair<mx::array, mx::array> apply_rotary_pos_emb(
        const mx::array& queries,
        const mx::array& keys,
        const RotaryTables& tables,
        int unsqueeze_dim = 1
    );

    /**
     * @brief Applies Rotary Positional Embeddings to input queries and keys.
     *
     * Uses MLX's fused rope kernel, feeding it the frequencies currently active in the
     * owned RotaryEmbedding, so every scaling policy goes through the same kernel.
     */
    class RoPE {
    public:
        /**
         * @brief Constructs a RoPE layer.
         * @param config Configuration parameters for RoPE.
         * @param traditional Rotate consecutive pairs instead of the two halves. Default: false.
         */
        explicit RoPE(const rope::RopeConfig& config, bool traditional = false);

        RoPE(const RoPE&) = delete;
        RoPE& operator=(const RoPE&) = delete;
        RoPE(RoPE&&) = delete;
        RoPE& operator=(RoPE&&) = delete;
        ~RoPE() = default;

        /**
         * @brief Applies RoPE to the input tensor.
         * @param x Input tensor (typically Queries or Keys), [..., L, head_dim].
         * @param offset Positional offset for KV cache. Default: 0.
         * @return Tensor with rotary embeddings applied.
         */
        mx::array forward(const mx::array& x, int offset = 0);
        mx::array operator()(const mx::array& x, int offset = 0) { return forward(x, offset); }

        RotaryEmbedding& embedding() noexcept { return embedding_; }

    private:
        RotaryEmbedding embedding_;
        bool traditional_;
    };

} // namespace rotary_core::layers
