#include "layers/rope.hpp"
#include <mlx/fast.h>
#include <mlx/ops.h>
#include <optional>
#include <vector>

namespace rotary_core::layers {

    mx::array rotate_half(const mx::array& x) {
        std::vector<mx::array> halves = mx::split(x, 2, -1);
        return mx::concatenate({mx::negative(halves[1]), halves[0]}, -1);
    }

    std::pair<mx::array, mx::array> apply_rotary_pos_emb(
        const mx::array& queries,
        const mx::array& keys,
        const RotaryTables& tables,
        int unsqueeze_dim
    ) {
        mx::array cos = mx::expand_dims(tables.cos, unsqueeze_dim);
        mx::array sin = mx::expand_dims(tables.sin, unsqueeze_dim);
        mx::array q_embed = queries * cos + rotate_half(queries) * sin;
        mx::array k_embed = keys * cos + rotate_half(keys) * sin;
        return {q_embed, k_embed};
    }

    RoPE::RoPE(const rope::RopeConfig& config, bool traditional)
        : embedding_(config),
          traditional_(traditional)
    {}

    mx::array RoPE::forward(const mx::array& x, int offset) {
        const int seq_len = offset + x.shape(-2);
        rope::RopeFrequencies freqs = embedding_.frequencies_for_length(seq_len);

        // mx::fast::rope takes periods (1 / inv_freq) through `freqs`
        std::vector<float> periods;
        periods.reserve(freqs.inv_freq.size());
        for (float inv : freqs.inv_freq) {
            periods.push_back(1.0f / inv);
        }
        mx::array periods_array(periods.begin(), {static_cast<int>(periods.size())}, mx::float32);

        mx::array input = x;
        if (freqs.attention_scaling != 1.0f) {
            input = mx::multiply(x, mx::array(freqs.attention_scaling, x.dtype()));
        }

        return mx::fast::rope(
            input,
            embedding_.config().head_dim,
            traditional_,
            std::nullopt,
            embedding_.position_scale(),
            offset,
            periods_array
        );
    }

} // namespace rotary_core::layers
