#include "layers/rotary_embedding.hpp"
#include "rope/rope_scaling_registry.hpp"
#include <mlx/ops.h>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace rotary_core::layers {

    RotaryEmbedding::RotaryEmbedding(const rope::RopeConfig& config)
        : config_(config),
          scaling_(nullptr),
          attention_scaling_(1.0f),
          position_divisor_(1.0f),
          state_(BaseState{})
    {
        rope::validate(config_);
        scaling_ = rope::RopeScalingRegistry::create_scaling(config_.scaling_type());

        rope::RopeFrequencies freqs = scaling_->compute_frequencies(config_, config_.max_position_embeddings);
        original_inv_freq_ = std::move(freqs.inv_freq);
        attention_scaling_ = freqs.attention_scaling;
        position_divisor_ = scaling_->position_divisor(config_);

        spdlog::info("RotaryEmbedding: head_dim={} base={} max_position_embeddings={} scaling='{}' factor={} attention_scaling={}",
                     config_.head_dim,
                     config_.base,
                     config_.max_position_embeddings,
                     rope::to_string(config_.scaling_type()),
                     config_.scaling ? config_.scaling->factor_value() : 1.0f,
                     attention_scaling_);
    }

    rope::RopeFrequencies RotaryEmbedding::frequencies_for_length(int seq_len) {
        std::lock_guard<std::mutex> lock(state_mutex_);

        if (!scaling_->extends_with_length() || seq_len <= config_.max_position_embeddings) {
            return rope::RopeFrequencies{
                .inv_freq = original_inv_freq_,
                .attention_scaling = attention_scaling_
            };
        }

        if (const auto* extended = std::get_if<ExtendedState>(&state_);
            extended != nullptr && seq_len <= extended->effective_max) {
            return rope::RopeFrequencies{
                .inv_freq = extended->inv_freq,
                .attention_scaling = attention_scaling_
            };
        }

        rope::RopeFrequencies freqs = scaling_->compute_frequencies(config_, seq_len);
        spdlog::debug("RotaryEmbedding: Extending frequencies to seq_len={} (max_position_embeddings={})",
                      seq_len, config_.max_position_embeddings);
        state_ = ExtendedState{
            .effective_max = seq_len,
            .inv_freq = freqs.inv_freq
        };
        return freqs;
    }

    RotaryTables RotaryEmbedding::forward(const mx::array& position_ids, mx::Dtype dtype, mx::StreamOrDevice s) {
        auto table_shape = position_ids.shape();
        table_shape.push_back(config_.head_dim);

        if (position_ids.size() == 0) {
            return RotaryTables{
                .cos = mx::zeros(table_shape, dtype, s),
                .sin = mx::zeros(table_shape, dtype, s)
            };
        }

        // Range-check in 64 bits before narrowing so large ids cannot wrap.
        mx::array wide_positions = mx::astype(position_ids, mx::int64, s);
        int64_t min_position = mx::min(wide_positions, s).item<int64_t>();
        if (min_position < 0) {
            throw std::invalid_argument("RotaryEmbedding: position ids must be non-negative, got " +
                                        std::to_string(min_position));
        }
        int64_t max_position = mx::max(wide_positions, s).item<int64_t>();
        if (max_position >= std::numeric_limits<int>::max()) {
            throw std::invalid_argument("RotaryEmbedding: position id " + std::to_string(max_position) +
                                        " is out of range");
        }
        const int seq_len = static_cast<int>(max_position) + 1;
        mx::array positions = mx::astype(wide_positions, mx::int32, s);

        rope::RopeFrequencies freqs = frequencies_for_length(seq_len);
        const int half_dim = static_cast<int>(freqs.inv_freq.size());
        mx::array inv_freq(freqs.inv_freq.begin(), {half_dim}, mx::float32);

        mx::array scaled_positions = mx::astype(positions, mx::float32, s);
        if (position_divisor_ != 1.0f) {
            scaled_positions = mx::divide(scaled_positions, mx::array(position_divisor_), s);
        }

        // [..., L, 1] * [D/2] -> [..., L, D/2], duplicated to [..., L, D]
        mx::array angles = mx::multiply(mx::expand_dims(scaled_positions, -1, s), inv_freq, s);
        mx::array emb = mx::concatenate({angles, angles}, -1, s);

        mx::array cos = mx::cos(emb, s);
        mx::array sin = mx::sin(emb, s);
        if (freqs.attention_scaling != 1.0f) {
            mx::array scale(freqs.attention_scaling);
            cos = mx::multiply(cos, scale, s);
            sin = mx::multiply(sin, scale, s);
        }

        spdlog::trace("RotaryEmbedding::forward: seq_len={} extended={}", seq_len, is_extended());
        return RotaryTables{
            .cos = mx::astype(cos, dtype, s),
            .sin = mx::astype(sin, dtype, s)
        };
    }

    std::vector<float> RotaryEmbedding::inv_freq() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (const auto* extended = std::get_if<ExtendedState>(&state_)) {
            return extended->inv_freq;
        }
        return original_inv_freq_;
    }

    bool RotaryEmbedding::is_extended() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return std::holds_alternative<ExtendedState>(state_);
    }

    int RotaryEmbedding::effective_max_length() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (const auto* extended = std::get_if<ExtendedState>(&state_)) {
            return extended->effective_max;
        }
        return config_.max_position_embeddings;
    }

} // namespace rotary_core::layers
