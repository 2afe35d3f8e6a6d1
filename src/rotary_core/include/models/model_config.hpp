#pragma once

#include "rope/rope_config.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace rotary_core::models {

    class ConfigParseError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief The positional-encoding slice of a Hugging Face style `config.json`.
     *
     * Defaults follow a GraniteMoe configuration.
     */
    struct ModelConfig {
        std::string model_type = "granitemoe";
        int hidden_size = 4096;
        int num_attention_heads = 32;
        std::optional<int> head_dim = std::nullopt;
        int max_position_embeddings = 2048;
        float rope_theta = 10000.0f;
        std::optional<rope::RopeScalingConfig> rope_scaling = std::nullopt;

        int get_head_dim() const noexcept {
            if (head_dim.has_value()) return *head_dim;
            if (num_attention_heads == 0) return 0;
            return hidden_size / num_attention_heads;
        }

        rope::RopeConfig rope_config() const {
            return rope::RopeConfig{
                .head_dim = get_head_dim(),
                .base = rope_theta,
                .max_position_embeddings = max_position_embeddings,
                .scaling = rope_scaling
            };
        }
    };

    /**
     * @brief Builds a ModelConfig from an already parsed JSON object.
     * @throws ConfigParseError if a field has the wrong type or rope_scaling is malformed.
     */
    ModelConfig model_config_from_json(const nlohmann::json& config_json);

    /**
     * @brief Loads a ModelConfig from a model directory (reads `config.json`) or a JSON file path.
     * @throws ConfigParseError if the file cannot be opened or parsed.
     */
    ModelConfig parse_model_config(const std::string& config_path);

} // namespace rotary_core::models
