#include "models/model_config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <filesystem>

namespace rotary_core::models {

    ModelConfig model_config_from_json(const nlohmann::json& config_json) {
        if (!config_json.is_object()) {
            throw ConfigParseError("Model config JSON must be an object");
        }

        ModelConfig config;

        try {
            config.model_type = config_json.value("model_type", config.model_type);
            config.hidden_size = config_json.value("hidden_size", config.hidden_size);
            config.num_attention_heads = config_json.value("num_attention_heads", config.num_attention_heads);
            config.max_position_embeddings = config_json.value("max_position_embeddings", config.max_position_embeddings);
            config.rope_theta = config_json.value("rope_theta", config.rope_theta);

            if (config_json.contains("head_dim") && config_json["head_dim"].is_number_integer()) {
                config.head_dim = config_json["head_dim"].get<int>();
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigParseError("Error parsing model config fields: " + std::string(e.what()));
        }

        // Parse optional rope_scaling dictionary
        if (config_json.contains("rope_scaling")) {
            try {
                config.rope_scaling = rope::parse_rope_scaling(config_json["rope_scaling"]);
            } catch (const rope::RopeConfigError& e) {
                throw ConfigParseError("Invalid rope_scaling: " + std::string(e.what()));
            }
        }

        if (config.num_attention_heads <= 0) {
            throw ConfigParseError("num_attention_heads must be positive");
        }

        return config;
    }

    ModelConfig parse_model_config(const std::string& config_path) {
        namespace fs = std::filesystem;
        fs::path config_file_path = config_path;
        if (fs::is_directory(config_file_path)) {
            config_file_path /= "config.json";
        }

        std::ifstream config_stream(config_file_path);
        if (!config_stream.is_open()) {
            spdlog::error("ModelConfig: Failed to open config file '{}'", config_file_path.string());
            throw ConfigParseError("Failed to open config file: " + config_file_path.string());
        }

        nlohmann::json config_json;
        try {
            config_json = nlohmann::json::parse(config_stream);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::error("ModelConfig: JSON parse error in '{}': {}", config_file_path.string(), e.what());
            throw ConfigParseError("Failed to parse config JSON: " + std::string(e.what()));
        }

        ModelConfig config = model_config_from_json(config_json);
        spdlog::info("ModelConfig: Loaded '{}' (model_type='{}', head_dim={}, max_position_embeddings={}, rope_theta={}, rope_scaling={})",
                     config_file_path.string(),
                     config.model_type,
                     config.get_head_dim(),
                     config.max_position_embeddings,
                     config.rope_theta,
                     config.rope_scaling ? rope::to_string(config.rope_scaling->type) : "none");
        return config;
    }

} // namespace rotary_core::models
