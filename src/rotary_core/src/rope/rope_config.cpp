#include "rope/rope_config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rotary_core::rope {

    std::string to_string(RopeScalingType type) {
        switch (type) {
            case RopeScalingType::NONE:    return "default";
            case RopeScalingType::LINEAR:  return "linear";
            case RopeScalingType::DYNAMIC: return "dynamic";
            case RopeScalingType::YARN:    return "yarn";
            case RopeScalingType::LLAMA3:  return "llama3";
        }
        return "unknown";
    }

    RopeScalingType parse_rope_scaling_type(const std::string& name) {
        if (name == "default" || name == "none") return RopeScalingType::NONE;
        if (name == "linear") return RopeScalingType::LINEAR;
        if (name == "dynamic") return RopeScalingType::DYNAMIC;
        if (name == "yarn") return RopeScalingType::YARN;
        if (name == "llama3") return RopeScalingType::LLAMA3;
        throw RopeConfigError("Unknown rope scaling type: '" + name + "'");
    }

    void validate(const RopeConfig& config) {
        if (config.head_dim <= 0 || config.head_dim % 2 != 0) {
            throw RopeConfigError("head_dim must be a positive even number, got " + std::to_string(config.head_dim));
        }
        if (!(config.base > 0.0f)) {
            throw RopeConfigError("rope base must be positive, got " + std::to_string(config.base));
        }
        if (config.max_position_embeddings <= 0) {
            throw RopeConfigError("max_position_embeddings must be positive, got " +
                                  std::to_string(config.max_position_embeddings));
        }
        if (!config.scaling.has_value()) {
            return;
        }

        const auto& scaling = *config.scaling;
        if (!scaling.factor.has_value()) {
            if (scaling.type != RopeScalingType::NONE) {
                throw RopeConfigError("rope scaling of type '" + to_string(scaling.type) + "' requires a factor");
            }
        } else if (!(*scaling.factor > 0.0f)) {
            throw RopeConfigError("rope scaling factor must be positive, got " + std::to_string(*scaling.factor));
        }
        if (scaling.original_max_position_embeddings.has_value() && *scaling.original_max_position_embeddings <= 0) {
            throw RopeConfigError("original_max_position_embeddings must be positive");
        }
        if (scaling.type == RopeScalingType::DYNAMIC && config.head_dim <= 2) {
            throw RopeConfigError("dynamic rope scaling requires head_dim > 2");
        }
        if (scaling.type == RopeScalingType::LLAMA3) {
            if (!scaling.original_max_position_embeddings.has_value()) {
                throw RopeConfigError("llama3 rope scaling requires original_max_position_embeddings");
            }
            if (scaling.high_freq_factor == scaling.low_freq_factor) {
                throw RopeConfigError("llama3 rope scaling requires high_freq_factor != low_freq_factor");
            }
        }
    }

    namespace {

        template <typename T>
        std::optional<T> optional_number(const nlohmann::json& j, const char* key) {
            if (!j.contains(key) || j[key].is_null()) {
                return std::nullopt;
            }
            if (!j[key].is_number()) {
                throw RopeConfigError(std::string("rope_scaling field '") + key + "' must be a number");
            }
            return j[key].get<T>();
        }

    } // anonymous namespace

    std::optional<RopeScalingConfig> parse_rope_scaling(const nlohmann::json& rope_scaling_json) {
        if (rope_scaling_json.is_null()) {
            return std::nullopt;
        }
        if (!rope_scaling_json.is_object()) {
            throw RopeConfigError("rope_scaling must be an object or null");
        }

        std::string type_name;
        if (rope_scaling_json.contains("type") && rope_scaling_json["type"].is_string()) {
            type_name = rope_scaling_json["type"].get<std::string>();
        } else if (rope_scaling_json.contains("rope_type") && rope_scaling_json["rope_type"].is_string()) {
            type_name = rope_scaling_json["rope_type"].get<std::string>();
        } else {
            throw RopeConfigError("rope_scaling is missing a string 'type' (or 'rope_type') field");
        }

        RopeScalingConfig scaling;
        scaling.type = parse_rope_scaling_type(type_name);

        scaling.factor = optional_number<float>(rope_scaling_json, "factor");
        if (!scaling.factor.has_value() && scaling.type != RopeScalingType::NONE) {
            throw RopeConfigError("rope_scaling of type '" + type_name + "' requires a 'factor'");
        }
        if (scaling.factor.has_value() && !(*scaling.factor > 0.0f)) {
            throw RopeConfigError("rope_scaling factor must be positive");
        }

        scaling.original_max_position_embeddings =
            optional_number<int>(rope_scaling_json, "original_max_position_embeddings");
        scaling.attention_factor = optional_number<float>(rope_scaling_json, "attention_factor");
        scaling.mscale = optional_number<float>(rope_scaling_json, "mscale");
        scaling.mscale_all_dim = optional_number<float>(rope_scaling_json, "mscale_all_dim");
        scaling.beta_fast = optional_number<float>(rope_scaling_json, "beta_fast").value_or(scaling.beta_fast);
        scaling.beta_slow = optional_number<float>(rope_scaling_json, "beta_slow").value_or(scaling.beta_slow);
        scaling.low_freq_factor =
            optional_number<float>(rope_scaling_json, "low_freq_factor").value_or(scaling.low_freq_factor);
        scaling.high_freq_factor =
            optional_number<float>(rope_scaling_json, "high_freq_factor").value_or(scaling.high_freq_factor);
        if (rope_scaling_json.contains("truncate") && rope_scaling_json["truncate"].is_boolean()) {
            scaling.truncate = rope_scaling_json["truncate"].get<bool>();
        }

        spdlog::debug("RopeConfig: Parsed rope_scaling type='{}' factor={}", to_string(scaling.type), scaling.factor_value());
        return scaling;
    }

} // namespace rotary_core::rope
