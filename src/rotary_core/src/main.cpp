#include <iostream>
#include <string>
#include <algorithm>
#include <optional>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <mlx/mlx.h>
#include "layers/rotary_embedding.hpp"
#include "models/model_config.hpp"
#include "rope/rope_config.hpp"

namespace mx = mlx::core;

void print_usage() {
    std::cout << "Usage: rope_inspect [options]\n"
              << "Options:\n"
              << "  --config PATH      Path to a model directory or its config.json\n"
              << "  --seq-len NUM      Number of positions to build tables for [default: 16]\n"
              << "  --scaling TYPE     Override rope_scaling type (default, linear, dynamic, yarn, llama3)\n"
              << "  --factor NUM       Override rope_scaling factor (required with --scaling unless the config has one)\n"
              << "  --dtype TYPE       Table precision (float32, float16, bfloat16) [default: float32]\n"
              << "  --show NUM         Number of positions to print [default: 4]\n"
              << "  --log-level LEVEL  trace, debug, info, warn, error [default: info]\n"
              << "  --help             Display this help message\n";
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_path;
    int seq_len = 16;
    int show = 4;
    std::string dtype_name = "float32";
    std::optional<std::string> scaling_override;
    std::optional<float> factor_override;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--scaling" && i + 1 < argc) {
            scaling_override = argv[++i];
        } else if (arg == "--dtype" && i + 1 < argc) {
            dtype_name = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            spdlog::set_level(spdlog::level::from_str(argv[++i]));
        } else if ((arg == "--seq-len" || arg == "--show" || arg == "--factor") && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                if (arg == "--seq-len") {
                    seq_len = std::stoi(value);
                } else if (arg == "--show") {
                    show = std::stoi(value);
                } else {
                    factor_override = std::stof(value);
                }
            } catch (const std::exception& e) {
                spdlog::error("Invalid value for {}: {}", arg, value);
                return 1;
            }
        } else {
            spdlog::error("Unknown argument: {}", arg);
            print_usage();
            return 1;
        }
    }

    if (config_path.empty()) {
        spdlog::error("No config path specified");
        print_usage();
        return 1;
    }
    if (seq_len <= 0) {
        spdlog::error("--seq-len must be positive, got {}", seq_len);
        return 1;
    }

    mx::Dtype dtype = mx::float32;
    if (dtype_name == "float16") {
        dtype = mx::float16;
    } else if (dtype_name == "bfloat16") {
        dtype = mx::bfloat16;
    } else if (dtype_name != "float32") {
        spdlog::error("Unknown dtype: {}", dtype_name);
        return 1;
    }

    try {
        rotary_core::models::ModelConfig model_config = rotary_core::models::parse_model_config(config_path);
        rotary_core::rope::RopeConfig rope_config = model_config.rope_config();

        if (scaling_override) {
            rotary_core::rope::RopeScalingConfig scaling = rope_config.scaling.value_or(rotary_core::rope::RopeScalingConfig{});
            scaling.type = rotary_core::rope::parse_rope_scaling_type(*scaling_override);
            rope_config.scaling = scaling;
        }
        if (factor_override) {
            if (!rope_config.scaling) {
                spdlog::warn("--factor given without a scaling type; it has no effect");
            } else {
                rope_config.scaling->factor = *factor_override;
            }
        }

        rotary_core::layers::RotaryEmbedding embedding(rope_config);
        mx::array position_ids = mx::expand_dims(mx::arange(seq_len), 0);
        rotary_core::layers::RotaryTables tables = embedding.forward(position_ids, dtype);

        std::cout << "model_type:              " << model_config.model_type << "\n"
                  << "head_dim:                " << rope_config.head_dim << "\n"
                  << "base:                    " << rope_config.base << "\n"
                  << "max_position_embeddings: " << rope_config.max_position_embeddings << "\n"
                  << "scaling:                 " << rotary_core::rope::to_string(rope_config.scaling_type()) << "\n"
                  << "attention_scaling:       " << embedding.attention_scaling() << "\n"
                  << "extended:                " << (embedding.is_extended() ? "yes" : "no")
                  << " (effective max " << embedding.effective_max_length() << ")\n"
                  << "inv_freq:                " << fmt::format("{}", embedding.inv_freq()) << "\n";

        mx::array cos = mx::astype(tables.cos, mx::float32);
        mx::array sin = mx::astype(tables.sin, mx::float32);
        int rows = std::min(show, seq_len);
        for (int p = 0; p < rows; ++p) {
            std::cout << "position " << p << "\n"
                      << "  cos: " << mx::slice(cos, {0, p, 0}, {1, p + 1, rope_config.head_dim}) << "\n"
                      << "  sin: " << mx::slice(sin, {0, p, 0}, {1, p + 1, rope_config.head_dim}) << "\n";
        }
    } catch (const std::exception& e) {
        spdlog::critical("rope_inspect failed: {}", e.what());
        return 1;
    }

    return 0;
}
