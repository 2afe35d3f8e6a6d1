#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace rotary_core::rope {

    /**
     * @brief Context-length scaling policy applied on top of the base RoPE frequencies.
     */
    enum class RopeScalingType {
        NONE,    // Plain RoPE ("default" in config files)
        LINEAR,  // Position interpolation: position / factor
        DYNAMIC, // NTK-aware base adjustment once the sequence outgrows max_position_embeddings
        YARN,    // Ramp-blended interpolation/extrapolation plus attention temperature
        LLAMA3   // Wavelength-banded scaling used by Llama 3.1 checkpoints
    };

    class RopeConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief The `rope_scaling` block of a model configuration.
     *
     * Only `type` and `factor` apply to every policy; the remaining fields are
     * shape parameters read by yarn and llama3 and ignored otherwise. Every type
     * except NONE requires a factor.
     */
    struct RopeScalingConfig {
        RopeScalingType type = RopeScalingType::NONE;
        std::optional<float> factor = std::nullopt;

        // yarn / llama3
        std::optional<int> original_max_position_embeddings = std::nullopt;

        // yarn
        std::optional<float> attention_factor = std::nullopt;
        float beta_fast = 32.0f;
        float beta_slow = 1.0f;
        std::optional<float> mscale = std::nullopt;
        std::optional<float> mscale_all_dim = std::nullopt;
        bool truncate = true;

        // llama3
        float low_freq_factor = 1.0f;
        float high_freq_factor = 4.0f;

        float factor_value() const noexcept { return factor.value_or(1.0f); }
    };

    /**
     * @brief Immutable description of a rotary embedding.
     */
    struct RopeConfig {
        int head_dim;
        float base = 10000.0f;
        int max_position_embeddings = 2048;
        std::optional<RopeScalingConfig> scaling = std::nullopt;

        RopeScalingType scaling_type() const noexcept {
            return scaling.has_value() ? scaling->type : RopeScalingType::NONE;
        }
    };

    /**
     * @brief Canonical lowercase name of a scaling type ("default", "linear", ...).
     */
    std::string to_string(RopeScalingType type);

    /**
     * @brief Parses a scaling type name as it appears in config files.
     * @param name One of "default", "none", "linear", "dynamic", "yarn", "llama3".
     * @throws RopeConfigError if the name is not recognised.
     */
    RopeScalingType parse_rope_scaling_type(const std::string& name);

    /**
     * @brief Checks the structural invariants of a RopeConfig.
     * @throws RopeConfigError on an odd or non-positive head_dim, a non-positive base,
     *         max_position_embeddings or factor, a scaling type other than NONE without
     *         a factor, or a llama3 config missing original_max_position_embeddings.
     */
    void validate(const RopeConfig& config);

    /**
     * @brief Reads a `rope_scaling` JSON value.
     *
     * `null` or a missing value yields std::nullopt. The type is read from `type`,
     * falling back to `rope_type`. Any scaling type other than "default" must carry
     * a positive `factor`.
     *
     * @throws RopeConfigError on an unknown type, a missing or non-positive factor,
     *         or a value of the wrong JSON kind.
     */
    std::optional<RopeScalingConfig> parse_rope_scaling(const nlohmann::json& rope_scaling_json);

} // namespace rotary_core::rope
