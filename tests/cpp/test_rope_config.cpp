#include <gtest/gtest.h>
#include "models/model_config.hpp"
#include "rope/rope_config.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace rotary_core;
using json = nlohmann::json;

// -----------------------------------------------------------------------------
// Fixture owning a scratch directory for config files
// -----------------------------------------------------------------------------
class RopeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        scratch_dir_ = std::filesystem::temp_directory_path() /
                       ("rotary_core_config_test_" + std::to_string(stamp));
        std::filesystem::create_directories(scratch_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(scratch_dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& contents) {
        auto path = scratch_dir_ / name;
        std::ofstream out(path);
        out << contents;
        return path;
    }

    std::filesystem::path scratch_dir_;
};

// --------------------------------------------------------------------------
// rope_scaling parsing
// --------------------------------------------------------------------------
TEST_F(RopeConfigTest, NullScalingMeansNone) {
    EXPECT_FALSE(rope::parse_rope_scaling(json(nullptr)).has_value());
}

TEST_F(RopeConfigTest, ParsesTypeAndFactor) {
    auto scaling = rope::parse_rope_scaling(json{{"type", "linear"}, {"factor", 10.0}});
    ASSERT_TRUE(scaling.has_value());
    EXPECT_EQ(scaling->type, rope::RopeScalingType::LINEAR);
    EXPECT_FLOAT_EQ(scaling->factor_value(), 10.0f);
}

TEST_F(RopeConfigTest, AcceptsIntegerFactorAndRopeTypeKey) {
    auto scaling = rope::parse_rope_scaling(json{
        {"rope_type", "yarn"},
        {"factor", 4},
        {"original_max_position_embeddings", 1024},
        {"beta_fast", 16},
        {"attention_factor", 0.9},
        {"truncate", false}
    });
    ASSERT_TRUE(scaling.has_value());
    EXPECT_EQ(scaling->type, rope::RopeScalingType::YARN);
    EXPECT_FLOAT_EQ(scaling->factor_value(), 4.0f);
    EXPECT_EQ(scaling->original_max_position_embeddings, 1024);
    EXPECT_FLOAT_EQ(scaling->beta_fast, 16.0f);
    EXPECT_FLOAT_EQ(scaling->beta_slow, 1.0f);
    ASSERT_TRUE(scaling->attention_factor.has_value());
    EXPECT_FLOAT_EQ(*scaling->attention_factor, 0.9f);
    EXPECT_FALSE(scaling->truncate);
}

TEST_F(RopeConfigTest, DefaultTypeNeedsNoFactor) {
    auto scaling = rope::parse_rope_scaling(json{{"rope_type", "default"}});
    ASSERT_TRUE(scaling.has_value());
    EXPECT_EQ(scaling->type, rope::RopeScalingType::NONE);
    EXPECT_FALSE(scaling->factor.has_value());
    EXPECT_FLOAT_EQ(scaling->factor_value(), 1.0f);
}

TEST_F(RopeConfigTest, UnknownTypeIsConfigError) {
    EXPECT_THROW(rope::parse_rope_scaling(json{{"type", "ntk-by-parts"}, {"factor", 2.0}}),
                 rope::RopeConfigError);
}

TEST_F(RopeConfigTest, MissingFactorIsConfigError) {
    EXPECT_THROW(rope::parse_rope_scaling(json{{"type", "dynamic"}}), rope::RopeConfigError);
}

TEST_F(RopeConfigTest, MalformedScalingIsConfigError) {
    EXPECT_THROW(rope::parse_rope_scaling(json{{"factor", 2.0}}), rope::RopeConfigError);
    EXPECT_THROW(rope::parse_rope_scaling(json{{"type", "linear"}, {"factor", 0.0}}), rope::RopeConfigError);
    EXPECT_THROW(rope::parse_rope_scaling(json{{"type", "linear"}, {"factor", "ten"}}), rope::RopeConfigError);
    EXPECT_THROW(rope::parse_rope_scaling(json::array({1, 2})), rope::RopeConfigError);
}

TEST_F(RopeConfigTest, ScalingTypeNamesRoundTrip) {
    for (auto type : {rope::RopeScalingType::NONE, rope::RopeScalingType::LINEAR, rope::RopeScalingType::DYNAMIC,
                      rope::RopeScalingType::YARN, rope::RopeScalingType::LLAMA3}) {
        EXPECT_EQ(rope::parse_rope_scaling_type(rope::to_string(type)), type);
    }
    EXPECT_EQ(rope::parse_rope_scaling_type("none"), rope::RopeScalingType::NONE);
    EXPECT_THROW(rope::parse_rope_scaling_type("LINEAR"), rope::RopeConfigError);
}

// --------------------------------------------------------------------------
// RopeConfig validation
// --------------------------------------------------------------------------
TEST_F(RopeConfigTest, ValidateAcceptsWellFormedConfig) {
    rope::RopeConfig config{.head_dim = 64, .base = 10000.0f, .max_position_embeddings = 4096};
    EXPECT_NO_THROW(rope::validate(config));
    config.scaling = rope::RopeScalingConfig{.type = rope::RopeScalingType::DYNAMIC, .factor = 2.0f};
    EXPECT_NO_THROW(rope::validate(config));
}

TEST_F(RopeConfigTest, ValidateRejectsBadValues) {
    rope::RopeConfig config{.head_dim = 64, .base = 10000.0f, .max_position_embeddings = 4096};

    auto odd = config;
    odd.head_dim = 63;
    EXPECT_THROW(rope::validate(odd), rope::RopeConfigError);

    auto zero_dim = config;
    zero_dim.head_dim = 0;
    EXPECT_THROW(rope::validate(zero_dim), rope::RopeConfigError);

    auto no_positions = config;
    no_positions.max_position_embeddings = 0;
    EXPECT_THROW(rope::validate(no_positions), rope::RopeConfigError);

    auto zero_factor = config;
    zero_factor.scaling = rope::RopeScalingConfig{.type = rope::RopeScalingType::LINEAR, .factor = 0.0f};
    EXPECT_THROW(rope::validate(zero_factor), rope::RopeConfigError);

    // A scaling type picked without a factor, as a --scaling override on an unscaled config produces.
    auto typed_without_factor = config;
    rope::RopeScalingConfig override_scaling = typed_without_factor.scaling.value_or(rope::RopeScalingConfig{});
    override_scaling.type = rope::parse_rope_scaling_type("linear");
    typed_without_factor.scaling = override_scaling;
    EXPECT_THROW(rope::validate(typed_without_factor), rope::RopeConfigError);

    for (auto type : {rope::RopeScalingType::DYNAMIC, rope::RopeScalingType::YARN}) {
        auto missing_factor = config;
        missing_factor.scaling = rope::RopeScalingConfig{.type = type};
        EXPECT_THROW(rope::validate(missing_factor), rope::RopeConfigError) << rope::to_string(type);
    }

    auto default_without_factor = config;
    default_without_factor.scaling = rope::RopeScalingConfig{.type = rope::RopeScalingType::NONE};
    EXPECT_NO_THROW(rope::validate(default_without_factor));

    auto tiny_dynamic = config;
    tiny_dynamic.head_dim = 2;
    tiny_dynamic.scaling = rope::RopeScalingConfig{.type = rope::RopeScalingType::DYNAMIC, .factor = 2.0f};
    EXPECT_THROW(rope::validate(tiny_dynamic), rope::RopeConfigError);

    auto llama3_without_context = config;
    llama3_without_context.scaling = rope::RopeScalingConfig{.type = rope::RopeScalingType::LLAMA3, .factor = 8.0f};
    EXPECT_THROW(rope::validate(llama3_without_context), rope::RopeConfigError);
}

// --------------------------------------------------------------------------
// Model config
// --------------------------------------------------------------------------
TEST_F(RopeConfigTest, ModelConfigDerivesRopeConfig) {
    auto config = models::model_config_from_json(json{
        {"model_type", "granitemoe"},
        {"hidden_size", 32},
        {"num_attention_heads", 4},
        {"max_position_embeddings", 512},
        {"rope_theta", 10000.0},
        {"rope_scaling", {{"type", "dynamic"}, {"factor", 10.0}}}
    });

    rope::RopeConfig rope_config = config.rope_config();
    EXPECT_EQ(rope_config.head_dim, 8);
    EXPECT_FLOAT_EQ(rope_config.base, 10000.0f);
    EXPECT_EQ(rope_config.max_position_embeddings, 512);
    EXPECT_EQ(rope_config.scaling_type(), rope::RopeScalingType::DYNAMIC);
    EXPECT_FLOAT_EQ(rope_config.scaling->factor_value(), 10.0f);
}

TEST_F(RopeConfigTest, ModelConfigDefaultsAndExplicitHeadDim) {
    auto defaults = models::model_config_from_json(json::object());
    EXPECT_EQ(defaults.get_head_dim(), 128);
    EXPECT_EQ(defaults.max_position_embeddings, 2048);
    EXPECT_FALSE(defaults.rope_scaling.has_value());

    auto explicit_dim = models::model_config_from_json(json{{"hidden_size", 4096}, {"num_attention_heads", 32},
                                                            {"head_dim", 64}, {"rope_scaling", nullptr}});
    EXPECT_EQ(explicit_dim.get_head_dim(), 64);
    EXPECT_FALSE(explicit_dim.rope_scaling.has_value());
}

TEST_F(RopeConfigTest, ModelConfigRejectsWrongFieldTypes) {
    EXPECT_THROW(models::model_config_from_json(json{{"hidden_size", "large"}}), models::ConfigParseError);
    EXPECT_THROW(models::model_config_from_json(json{{"num_attention_heads", 0}}), models::ConfigParseError);
    EXPECT_THROW(models::model_config_from_json(json::array()), models::ConfigParseError);
}

TEST_F(RopeConfigTest, ModelConfigReportsScalingErrorsAsParseErrors) {
    EXPECT_THROW(models::model_config_from_json(json::parse(R"({"rope_scaling": {"type": "linear"}})")),
                 models::ConfigParseError);
    EXPECT_THROW(models::model_config_from_json(json::parse(R"({"rope_scaling": {"type": "cubic", "factor": 2.0}})")),
                 models::ConfigParseError);
    EXPECT_THROW(models::model_config_from_json(json::parse(R"({"rope_scaling": "linear"})")),
                 models::ConfigParseError);
}

TEST_F(RopeConfigTest, ParseModelConfigFromDirectoryAndFile) {
    write_file("config.json", R"({
        "model_type": "granitemoe",
        "hidden_size": 1536,
        "num_attention_heads": 24,
        "max_position_embeddings": 4096,
        "rope_theta": 10000.0,
        "rope_scaling": {"type": "linear", "factor": 2.0}
    })");

    auto from_dir = models::parse_model_config(scratch_dir_.string());
    EXPECT_EQ(from_dir.get_head_dim(), 64);
    EXPECT_EQ(from_dir.max_position_embeddings, 4096);
    ASSERT_TRUE(from_dir.rope_scaling.has_value());
    EXPECT_EQ(from_dir.rope_scaling->type, rope::RopeScalingType::LINEAR);

    auto from_file = models::parse_model_config((scratch_dir_ / "config.json").string());
    EXPECT_EQ(from_file.get_head_dim(), from_dir.get_head_dim());
}

TEST_F(RopeConfigTest, ParseModelConfigErrors) {
    EXPECT_THROW(models::parse_model_config((scratch_dir_ / "missing.json").string()), models::ConfigParseError);

    auto broken = write_file("broken.json", "{ \"hidden_size\": ");
    EXPECT_THROW(models::parse_model_config(broken.string()), models::ConfigParseError);

    auto bad_scaling = write_file("bad_scaling.json", R"({"rope_scaling": {"type": "cubic", "factor": 2}})");
    EXPECT_THROW(models::parse_model_config(bad_scaling.string()), models::ConfigParseError);
}
