#include <benchmark/benchmark.h>
#include "layers/rope.hpp"
#include "layers/rotary_embedding.hpp"
#include "rope/rope_config.hpp"

#include <mlx/mlx.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <thread>

namespace mx = mlx::core;

namespace {

using namespace rotary_core;

constexpr int MAX_POSITIONS = 4096;
constexpr float SCALING_FACTOR = 4.0f;

const unsigned int MAX_HARDWARE_THREADS = std::max(1u, std::thread::hardware_concurrency());

// range(0): scaling type, range(1): head_dim
rope::RopeConfig make_config(const benchmark::State& state) {
    auto type = static_cast<rope::RopeScalingType>(state.range(0));
    rope::RopeConfig config{
        .head_dim = static_cast<int>(state.range(1)),
        .base = 10000.0f,
        .max_position_embeddings = MAX_POSITIONS
    };
    if (type != rope::RopeScalingType::NONE) {
        config.scaling = rope::RopeScalingConfig{
            .type = type,
            .factor = SCALING_FACTOR,
            .original_max_position_embeddings = MAX_POSITIONS / 4
        };
    }
    return config;
}

static void BM_RotaryEmbedding_Tables(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    const int seq_len = static_cast<int>(state.range(2));

    try {
        layers::RotaryEmbedding embedding(make_config(state));
        mx::array position_ids = mx::expand_dims(mx::arange(seq_len), 0);

        for (auto _ : state) {
            layers::RotaryTables tables = embedding.forward(position_ids);
            mx::eval(tables.cos, tables.sin);
        }
        state.counters["Extended"] = embedding.is_extended() ? 1 : 0;
    } catch (const std::exception& e) {
        state.SkipWithError(e.what());
        return;
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * seq_len);
}

static void BM_RotaryEmbedding_FrequenciesForLength(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    static layers::RotaryEmbedding* shared = nullptr;
    static rope::RopeConfig shared_config;

    if (state.thread_index() == 0) {
        shared_config = rope::RopeConfig{.head_dim = 128, .base = 10000.0f, .max_position_embeddings = MAX_POSITIONS};
        shared_config.scaling = rope::RopeScalingConfig{.type = rope::RopeScalingType::DYNAMIC, .factor = SCALING_FACTOR};
        shared = new layers::RotaryEmbedding(shared_config);
    }

    int length = MAX_POSITIONS + 1 + state.thread_index();
    for (auto _ : state) {
        rope::RopeFrequencies freqs = shared->frequencies_for_length(length);
        benchmark::DoNotOptimize(freqs.inv_freq.data());
        length += 1;
    }

    if (state.thread_index() == 0) {
        state.counters["EffectiveMax"] = shared->effective_max_length();
        delete shared;
        shared = nullptr;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_RoPE_FusedKernel(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    const int head_dim = static_cast<int>(state.range(1));
    const int seq_len = static_cast<int>(state.range(2));

    try {
        layers::RoPE rope_layer(make_config(state));
        mx::array queries = mx::random::normal({1, 32, seq_len, head_dim}, mx::float32, 0.0f, 1.0f, mx::random::key(0));
        mx::eval(queries);

        for (auto _ : state) {
            mx::array rotated = rope_layer(queries);
            mx::eval(rotated);
        }
    } catch (const std::exception& e) {
        state.SkipWithError(e.what());
        return;
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * seq_len);
}

static void AddScalingArgs(benchmark::internal::Benchmark* b) {
    for (auto type : {rope::RopeScalingType::NONE, rope::RopeScalingType::LINEAR, rope::RopeScalingType::DYNAMIC,
                      rope::RopeScalingType::YARN, rope::RopeScalingType::LLAMA3}) {
        for (int64_t seq_len : {512, 4096, 16384}) {
            b->Args({static_cast<int64_t>(type), 128, seq_len});
        }
    }
}

BENCHMARK(BM_RotaryEmbedding_Tables)
    ->Apply(AddScalingArgs)
    ->UseRealTime()
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_RotaryEmbedding_FrequenciesForLength)
    ->Threads(1)
    ->Threads(std::min(4u, MAX_HARDWARE_THREADS))
    ->Threads(std::min(8u, MAX_HARDWARE_THREADS))
    ->UseRealTime()
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_RoPE_FusedKernel)
    ->Apply(AddScalingArgs)
    ->UseRealTime()
    ->Unit(benchmark::kMicrosecond);

} // anonymous namespace
