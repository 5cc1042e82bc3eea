/**
 * @file bench_payload_generation.cpp
 * @brief Benchmarks for random payload generation and LZ4 frame packaging
 *
 * Payload generation runs before any transfer is dispatched, so its cost
 * bounds how quickly large runs can start.
 */

#include <benchmark/benchmark.h>

#include <kcenon/sftp_stress/core/payload_generator.h>
#include <kcenon/sftp_stress/core/scratch_directory.h>

#include <cstddef>
#include <cstdint>

namespace kcenon::sftp_stress::benchmark {

/**
 * @brief Generate one artifact of a fixed size
 */
static void BM_Payload_Generate(::benchmark::State& state) {
    const auto size = static_cast<uint64_t>(state.range(0));

    auto scratch = scratch_directory::create({}, "sftp_stress_bench_");
    if (!scratch) {
        state.SkipWithError("Scratch directory creation failed");
        return;
    }

    payload_options options;
    options.min_size = size;
    options.max_size = size;
    payload_generator generator(scratch.value().path(), options);

    std::size_t index = 0;
    for (auto _ : state) {
        auto item = generator.generate(size, index++);
        if (!item) {
            state.SkipWithError("Payload generation failed");
            return;
        }
        ::benchmark::DoNotOptimize(item.value().archive_size());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Effect of the compressor feed block size
 */
static void BM_Payload_BlockSize(::benchmark::State& state) {
    constexpr uint64_t size = 16 * 1024 * 1024;

    auto scratch = scratch_directory::create({}, "sftp_stress_bench_");
    if (!scratch) {
        state.SkipWithError("Scratch directory creation failed");
        return;
    }

    payload_options options;
    options.min_size = size;
    options.max_size = size;
    options.block_size = static_cast<std::size_t>(state.range(0));
    payload_generator generator(scratch.value().path(), options);

    for (auto _ : state) {
        auto item = generator.generate(size, 0);
        if (!item) {
            state.SkipWithError("Payload generation failed");
            return;
        }
        ::benchmark::DoNotOptimize(item.value().archive_size());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Size draws alone
 */
static void BM_Payload_DrawSize(::benchmark::State& state) {
    payload_options options;
    options.seed = 42;
    payload_generator generator(".", options);

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(generator.draw_size());
    }
}

BENCHMARK(BM_Payload_Generate)
    ->Arg(6000)
    ->Arg(1024 * 1024)
    ->Arg(16 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Payload_BlockSize)
    ->Arg(64 * 1024)
    ->Arg(256 * 1024)
    ->Arg(1024 * 1024)
    ->Arg(4 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Payload_DrawSize);

}  // namespace kcenon::sftp_stress::benchmark

BENCHMARK_MAIN();
