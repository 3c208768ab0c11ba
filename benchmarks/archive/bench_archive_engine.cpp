/**
 * @file bench_archive_engine.cpp
 * @brief Benchmarks for archive compression and extraction
 */

#include <benchmark/benchmark.h>

#include <kcenon/ultracopy/archive/archive_engine.h>

#include "utils/benchmark_helpers.h"

#include <cstddef>
#include <filesystem>

namespace kcenon::ultracopy::benchmark {

namespace {

constexpr std::size_t tree_files = 64;
constexpr std::size_t tree_folders = 8;

}  // namespace

/**
 * @brief Compress a tree of text files
 * @param range(0) format, range(1) per-file size
 */
static void BM_Archive_Compress(::benchmark::State& state) {
    const auto format = static_cast<archive_format>(state.range(0));
    const auto file_size = static_cast<std::size_t>(state.range(1));

    if (!is_format_available(format)) {
        state.SkipWithError("Format not available in this build");
        return;
    }

    temp_tree_manager tree_dir("compress");
    const auto tree = tree_dir.create_tree(tree_files, file_size, tree_folders);
    const auto output = tree_dir.root() / "out.archive";

    archive_engine engine;
    archive_options options;
    options.format = format;

    double ratio = 0.0;
    for (auto _ : state) {
        auto stats = engine.compress(tree, output, options);
        if (!stats) {
            state.SkipWithError(stats.error().message.c_str());
            return;
        }
        ratio = stats.value().compression_ratio;
    }

    state.SetBytesProcessed(static_cast<int64_t>(tree_files * file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["saved_pct"] = ratio;
    state.SetLabel(to_string(format));
}

/**
 * @brief Extract an archive prepared outside the timed loop
 */
static void BM_Archive_Extract(::benchmark::State& state) {
    const auto format = static_cast<archive_format>(state.range(0));
    const auto file_size = static_cast<std::size_t>(state.range(1));

    if (!is_format_available(format)) {
        state.SkipWithError("Format not available in this build");
        return;
    }

    temp_tree_manager tree_dir("extract");
    const auto tree = tree_dir.create_tree(tree_files, file_size, tree_folders);
    const auto archive = tree_dir.root() / "in.archive";

    archive_engine engine;
    archive_options options;
    options.format = format;
    if (!engine.compress(tree, archive, options)) {
        state.SkipWithError("Failed to prepare archive");
        return;
    }

    const auto output = tree_dir.root() / "extracted";
    for (auto _ : state) {
        auto stats = engine.decompress(archive, output, format);
        if (!stats) {
            state.SkipWithError(stats.error().message.c_str());
            return;
        }

        state.PauseTiming();
        std::error_code ec;
        std::filesystem::remove_all(output, ec);
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(tree_files * file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(to_string(format));
}

static void archive_args(::benchmark::internal::Benchmark* b) {
    for (auto format : {archive_format::zip, archive_format::tar, archive_format::tar_gz,
                        archive_format::tar_lz4}) {
        for (auto size : {sizes::small_file, sizes::medium_file}) {
            b->Args({static_cast<int64_t>(format), static_cast<int64_t>(size)});
        }
    }
}

BENCHMARK(BM_Archive_Compress)->Apply(archive_args)->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_Archive_Extract)->Apply(archive_args)->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::ultracopy::benchmark
