/**
 * @file bench_command_builder.cpp
 * @brief Benchmarks for command construction and path classification
 */

#include <benchmark/benchmark.h>

#include <kcenon/ultracopy/core/command_builder.h>
#include <kcenon/ultracopy/network/path_classifier.h>

#include <string>
#include <vector>

namespace kcenon::ultracopy::benchmark {

static auto make_request(std::size_t exclusions) -> transfer_request {
    transfer_request request;
    request.source = "C:\\Projects\\Workspace";
    request.destination = "\\\\nas\\backup\\Workspace";
    request.mode = transfer_mode::mirror;
    request.thread_count = 16;
    request.network_optimized = true;

    for (std::size_t i = 0; i < exclusions; ++i) {
        request.exclude_dirs.push_back("build_" + std::to_string(i));
        request.exclude_files.push_back("*.tmp" + std::to_string(i));
    }
    return request;
}

static void BM_BuildCommand(::benchmark::State& state) {
    const auto request = make_request(static_cast<std::size_t>(state.range(0)));
    command_options options;
    options.log_file = "C:\\logs\\copy.log";

    for (auto _ : state) {
        auto args = build_command(request, options);
        ::benchmark::DoNotOptimize(args);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_JoinCommand(::benchmark::State& state) {
    const auto args = build_command(make_request(8), command_options{});

    for (auto _ : state) {
        auto line = join_command(args);
        ::benchmark::DoNotOptimize(line);
    }
}

static void BM_ClassifyAndOptimize(::benchmark::State& state) {
    drive_table table;
    table.mapped.emplace('Z', "\\\\fileserver\\archive");
    path_classifier classifier(table);

    for (auto _ : state) {
        auto params = classifier.get_optimized_parameters("C:\\Projects", "Z:\\Projects");
        ::benchmark::DoNotOptimize(params);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_BuildCommand)->Arg(0)->Arg(16)->Arg(256);
BENCHMARK(BM_JoinCommand);
BENCHMARK(BM_ClassifyAndOptimize);

}  // namespace kcenon::ultracopy::benchmark
