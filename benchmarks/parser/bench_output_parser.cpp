/**
 * @file bench_output_parser.cpp
 * @brief Benchmarks for parsing bulk-copy output
 *
 * The parser runs once per output line on the supervisor's worker thread,
 * so a multi-threaded copy of many small files has to be parsed faster
 * than the utility can print it.
 */

#include <benchmark/benchmark.h>

#include <kcenon/ultracopy/core/output_parser.h>
#include <kcenon/ultracopy/core/statistics_accumulator.h>

#include "utils/benchmark_helpers.h"

#include <cstddef>
#include <string>
#include <vector>

namespace kcenon::ultracopy::benchmark {

/**
 * @brief Full run output, header to summary
 */
static void BM_Parse_CopyOutput(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto lines = test_data_generator::generate_copy_output(file_count, 50, 42);

    std::size_t bytes = 0;
    for (const auto& line : lines) {
        bytes += line.size() + 1;
    }

    for (auto _ : state) {
        statistics_accumulator stats;
        stats.start();
        output_parser parser(stats);
        for (const auto& line : lines) {
            auto kind = parser.parse_line(line);
            ::benchmark::DoNotOptimize(kind);
        }
        auto snapshot = stats.snapshot();
        ::benchmark::DoNotOptimize(snapshot);
    }

    state.SetItemsProcessed(static_cast<int64_t>(lines.size()) *
                            static_cast<int64_t>(state.iterations()));
    state.SetBytesProcessed(static_cast<int64_t>(bytes) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Single file line, the hot path of a large copy
 */
static void BM_Match_FileLine(::benchmark::State& state) {
    const std::string line =
        "\t    New File  \t\t   1048576\t2024/03/15 10:22:31 C:\\Projects\\module_3\\file_42.dat";

    for (auto _ : state) {
        auto match = output_parser::match_file_line(line);
        ::benchmark::DoNotOptimize(match);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Lines that match nothing fall through every pattern
 */
static void BM_Match_UnrecognizedLine(::benchmark::State& state) {
    const std::string line = "  Options : *.* /S /E /DCOPY:DA /COPY:DAT /MT:16 /R:5 /W:10";
    statistics_accumulator stats;
    output_parser parser(stats);

    for (auto _ : state) {
        auto kind = parser.parse_line(line);
        ::benchmark::DoNotOptimize(kind);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_Match_Speed(::benchmark::State& state) {
    const std::string line = "   Speed :            7200.000 MegaBytes/min.";

    for (auto _ : state) {
        auto speed = output_parser::match_speed(line);
        ::benchmark::DoNotOptimize(speed);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Parse_CopyOutput)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Match_FileLine);
BENCHMARK(BM_Match_UnrecognizedLine);
BENCHMARK(BM_Match_Speed);

}  // namespace kcenon::ultracopy::benchmark
