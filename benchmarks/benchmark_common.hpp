/**
 * @file benchmark_common.hpp
 * @brief Common utilities for shacore benchmarks with ratio comparison
 *
 * Provides unified benchmark output format with:
 * - Performance metrics (avg, min, throughput)
 * - OpenSSL vs shacore ratio comparison
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_BENCHMARK_COMMON_HPP
#define SHACORE_BENCHMARK_COMMON_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

namespace shacore_bench {

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

constexpr size_t WARMUP_ITERATIONS = 10;
constexpr size_t BENCHMARK_ITERATIONS = 100;

/**
 * @brief Benchmark result containing timing and throughput data
 */
struct BenchmarkResult {
    double avg_ms;          ///< Average time in milliseconds
    double min_ms;          ///< Minimum time in milliseconds
    double throughput;      ///< Throughput in MB/s (or op/s for fixed-size work)
    bool valid;             ///< Whether benchmark completed successfully

    BenchmarkResult() : avg_ms(0), min_ms(0), throughput(0), valid(false) {}
    BenchmarkResult(double avg, double min_t, double tp)
        : avg_ms(avg), min_ms(min_t), throughput(tp), valid(true) {}
};

/**
 * @brief Time a callable once, in milliseconds
 */
inline double time_ms(const std::function<void()>& fn) {
    auto start = Clock::now();
    fn();
    auto end = Clock::now();
    return Duration(end - start).count();
}

/**
 * @brief Throughput in MB/s for @p bytes processed in @p ms
 */
inline double calculate_throughput(size_t bytes, double ms) {
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (ms / 1000.0);
}

/**
 * @brief Run warmup plus timed iterations of a function returning ms
 *
 * A negative time from @p benchmark_func marks the run as failed.
 *
 * @param data_size Bytes processed per call; 0 reports op/s instead of MB/s
 */
inline BenchmarkResult run_benchmark_ex(
    size_t data_size,
    const std::function<double()>& benchmark_func
) {
    std::vector<double> times;
    times.reserve(BENCHMARK_ITERATIONS);

    for (size_t i = 0; i < WARMUP_ITERATIONS; ++i) {
        if (benchmark_func() < 0) return BenchmarkResult();
    }
    for (size_t i = 0; i < BENCHMARK_ITERATIONS; ++i) {
        double t = benchmark_func();
        if (t < 0) return BenchmarkResult();
        times.push_back(t);
    }

    double avg = std::accumulate(times.begin(), times.end(), 0.0) /
                 static_cast<double>(times.size());
    double min_t = *std::min_element(times.begin(), times.end());
    double tp = data_size > 0 ? calculate_throughput(data_size, avg) : 1000.0 / avg;
    return BenchmarkResult(avg, min_t, tp);
}

/**
 * @brief Print benchmark result line
 */
inline void print_result(
    const std::string& name,
    const std::string& impl,
    const BenchmarkResult& result,
    const char* unit = "MB/s"
) {
    if (!result.valid) {
        std::cout << std::left << std::setw(25) << name
                  << std::setw(15) << impl
                  << "  (benchmark failed)" << std::endl;
        return;
    }

    std::cout << std::left << std::setw(25) << name
              << std::setw(15) << impl
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << result.throughput << " " << unit
              << std::setw(10) << std::setprecision(3) << result.avg_ms << " ms"
              << std::setw(10) << result.min_ms << " ms"
              << std::endl;
}

/**
 * @brief Print ratio comparison between shacore and OpenSSL
 *
 * ratio = shacore_throughput / openssl_throughput; > 1.0 means shacore is faster.
 */
inline void print_ratio(double shacore_value, double openssl_value) {
    if (openssl_value <= 0 || shacore_value <= 0) {
        std::cout << std::left << std::setw(25) << "  ==> Ratio"
                  << std::setw(15) << ""
                  << "  (comparison not available)" << std::endl;
        return;
    }

    double ratio = shacore_value / openssl_value;
    const char* status = ratio >= 1.0 ? "FASTER" : "SLOWER";
    const char* symbol = ratio >= 1.0 ? "+" : "";
    double diff_percent = (ratio - 1.0) * 100.0;

    std::cout << std::left << std::setw(25) << "  ==> Ratio"
              << std::setw(15) << ""
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << ratio << "x"
              << "    (" << symbol << std::setprecision(1) << diff_percent << "% " << status << ")"
              << std::endl;
}

} // namespace shacore_bench

#endif // SHACORE_BENCHMARK_COMMON_HPP
