#include <wordguard.hpp>
#include "common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using namespace wordguard::api;
using wordguard::common::TimeUtils;

// Benchmark configuration
struct BenchmarkConfig {
    size_t num_iterations = 200;
    size_t num_warmup_iterations = 20;
    std::vector<size_t> text_lengths = {16, 64, 256, 1024};
};

struct BenchmarkResult {
    double avg_latency_us = 0.0;
    double min_latency_us = 0.0;
    double max_latency_us = 0.0;
    double p90_latency_us = 0.0;
    double p99_latency_us = 0.0;
    double throughput = 0.0;  // Calls per second
};

// Random text with some obfuscated profanity mixed in
std::string generate_text(size_t length, std::mt19937& gen) {
    static const std::vector<std::string> words = {
        "hello", "there", "classic", "f_u_c_k", "sh1t", "bass", "caf\xC3\xA9",
        "meeting", "4ss", "document", "noon", "p\xC3\x89nis", "today"
    };
    std::uniform_int_distribution<size_t> dis(0, words.size() - 1);

    std::string text;
    while (text.size() < length) {
        if (!text.empty()) {
            text += ' ';
        }
        text += words[dis(gen)];
    }
    return text;
}

template <typename Fn>
BenchmarkResult run_benchmark(const std::vector<std::string>& inputs, Fn fn,
                              const BenchmarkConfig& config) {
    for (size_t i = 0; i < config.num_warmup_iterations; i++) {
        fn(inputs[i % inputs.size()]);
    }

    std::vector<double> latencies;
    latencies.reserve(config.num_iterations);
    for (size_t i = 0; i < config.num_iterations; i++) {
        TimeUtils::Timer timer;
        fn(inputs[i % inputs.size()]);
        latencies.push_back(timer.elapsed_us());
    }

    BenchmarkResult result;
    double total_us = std::accumulate(latencies.begin(), latencies.end(), 0.0);
    result.avg_latency_us = total_us / latencies.size();

    std::sort(latencies.begin(), latencies.end());
    result.min_latency_us = latencies.front();
    result.max_latency_us = latencies.back();
    result.p90_latency_us = latencies[static_cast<size_t>(latencies.size() * 0.9)];
    result.p99_latency_us = latencies[static_cast<size_t>(latencies.size() * 0.99)];
    result.throughput = total_us > 0.0 ? latencies.size() / (total_us / 1e6) : 0.0;
    return result;
}

void print_results(const std::string& name, size_t length, const BenchmarkResult& result) {
    std::cout << "\n" << name << " (text length " << length << ")" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Average latency: " << result.avg_latency_us << " us" << std::endl;
    std::cout << "Min latency: " << result.min_latency_us << " us" << std::endl;
    std::cout << "Max latency: " << result.max_latency_us << " us" << std::endl;
    std::cout << "P90 latency: " << result.p90_latency_us << " us" << std::endl;
    std::cout << "P99 latency: " << result.p99_latency_us << " us" << std::endl;
    std::cout << "Throughput: " << result.throughput << " calls/sec" << std::endl;
}

int main() {
    try {
        BenchmarkConfig config;
        ProfanityDetector detector;
        std::mt19937 gen(42);

        TimeUtils::Timer total;
        for (size_t length : config.text_lengths) {
            std::vector<std::string> inputs;
            for (size_t i = 0; i < 32; i++) {
                inputs.push_back(generate_text(length, gen));
            }

            auto detect = run_benchmark(inputs, [&detector](const std::string& text) {
                return detector.is_profane(text);
            }, config);
            print_results("is_profane", length, detect);

            auto censor = run_benchmark(inputs, [&detector](const std::string& text) {
                return detector.censor(text);
            }, config);
            print_results("censor", length, censor);
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double, std::milli>(total.elapsed_ms()));
        std::cout << "\nTotal time: " << TimeUtils::format_duration(elapsed) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
