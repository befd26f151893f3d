// Decode latency benchmark.
//
// Decodes a fixed set of representative RESP messages from memory N times each
// and prints, per message shape: total ops, elapsed time, ops/sec, and latency
// percentiles (p50, p90, p99, p999).

#include "common/logger.hpp"
#include "protocol/byte_source.hpp"
#include "protocol/decoder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <string>
#include <variant>
#include <vector>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

// ── Workload ─────────────────────────────────────────────────────────────────

struct Workload {
    const char* label;
    std::string wire;
};

std::string bulk(const std::string& s) {
    return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n";
}

std::vector<Workload> make_workloads() {
    std::vector<Workload> w;
    w.push_back({"Simple string", "+OK\r\n"});
    w.push_back({"Integer", ":-1234567890\r\n"});
    w.push_back({"Bulk string (1 KiB)", bulk(std::string(1024, 'x'))});
    w.push_back({"SET command", "*3\r\n" + bulk("SET") + bulk("user:1000") + bulk("payload")});

    // Ten levels of two-element arrays, each holding an integer and the next level.
    std::string nested;
    for (int i = 0; i < 10; ++i) {
        nested += "*2\r\n:" + std::to_string(i) + "\r\n";
    }
    nested += "+leaf\r\n";
    w.push_back({"Nested arrays (depth 10)", std::move(nested)});

    return w;
}

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    std::size_t failures{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = r.elapsed_sec > 0 ? static_cast<double>(r.total_ops) / r.elapsed_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const Workload& w, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s (%zu bytes) ──\n"
        "  Total ops:    %zu\n"
        "  Failures:     %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.3f µs\n"
        "  p50:          %.3f µs\n"
        "  p90:          %.3f µs\n"
        "  p99:          %.3f µs\n"
        "  p99.9:        %.3f µs\n",
        w.label, w.wire.size(), r.total_ops, r.failures, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// ── Benchmark runner ─────────────────────────────────────────────────────────

BenchResult bench(const Workload& w, std::size_t iterations) {
    std::vector<int64_t> latencies;
    latencies.reserve(iterations);
    std::size_t failures = 0;

    for (std::size_t i = 0; i < iterations; ++i) {
        resp::protocol::MemorySource source{w.wire};

        auto t0 = clock::now();
        auto result = resp::protocol::decode_from_stream(source);
        auto t1 = clock::now();

        if (std::holds_alternative<resp::protocol::DecodeError>(result)) {
            ++failures;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }

    auto r = compute_stats(latencies);
    r.failures = failures;
    return r;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    resp::init_default_logger(spdlog::level::warn);

    std::size_t iterations = 100'000;
    if (argc > 1) {
        iterations = static_cast<std::size_t>(std::atol(argv[1]));
        if (iterations == 0) iterations = 100'000;
    }

    fprintf(stdout,
        "RESP Decode Benchmark\n"
        "=====================\n"
        "Iterations per message: %zu\n",
        iterations);

    const auto workloads = make_workloads();

    // Warm up (prime the allocator and caches).
    for (const auto& w : workloads) {
        bench(w, 1'000);
    }

    for (const auto& w : workloads) {
        print_result(w, bench(w, iterations));
    }

    fprintf(stdout, "\n");
    return 0;
}
