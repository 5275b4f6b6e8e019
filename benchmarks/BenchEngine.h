#pragma once

/**
 * BenchEngine.h
 *
 * Timing and reporting helpers for arbiter benchmarks.
 *
 *   - measureHook():    per-call latency of an engine hook, in nanoseconds
 *   - runThreads():     wall time of N threads released together
 *   - HitRateRow:       one policy's hit rate on one workload
 *
 * Environment variables:
 *   BENCH_SAMPLES=N     - latency samples per hook (default: 500)
 *   BENCH_PIN_CPU=N     - pin the main thread to core N before main()
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <latch>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sched.h>

namespace arbiter_bench {

using Clock = std::chrono::steady_clock;

inline void pinToCore(int core) {
    cpu_set_t mask;
    CPU_ZERO(&mask);
    CPU_SET(core, &mask);
    if (sched_setaffinity(0, sizeof(mask), &mask) != 0)
        std::fprintf(stderr, "  [bench] WARNING: failed to pin to CPU %d\n", core);
}

static const bool bench_pinned = [] {
    if (auto* env = std::getenv("BENCH_PIN_CPU")) {
        pinToCore(std::atoi(env));
        return true;
    }
    return false;
}();

template<typename T>
inline void doNotOptimize(const T& val) {
    asm volatile("" : : "r,m"(val) : "memory");
}

inline int benchSamples() {
    static const int n = [] {
        if (auto* env = std::getenv("BENCH_SAMPLES"))
            if (int v = std::atoi(env); v > 0) return v;
        return 500;
    }();
    return n;
}

// =============================================================================
// Hook latency
// =============================================================================

/// Per-call latency distribution of one hook, in nanoseconds.
struct HookLatency {
    std::string name;
    double p50_ns = 0;
    double p99_ns = 0;
    double min_ns = 0;
    double max_ns = 0;
};

/// Times `batch` consecutive calls of `fn` per sample and divides by the
/// batch, so clock overhead is amortised over calls far cheaper than it.
template<typename Fn>
HookLatency measureHook(std::string name, int batch, Fn&& fn) {
    for (int i = 0; i < batch; ++i) fn();

    std::vector<double> per_call(static_cast<size_t>(benchSamples()));
    for (auto& sample : per_call) {
        auto t0 = Clock::now();
        for (int i = 0; i < batch; ++i) fn();
        sample = std::chrono::duration<double, std::nano>(Clock::now() - t0).count() / batch;
    }

    std::sort(per_call.begin(), per_call.end());
    auto at = [&](double q) { return per_call[static_cast<size_t>(q * (per_call.size() - 1))]; };
    return {std::move(name), at(0.5), at(0.99), per_call.front(), per_call.back()};
}

inline std::string fmtNanos(double ns) {
    std::ostringstream out;
    out << std::fixed;
    if (ns < 1'000)          out << std::setprecision(0) << ns << " ns";
    else if (ns < 1'000'000) out << std::setprecision(2) << ns / 1'000 << " us";
    else                     out << std::setprecision(2) << ns / 1'000'000 << " ms";
    return out.str();
}

inline std::string formatLatencies(const std::string& title, const std::vector<HookLatency>& rows) {
    size_t width = 0;
    for (const auto& r : rows) width = std::max(width, r.name.size());
    width += 2;
    auto bar = std::string(width + 44, '-');

    std::ostringstream out;
    out << "\n  " << bar
        << "\n  " << title << "  (" << benchSamples() << " samples)"
        << "\n  " << bar
        << "\n  " << std::left << std::setw(static_cast<int>(width)) << "hook" << std::right
        << std::setw(11) << "p50" << std::setw(11) << "p99"
        << std::setw(11) << "min" << std::setw(11) << "max"
        << "\n  " << bar;
    for (const auto& r : rows) {
        out << "\n  " << std::left << std::setw(static_cast<int>(width)) << r.name << std::right
            << std::setw(11) << fmtNanos(r.p50_ns) << std::setw(11) << fmtNanos(r.p99_ns)
            << std::setw(11) << fmtNanos(r.min_ns) << std::setw(11) << fmtNanos(r.max_ns);
    }
    out << "\n  " << bar;
    return out.str();
}

// =============================================================================
// Contended throughput
// =============================================================================

/// Starts `threads` workers pinned round-robin, releases them together and
/// returns the wall time until the last one finishes. fn(thread_index).
template<typename Fn>
Clock::duration runThreads(int threads, Fn&& fn) {
    std::latch ready{threads};
    std::latch go{1};
    std::vector<std::jthread> workers;
    workers.reserve(static_cast<size_t>(threads));

    auto cores = std::max(1u, std::thread::hardware_concurrency());
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&, i] {
            pinToCore(static_cast<int>(static_cast<unsigned>(i) % cores));
            ready.count_down();
            go.wait();
            fn(i);
        });
    }

    ready.wait();
    auto t0 = Clock::now();
    go.count_down();
    for (auto& w : workers) w.join();
    return Clock::now() - t0;
}

inline std::string formatThroughput(const std::string& label, int threads, int64_t total_ops,
                                    Clock::duration elapsed, double hit_ratio) {
    auto secs = std::chrono::duration<double>(elapsed).count();
    auto ops_per_sec = secs > 0 ? static_cast<double>(total_ops) / secs : 0.0;
    auto bar = std::string(50, '-');

    std::ostringstream out;
    out << "\n  " << bar
        << "\n  " << label
        << "\n  " << bar << std::fixed
        << "\n  threads:      " << threads
        << "\n  accesses:     " << total_ops
        << "\n  wall time:    " << std::setprecision(3) << secs << " s"
        << "\n  throughput:   " << std::setprecision(2) << ops_per_sec / 1e6 << " M accesses/s"
        << "\n  hit ratio:    " << std::setprecision(1) << hit_ratio * 100 << "%"
        << "\n  " << bar;
    return out.str();
}

// =============================================================================
// Hit-rate reporting
// =============================================================================

struct HitRateRow {
    std::string policy;
    uint64_t hits = 0;
    uint64_t accesses = 0;
    double ns_per_access = 0;   // 0 when not timed
    std::string detail;         // printed indented under the row

    [[nodiscard]] double percent() const {
        return accesses > 0 ? 100.0 * static_cast<double>(hits) / static_cast<double>(accesses) : 0.0;
    }
};

/// Rows are compared against the first one, the baseline.
inline std::string formatHitRates(const std::string& title, const std::vector<HitRateRow>& rows) {
    auto bar = std::string(64, '-');
    std::ostringstream out;
    out << "\n  " << bar << "\n  " << title << "\n  " << bar << std::fixed;

    double baseline = rows.empty() ? 0.0 : rows.front().percent();
    for (const auto& r : rows) {
        out << "\n  " << std::left << std::setw(20) << r.policy << std::right
            << std::setprecision(2) << std::setw(7) << r.percent() << "%";
        if (&r != &rows.front())
            out << "  (" << std::showpos << r.percent() - baseline << std::noshowpos << " pts)";
        if (r.ns_per_access > 0) out << "  " << fmtNanos(r.ns_per_access) << "/access";
        if (!r.detail.empty()) out << "\n    " << r.detail;
    }
    out << "\n  " << bar;
    return out.str();
}

} // namespace arbiter_bench
