#pragma once

#include "batch_scheduler.hpp"
#include "buffers.hpp"
#include "render_params.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <vector>

// Sampling throughput per thread count. Fixed seed, so every run draws the
// same samples and only the thread count varies.
inline int run_cli_benchmark(int max_threads = 0)
{
    constexpr int      W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    constexpr uint64_t SEED = 0x5eed;

    BatchScheduler detect(1, SEED);
    const int hw = max_threads > 0 ? max_threads : detect.hw_concurrency;

    struct TestCase {
        const char* label;
        uint32_t    iterations;
        uint64_t    samples;
    };

    const TestCase tests[] = {
        {"Shallow  (200 iter)",   200, 400000},
        {"Quick   (1000 iter)",  1000, 200000},
        {"Deep    (5000 iter)",  5000, 100000},
    };

    std::vector<int> counts;
    for (int n = 1; n < hw; n *= 2) counts.push_back(n);
    counts.push_back(hw);

    printf("Buddha Xplorer CLI Benchmark\n");
    printf("%dx%d, center (-0.7, 0), zoom 1, %d runs (avg best %d)\n", W, H, RUNS, BEST_N);
    printf("Hardware threads: %d\n\n", detect.hw_concurrency);
    printf("%-24s %-8s %s\n", "Label", "Threads", "Msamples/s");
    printf("------------------------------------------------\n");

    AccumulationBuffer buf;

    for (const auto& t : tests) {
        RenderParameters p;
        p.iterations = t.iterations;
        p.samples    = t.samples;

        const Viewport vp = viewport_for(p, W, H);

        for (int n : counts) {
            BatchScheduler sched(n, SEED);

            // Warm-up
            buf.resize(W, H);
            sched.run(buf, p, vp, DEFAULT_BATCH_SIZE);

            std::vector<double> times(RUNS);
            for (int r = 0; r < RUNS; ++r) {
                buf.resize(W, H);
                sched.rewind();
                const auto t0 = std::chrono::steady_clock::now();
                sched.run(buf, p, vp, DEFAULT_BATCH_SIZE);
                times[r] = std::chrono::duration<double, std::milli>(
                               std::chrono::steady_clock::now() - t0).count();
            }
            std::sort(times.begin(), times.end());
            double avg_ms = 0.0;
            for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
            avg_ms /= BEST_N;
            const double msps = static_cast<double>(t.samples) / (avg_ms * 1000.0);

            printf("%-24s %-8d %6.3f\n", t.label, n, msps);
        }
    }

    return 0;
}
