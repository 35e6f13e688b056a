#include "batch_scheduler.hpp"
#include "trajectory.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <thread>

// -----------------------------------------------------------------------
// Constructor: pick seed, build thread pool
// -----------------------------------------------------------------------
static uint64_t random_seed()
{
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

BatchScheduler::BatchScheduler(int n_threads)
    : BatchScheduler(n_threads, random_seed())
{
}

BatchScheduler::BatchScheduler(int n_threads, uint64_t seed)
    : seed_(seed)
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    set_thread_count(n_threads);
}

void BatchScheduler::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    std::lock_guard<std::mutex> lock(run_mtx);
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

// -----------------------------------------------------------------------
// Chunk sampler: called from thread pool workers
// -----------------------------------------------------------------------
void BatchScheduler::sample_chunk(const RenderParameters& p, const Viewport& vp,
                                  uint64_t batch, uint64_t chunk, uint64_t count,
                                  std::vector<uint32_t>& out, uint64_t& escaped) const
{
    std::seed_seq seq{
        static_cast<uint32_t>(seed_),  static_cast<uint32_t>(seed_ >> 32),
        static_cast<uint32_t>(batch),  static_cast<uint32_t>(batch >> 32),
        static_cast<uint32_t>(chunk),
    };
    std::mt19937_64 rng(seq);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    // Samples cover the visible rectangle, center +/- 2/zoom.
    const double span = 4.0 / p.zoom;

    Trajectory orbit;
    orbit.reserve(std::min<uint32_t>(p.iterations, 4096u));

    const size_t W = static_cast<size_t>(vp.width);
    for (uint64_t s = 0; s < count; ++s) {
        const ComplexPoint c{ (unit(rng) - 0.5) * span + p.center_x,
                              (unit(rng) - 0.5) * span + p.center_y };
        if (!trace_trajectory(c, p.iterations, orbit))
            continue;
        ++escaped;
        for (const ComplexPoint& z : orbit) {
            int x, y;
            if (vp.to_screen(z, x, y))
                out.push_back(static_cast<uint32_t>(static_cast<size_t>(y) * W + x));
        }
    }
}

// -----------------------------------------------------------------------
// Batch: splits samples into chunks and dispatches to thread pool
// -----------------------------------------------------------------------
static void check_viewport(const Viewport& vp)
{
    if (vp.width <= 0 || vp.height <= 0)
        throw std::invalid_argument("viewport has no pixels");
    if (!pixel_count_fits(vp.width, vp.height))
        throw std::invalid_argument("viewport exceeds the 32-bit pixel index range");
}

static void check_target(const AccumulationBuffer& buf, const Viewport& vp)
{
    check_viewport(vp);
    if (buf.width != vp.width || buf.height != vp.height ||
        buf.density.size() != vp.pixel_count())
        throw std::invalid_argument("accumulation buffer does not match the viewport");
}

BatchHits BatchScheduler::sample_batch(const RenderParameters& p, const Viewport& vp,
                                       uint64_t batch_size)
{
    check_viewport(vp);
    BatchHits hits;
    if (batch_size == 0) return hits;

    std::lock_guard<std::mutex> lock(run_mtx);
    const uint64_t batch    = next_batch++;
    const uint64_t n_chunks = (batch_size + CHUNK_SAMPLES - 1) / CHUNK_SAMPLES;

    hits.chunks.resize(static_cast<size_t>(n_chunks));
    std::vector<uint64_t> escaped(static_cast<size_t>(n_chunks), 0);

    for (uint64_t ci = 0; ci < n_chunks; ++ci) {
        const uint64_t first = ci * CHUNK_SAMPLES;
        const uint64_t count = std::min(CHUNK_SAMPLES, batch_size - first);
        std::vector<uint32_t>* out = &hits.chunks[ci];
        uint64_t*              esc = &escaped[ci];
        pool->submit([this, &p, &vp, batch, ci, count, out, esc] {
            sample_chunk(p, vp, batch, ci, count, *out, *esc);
        });
    }
    pool->wait();

    hits.processed = batch_size;
    for (uint64_t e : escaped) hits.escaped += e;
    return hits;
}

BatchResult BatchScheduler::commit(AccumulationBuffer& buf, const BatchHits& hits)
{
    BatchResult r;
    r.processed = hits.processed;
    r.escaped   = hits.escaped;
    const size_t cells = buf.density.size();
    for (const auto& chunk : hits.chunks) {
        for (uint32_t idx : chunk) {
            if (idx >= cells)
                throw std::out_of_range("hit outside the accumulation buffer");
            if (buf.increment(idx)) ++r.hits;
            else                    ++r.saturated;
        }
    }
    r.new_max_density = buf.max_density;
    return r;
}

BatchResult BatchScheduler::run_batch(AccumulationBuffer& buf, const RenderParameters& p,
                                      const Viewport& vp, uint64_t batch_size)
{
    check_target(buf, vp);
    return commit(buf, sample_batch(p, vp, batch_size));
}

uint64_t BatchScheduler::run(AccumulationBuffer& buf, const RenderParameters& p,
                             const Viewport& vp, uint64_t batch_size,
                             const BatchCallback& on_batch)
{
    check_target(buf, vp);
    if (batch_size == 0) batch_size = DEFAULT_BATCH_SIZE;
    uint64_t processed = 0;
    while (processed < p.samples) {
        const uint64_t n = std::min(batch_size, p.samples - processed);
        const BatchResult r = run_batch(buf, p, vp, n);
        if (r.processed == 0) break;
        processed += r.processed;
        if (on_batch && !on_batch(r, processed))
            break;
    }
    return processed;
}
