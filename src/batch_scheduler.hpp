#pragma once

#include "buffers.hpp"
#include "render_params.hpp"
#include "thread_pool.hpp"
#include "viewport.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

static constexpr uint64_t DEFAULT_BATCH_SIZE = 10000;

// Samples per parallel work item. Fixed, so a batch splits into the same
// random streams whatever the thread count.
static constexpr uint64_t CHUNK_SAMPLES = 1024;

struct BatchResult {
    uint64_t processed       = 0;  // samples drawn
    uint64_t escaped         = 0;  // samples whose orbit escaped
    uint64_t hits            = 0;  // orbit points counted into the buffer
    uint64_t saturated       = 0;  // in-range points dropped at DENSITY_CEILING
    float    new_max_density = 0.0f;
};

// A sampled batch whose hits have not been written yet. Pixel indices are
// kept per chunk and committed in chunk order.
struct BatchHits {
    std::vector<std::vector<uint32_t>> chunks;
    uint64_t processed = 0;
    uint64_t escaped   = 0;
};

class BatchScheduler {
public:
    // n_threads <= 0 uses the hardware concurrency. Without a seed one is
    // drawn from std::random_device.
    explicit BatchScheduler(int n_threads = 0);
    BatchScheduler(int n_threads, uint64_t seed);

    int thread_count   = 0;
    int hw_concurrency = 0;   // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    uint64_t seed() const { return seed_; }

    // Restart the random streams from batch 0 (same seed, same samples).
    void rewind() { next_batch = 0; }

    // Draw and trace batch_size samples on the pool. Touches no buffer.
    // Throws std::invalid_argument for a viewport with no pixels or more
    // than MAX_PIXELS.
    BatchHits sample_batch(const RenderParameters& p, const Viewport& vp,
                           uint64_t batch_size);

    // Write sampled hits into `buf`, which must have the resolution of the
    // viewport the hits were sampled with. Single-threaded. Throws
    // std::out_of_range on a hit outside `buf`.
    static BatchResult commit(AccumulationBuffer& buf, const BatchHits& hits);

    // Throws std::invalid_argument unless `buf` has the resolution of `vp`.
    BatchResult run_batch(AccumulationBuffer& buf, const RenderParameters& p,
                          const Viewport& vp, uint64_t batch_size);

    // Called after every committed batch with the cumulative sample count.
    // Returning false stops the run at that batch boundary.
    using BatchCallback = std::function<bool(const BatchResult&, uint64_t processed)>;

    // Runs batches until p.samples have been processed or the callback
    // stops it. Returns the number of samples processed.
    uint64_t run(AccumulationBuffer& buf, const RenderParameters& p,
                 const Viewport& vp, uint64_t batch_size,
                 const BatchCallback& on_batch = BatchCallback());

private:
    void sample_chunk(const RenderParameters& p, const Viewport& vp,
                      uint64_t batch, uint64_t chunk, uint64_t count,
                      std::vector<uint32_t>& out, uint64_t& escaped) const;

    std::unique_ptr<ThreadPool> pool;
    std::mutex                  run_mtx;     // one batch on the pool at a time
    std::atomic<uint64_t>       next_batch{0};
    uint64_t                    seed_ = 0;
};
