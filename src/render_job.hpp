#pragma once

#include "batch_scheduler.hpp"
#include "buffers.hpp"
#include "export.hpp"
#include "render_error.hpp"
#include "render_params.hpp"
#include "viewport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

enum class JobStatus {
    Pending   = 0,
    Running   = 1,
    Cancelled = 2,
    Complete  = 3,
    Failed    = 4,
};

const char* job_status_name(JobStatus s);

inline bool is_terminal(JobStatus s)
{
    return s == JobStatus::Cancelled || s == JobStatus::Complete || s == JobStatus::Failed;
}

// Snapshot of a job, safe to copy out of the controller at any time.
struct RenderJob {
    uint64_t         id                = 0;   // generation, 0 = no job yet
    RenderParameters parameters;
    int              width             = 0;
    int              height            = 0;
    JobStatus        status            = JobStatus::Pending;
    double           progress          = 0.0;
    uint64_t         processed_samples = 0;
    uint64_t         batches_committed = 0;
    uint64_t         hits              = 0;   // orbit points counted
    float            max_density       = 0.0f;
};

struct PerformanceMetrics {
    double   elapsed_seconds    = 0.0;
    double   samples_per_second = 0.0;
    size_t   memory_bytes       = 0;
    uint64_t total_samples      = 0;
};

// All callbacks run on the job's background thread. on_progress is called
// once per committed batch; exactly one of on_complete / on_error ends a job
// that was not cancelled or superseded.
struct RenderCallbacks {
    std::function<void(double progress, float max_density)>          on_progress;
    std::function<void(std::shared_ptr<const AccumulationBuffer>)>   on_complete;
    std::function<void(const RenderError&)>                          on_error;
};

struct ExportResult {
    RenderError          error;
    std::vector<uint8_t> bytes;
};

struct JobState;
struct JobGeneration;

class JobHandle {
public:
    JobHandle() = default;

    uint64_t id() const { return job_id; }
    bool     valid() const { return job_id != 0; }

    // Cancel this job. No-op once it finished or was superseded.
    void cancel();

    JobStatus status() const;

private:
    friend class RenderJobController;
    JobHandle(std::weak_ptr<JobState> s, uint64_t id) : state(std::move(s)), job_id(id) {}

    std::weak_ptr<JobState> state;
    uint64_t                job_id = 0;
};

// Owns the pending parameters, the viewport and at most one running job.
class RenderJobController {
public:
    explicit RenderJobController(int width = 800, int height = 600, int n_threads = 0);
    RenderJobController(int width, int height, int n_threads, uint64_t seed);
    ~RenderJobController();

    RenderJobController(const RenderJobController&)            = delete;
    RenderJobController& operator=(const RenderJobController&) = delete;

    // --- Pending parameters (never affect a running job) ---
    RenderError      set_parameters(const RenderParameters& p);
    RenderParameters parameters() const;
    RenderError      set_parameter(const std::string& key, const std::string& value);
    const std::vector<Preset>& get_presets() const { return presets(); }
    RenderError      load_preset(const std::string& name);

    // --- Viewport ---
    RenderError set_resolution(int width, int height);
    Viewport    viewport() const;
    RenderError zoom_in(double factor = 2.0);
    RenderError zoom_out(double factor = 2.0);
    void        pan_to(double screen_x, double screen_y);
    void        reset_view();

    // --- Engine tuning ---
    void     set_batch_size(uint64_t n);
    uint64_t batch_size() const;
    void     set_thread_count(int n);
    int      thread_count() const;

    // --- Jobs ---
    // Validate `p`, supersede the current job and start a new one. On error
    // nothing changes and the running job keeps going.
    RenderError start(const RenderParameters& p, RenderCallbacks cb = RenderCallbacks());

    // start() with the pending parameters; `handle` refers to the new job.
    RenderError render(RenderCallbacks cb, JobHandle& handle);

    // Cancel the current job. Once this returns the job's buffer receives
    // no further writes and no further on_progress call begins or is still
    // running, unless called from that job's own callback.
    void cancel();

    JobHandle handle() const;
    RenderJob job() const;
    JobStatus status() const;

    // Block until the current job's background thread has finished.
    void wait() const;
    // Same with a timeout; true when the job finished in time.
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Completed buffer, or nullptr unless the current job is Complete.
    std::shared_ptr<const AccumulationBuffer> result() const;

    // Only after Complete.
    std::optional<PerformanceMetrics> performance_metrics() const;

    // Colour the running (or completed) job's buffer for live display.
    // False when there is nothing to show.
    bool preview(PixelBuffer& out) const;
    bool preview(PixelBuffer& out, ColorScheme scheme) const;

    // Encode the completed render. Scaled raster exports re-run the sampler
    // at the larger resolution with proportionally more samples.
    ExportResult export_image(const ExportOptions& opt) const;
    std::future<ExportResult> export_image_async(const ExportOptions& opt) const;

    // Stop every export started before this call at its next batch; those
    // futures resolve to ExportFailure. Render jobs are not affected.
    void cancel_export();

private:
    Viewport viewport_locked() const;
    RenderError start_job(const RenderParameters& p, RenderCallbacks cb, JobHandle* out);

    mutable std::mutex               mtx;
    RenderParameters                 params;
    int                              width  = 0;
    int                              height = 0;
    uint64_t                         batch  = DEFAULT_BATCH_SIZE;
    std::shared_ptr<BatchScheduler>  sched;
    std::shared_ptr<JobGeneration>   gen;
    std::shared_ptr<JobState>        current;
    std::thread                      worker;
    std::shared_ptr<std::atomic<uint64_t>> export_epoch;   // bumped by cancel_export()
};
