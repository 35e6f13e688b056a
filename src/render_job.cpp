#include "render_job.hpp"
#include "color_map.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <limits>
#include <new>
#include <string>
#include <thread>

const char* job_status_name(JobStatus s)
{
    switch (s) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Complete:  return "complete";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

// Generation counter shared by the controller and its jobs. `current` is the
// id whose batches may still be written; 0 once that job was cancelled.
struct JobGeneration {
    std::atomic<uint64_t> next{0};
    std::atomic<uint64_t> current{0};
};

struct JobState {
    uint64_t                        id = 0;
    RenderParameters                params;
    Viewport                        vp;
    uint64_t                        batch_size = DEFAULT_BATCH_SIZE;
    RenderCallbacks                 cb;
    std::shared_ptr<JobGeneration>  gen;

    mutable std::mutex              mtx;
    mutable std::condition_variable done_cv;
    bool                            finished = false;   // background thread exited
    std::thread::id                 runner;             // set once the thread runs

    // Held across every on_progress call.
    std::mutex                      report_mtx;

    JobStatus                       status            = JobStatus::Pending;
    double                          progress          = 0.0;
    uint64_t                        processed         = 0;
    uint64_t                        batches           = 0;
    uint64_t                        hits              = 0;
    float                           max_density       = 0.0f;

    // Owned by the job thread while Running; moved to `result` on Complete.
    std::unique_ptr<AccumulationBuffer>       buffer;
    std::shared_ptr<const AccumulationBuffer> result;

    std::chrono::steady_clock::time_point     t_start;
    double                                    elapsed = 0.0;

    bool is_current() const { return gen->current.load() == id; }
};

// Caller holds job.mtx.
static void cancel_locked(JobState& job)
{
    uint64_t expected = job.id;
    job.gen->current.compare_exchange_strong(expected, 0);
    if (job.status == JobStatus::Pending || job.status == JobStatus::Running)
        job.status = JobStatus::Cancelled;
}

// Caller holds no lock. Waits out a progress report in flight on another
// thread, so nothing reports after a cancel returns. A callback cancelling
// its own job runs on `runner` and must not wait for itself.
static void drain_reports(JobState& job, std::thread::id runner)
{
    if (runner == std::this_thread::get_id()) return;
    std::lock_guard<std::mutex> lock(job.report_mtx);
}

// Caller holds job.mtx. Drops the buffer of a job that lost its generation.
static void retire_locked(JobState& job)
{
    if (job.status == JobStatus::Pending || job.status == JobStatus::Running)
        job.status = JobStatus::Cancelled;
    job.buffer.reset();
}

static void finish(JobState& job)
{
    {
        std::lock_guard<std::mutex> lock(job.mtx);
        job.finished = true;
    }
    job.done_cv.notify_all();
}

static void fail(JobState& job, const RenderError& err)
{
    bool report = false;
    {
        std::lock_guard<std::mutex> lock(job.mtx);
        if (job.is_current()) {
            job.status = JobStatus::Failed;
            job.buffer.reset();
            report = true;
        } else {
            retire_locked(job);
        }
    }
    if (report && job.cb.on_error)
        job.cb.on_error(err);
}

// -----------------------------------------------------------------------
// Job thread: batches until done, cancelled, or superseded
// -----------------------------------------------------------------------

// Returns the finished buffer, or nullptr when the job lost its generation.
// Faults propagate as exceptions.
static std::shared_ptr<const AccumulationBuffer> execute(JobState& job, BatchScheduler& sched)
{
    using clock = std::chrono::steady_clock;

    {
        std::lock_guard<std::mutex> lock(job.mtx);
        if (!job.is_current()) {
            retire_locked(job);
            return nullptr;
        }
        job.buffer = std::make_unique<AccumulationBuffer>();
        job.buffer->resize(job.vp.width, job.vp.height);
        job.status  = JobStatus::Running;
        job.t_start = clock::now();
    }

    const uint64_t total = job.params.samples;
    uint64_t processed = 0;

    while (processed < total) {
        const uint64_t  n    = std::min(job.batch_size, total - processed);
        const BatchHits hits = sched.sample_batch(job.params, job.vp, n);

        double progress;
        float  max_density;
        {
            std::lock_guard<std::mutex> lock(job.mtx);
            if (!job.is_current()) {
                retire_locked(job);
                return nullptr;
            }
            const BatchResult r = BatchScheduler::commit(*job.buffer, hits);
            processed += r.processed;
            job.processed   = processed;
            job.progress    = (processed >= total)
                                  ? 1.0
                                  : static_cast<double>(processed) / static_cast<double>(total);
            job.batches    += 1;
            job.hits       += r.hits;
            job.max_density = r.new_max_density;
            progress    = job.progress;
            max_density = job.max_density;
        }
        std::lock_guard<std::mutex> report(job.report_mtx);
        if (job.cb.on_progress && job.is_current())
            job.cb.on_progress(progress, max_density);
    }

    std::lock_guard<std::mutex> lock(job.mtx);
    if (!job.is_current()) {
        retire_locked(job);
        return nullptr;
    }
    job.elapsed = std::chrono::duration<double>(clock::now() - job.t_start).count();
    job.result  = std::shared_ptr<const AccumulationBuffer>(std::move(job.buffer));
    job.status  = JobStatus::Complete;
    return job.result;
}

static void run_job(std::shared_ptr<JobState> job, std::shared_ptr<BatchScheduler> sched)
{
    {
        std::lock_guard<std::mutex> lock(job->mtx);
        job->runner = std::this_thread::get_id();
    }
    std::shared_ptr<const AccumulationBuffer> result;
    try {
        result = execute(*job, *sched);
    } catch (const std::bad_alloc&) {
        fail(*job, RenderError::computation("out of memory"));
    } catch (const std::exception& e) {
        fail(*job, RenderError::computation(e.what()));
    } catch (...) {
        fail(*job, RenderError::computation("unknown exception in render job"));
    }
    // Outside the try: the job is already Complete, so nothing may report
    // after this.
    if (result && job->cb.on_complete)
        job->cb.on_complete(result);
    finish(*job);
}

// -----------------------------------------------------------------------
// JobHandle
// -----------------------------------------------------------------------
void JobHandle::cancel()
{
    std::shared_ptr<JobState> job = state.lock();
    if (!job) return;
    std::thread::id runner;
    {
        std::lock_guard<std::mutex> lock(job->mtx);
        cancel_locked(*job);
        runner = job->runner;
    }
    drain_reports(*job, runner);
}

JobStatus JobHandle::status() const
{
    if (std::shared_ptr<JobState> job = state.lock()) {
        std::lock_guard<std::mutex> lock(job->mtx);
        return job->status;
    }
    return JobStatus::Cancelled;
}

// -----------------------------------------------------------------------
// Controller
// -----------------------------------------------------------------------
RenderJobController::RenderJobController(int w, int h, int n_threads)
    : width(std::max(1, w)),
      height(std::max(1, h)),
      sched(std::make_shared<BatchScheduler>(n_threads)),
      gen(std::make_shared<JobGeneration>()),
      export_epoch(std::make_shared<std::atomic<uint64_t>>(0))
{
}

RenderJobController::RenderJobController(int w, int h, int n_threads, uint64_t seed)
    : width(std::max(1, w)),
      height(std::max(1, h)),
      sched(std::make_shared<BatchScheduler>(n_threads, seed)),
      gen(std::make_shared<JobGeneration>()),
      export_epoch(std::make_shared<std::atomic<uint64_t>>(0))
{
}

RenderJobController::~RenderJobController()
{
    cancel_export();
    cancel();
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) worker.detach();
        else                                               worker.join();
    }
}

RenderError RenderJobController::set_parameters(const RenderParameters& p)
{
    RenderError err = validate(p);
    if (err) return err;
    std::lock_guard<std::mutex> lock(mtx);
    params = p;
    return {};
}

RenderParameters RenderJobController::parameters() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return params;
}

RenderError RenderJobController::set_parameter(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock(mtx);
    return apply_parameter(params, key, value);
}

RenderError RenderJobController::load_preset(const std::string& name)
{
    const Preset* preset = find_preset(name);
    if (!preset)
        return RenderError::invalid("unknown preset: " + name);
    return set_parameters(preset->params);
}

RenderError RenderJobController::set_resolution(int w, int h)
{
    if (w <= 0 || h <= 0)
        return RenderError::invalid("resolution must be positive");
    if (!pixel_count_fits(w, h))
        return RenderError::invalid("resolution exceeds " + std::to_string(MAX_PIXELS) + " pixels");
    std::lock_guard<std::mutex> lock(mtx);
    width  = w;
    height = h;
    return {};
}

Viewport RenderJobController::viewport_locked() const
{
    return viewport_for(params, width, height);
}

Viewport RenderJobController::viewport() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return viewport_locked();
}

RenderError RenderJobController::zoom_in(double factor)
{
    if (!std::isfinite(factor) || factor <= 0.0)
        return RenderError::invalid("zoom factor must be > 0");
    std::lock_guard<std::mutex> lock(mtx);
    Viewport vp = viewport_locked();
    ::zoom_in(vp, factor);
    RenderParameters next = params;
    next.zoom = vp.zoom;
    RenderError err = validate(next);
    if (err) return err;
    params = next;
    return {};
}

RenderError RenderJobController::zoom_out(double factor)
{
    if (!std::isfinite(factor) || factor <= 0.0)
        return RenderError::invalid("zoom factor must be > 0");
    return zoom_in(1.0 / factor);
}

void RenderJobController::pan_to(double screen_x, double screen_y)
{
    std::lock_guard<std::mutex> lock(mtx);
    Viewport vp = viewport_locked();
    ::pan_to(vp, screen_x, screen_y);
    params.center_x = vp.center_x;
    params.center_y = vp.center_y;
}

void RenderJobController::reset_view()
{
    std::lock_guard<std::mutex> lock(mtx);
    Viewport vp = viewport_locked();
    ::reset_view(vp);
    params.zoom     = vp.zoom;
    params.center_x = vp.center_x;
    params.center_y = vp.center_y;
}

void RenderJobController::set_batch_size(uint64_t n)
{
    std::lock_guard<std::mutex> lock(mtx);
    batch = (n == 0) ? DEFAULT_BATCH_SIZE : n;
}

uint64_t RenderJobController::batch_size() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return batch;
}

void RenderJobController::set_thread_count(int n)
{
    sched->set_thread_count(n);
}

int RenderJobController::thread_count() const
{
    return sched->thread_count;
}

RenderError RenderJobController::start(const RenderParameters& p, RenderCallbacks cb)
{
    return start_job(p, std::move(cb), nullptr);
}

RenderError RenderJobController::start_job(const RenderParameters& p, RenderCallbacks cb,
                                           JobHandle* out)
{
    RenderError err = validate(p);
    if (err) return err;

    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mtx);

        if (current) {
            std::lock_guard<std::mutex> job_lock(current->mtx);
            cancel_locked(*current);
        }

        auto job        = std::make_shared<JobState>();
        job->id         = ++gen->next;
        job->params     = p;
        job->vp         = viewport_for(p, width, height);
        job->batch_size = batch;
        job->cb         = std::move(cb);
        job->gen        = gen;
        gen->current    = job->id;

        previous = std::move(worker);
        current  = job;
        worker   = std::thread(run_job, job, sched);
        if (out) *out = JobHandle(job, job->id);
    }

    // The superseded thread notices at its next batch boundary. A callback
    // that starts a new render runs on that very thread and cannot join it.
    if (previous.joinable()) {
        if (previous.get_id() == std::this_thread::get_id()) previous.detach();
        else                                                 previous.join();
    }
    return {};
}

RenderError RenderJobController::render(RenderCallbacks cb, JobHandle& out)
{
    return start_job(parameters(), std::move(cb), &out);
}

void RenderJobController::cancel()
{
    std::shared_ptr<JobState> job;
    std::thread::id runner;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!current) return;
        job = current;
        std::lock_guard<std::mutex> job_lock(job->mtx);
        cancel_locked(*job);
        runner = job->runner;
    }
    drain_reports(*job, runner);
}

JobHandle RenderJobController::handle() const
{
    std::lock_guard<std::mutex> lock(mtx);
    if (!current) return JobHandle();
    return JobHandle(current, current->id);
}

RenderJob RenderJobController::job() const
{
    std::lock_guard<std::mutex> lock(mtx);
    RenderJob info;
    if (!current) {
        info.parameters = params;
        info.width      = width;
        info.height     = height;
        return info;
    }
    std::lock_guard<std::mutex> job_lock(current->mtx);
    info.id                = current->id;
    info.parameters        = current->params;
    info.width             = current->vp.width;
    info.height            = current->vp.height;
    info.status            = current->status;
    info.progress          = current->progress;
    info.processed_samples = current->processed;
    info.batches_committed = current->batches;
    info.hits              = current->hits;
    info.max_density       = current->max_density;
    return info;
}

JobStatus RenderJobController::status() const
{
    return job().status;
}

void RenderJobController::wait() const
{
    std::shared_ptr<JobState> job;
    {
        std::lock_guard<std::mutex> lock(mtx);
        job = current;
    }
    if (!job) return;
    std::unique_lock<std::mutex> job_lock(job->mtx);
    job->done_cv.wait(job_lock, [&] { return job->finished; });
}

bool RenderJobController::wait_for(std::chrono::milliseconds timeout) const
{
    std::shared_ptr<JobState> job;
    {
        std::lock_guard<std::mutex> lock(mtx);
        job = current;
    }
    if (!job) return true;
    std::unique_lock<std::mutex> job_lock(job->mtx);
    return job->done_cv.wait_for(job_lock, timeout, [&] { return job->finished; });
}

std::shared_ptr<const AccumulationBuffer> RenderJobController::result() const
{
    std::lock_guard<std::mutex> lock(mtx);
    if (!current) return nullptr;
    std::lock_guard<std::mutex> job_lock(current->mtx);
    return current->status == JobStatus::Complete ? current->result : nullptr;
}

std::optional<PerformanceMetrics> RenderJobController::performance_metrics() const
{
    std::lock_guard<std::mutex> lock(mtx);
    if (!current) return std::nullopt;
    std::lock_guard<std::mutex> job_lock(current->mtx);
    if (current->status != JobStatus::Complete || !current->result)
        return std::nullopt;

    PerformanceMetrics m;
    m.elapsed_seconds    = current->elapsed;
    m.total_samples      = current->params.samples;
    m.samples_per_second = current->elapsed > 0.0
                               ? static_cast<double>(current->params.samples) / current->elapsed
                               : 0.0;
    m.memory_bytes       = current->result->memory_bytes();
    return m;
}

bool RenderJobController::preview(PixelBuffer& out) const
{
    ColorScheme scheme;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!current) return false;
        scheme = current->params.color_scheme;
    }
    return preview(out, scheme);
}

bool RenderJobController::preview(PixelBuffer& out, ColorScheme scheme) const
{
    std::lock_guard<std::mutex> lock(mtx);
    if (!current) return false;
    std::lock_guard<std::mutex> job_lock(current->mtx);
    const AccumulationBuffer* acc = current->buffer ? current->buffer.get()
                                                    : current->result.get();
    if (!acc) return false;
    colorize(*acc, scheme, out);
    return true;
}

// -----------------------------------------------------------------------
// Export
// -----------------------------------------------------------------------
static ExportResult export_job(std::shared_ptr<const AccumulationBuffer> acc,
                               RenderParameters p, Viewport vp, ExportOptions opt,
                               int n_threads, uint64_t seed, uint64_t batch_size,
                               std::shared_ptr<const std::atomic<uint64_t>> epoch,
                               uint64_t started)
{
    const auto cancelled = [&] { return epoch->load() != started; };

    ExportResult res;
    res.error = check_export_options(opt);
    if (res.error) return res;
    if (cancelled()) {
        res.error = RenderError::export_failure("export cancelled");
        return res;
    }

    if (opt.format == ExportFormat::Vector || opt.scale == 1) {
        res.error = export_buffer(*acc, p.color_scheme, opt, res.bytes);
        return res;
    }

    // Upscaled raster: sample again at the target resolution instead of
    // interpolating the existing histogram.
    const uint64_t factor = static_cast<uint64_t>(opt.scale) * static_cast<uint64_t>(opt.scale);
    if (p.samples > std::numeric_limits<uint64_t>::max() / factor) {
        res.error = RenderError::export_failure("sample count overflow at this scale");
        return res;
    }
    res.error = check_export_size(vp.width, vp.height, opt.scale);
    if (res.error) return res;
    p.samples *= factor;
    vp.width  *= opt.scale;
    vp.height *= opt.scale;

    try {
        BatchScheduler scaled(n_threads, seed);
        AccumulationBuffer hi;
        hi.resize(vp.width, vp.height);
        scaled.run(hi, p, vp, batch_size,
                   [&](const BatchResult&, uint64_t) { return !cancelled(); });
        if (cancelled()) {
            res.error = RenderError::export_failure("export cancelled");
            return res;
        }
        res.error = export_buffer(hi, p.color_scheme, opt, res.bytes);
    } catch (const std::bad_alloc&) {
        res.error = RenderError::export_failure("out of memory rendering scaled export");
    } catch (const std::exception& e) {
        res.error = RenderError::export_failure(e.what());
    }
    return res;
}

ExportResult RenderJobController::export_image(const ExportOptions& opt) const
{
    return export_image_async(opt).get();
}

std::future<ExportResult> RenderJobController::export_image_async(const ExportOptions& opt) const
{
    std::shared_ptr<const AccumulationBuffer> acc;
    RenderParameters p;
    Viewport         vp;
    uint64_t         batch_size;
    uint64_t         started;
    {
        std::lock_guard<std::mutex> lock(mtx);
        batch_size = batch;
        started    = export_epoch->load();
        if (current) {
            std::lock_guard<std::mutex> job_lock(current->mtx);
            if (current->status == JobStatus::Complete) {
                acc = current->result;
                p   = current->params;
                vp  = current->vp;
            }
        }
    }

    if (!acc) {
        std::promise<ExportResult> ready;
        ready.set_value({ RenderError::export_failure("no completed render to export"), {} });
        return ready.get_future();
    }

    return std::async(std::launch::async, export_job, acc, p, vp, opt,
                      sched->thread_count, sched->seed(), batch_size,
                      std::shared_ptr<const std::atomic<uint64_t>>(export_epoch), started);
}

void RenderJobController::cancel_export()
{
    export_epoch->fetch_add(1);
}
