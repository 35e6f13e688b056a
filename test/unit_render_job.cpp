#include <doctest/doctest.h>

#include "render_job.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <climits>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// Long enough that it is still running when the test acts on it.
static RenderParameters long_params()
{
  RenderParameters p;
  p.iterations = 500;
  p.samples    = 500'000'000;
  return p;
}

static RenderParameters short_params()
{
  RenderParameters p;
  p.iterations = 200;
  p.samples    = 20'000;
  return p;
}

static bool wait_for_batches(const RenderJobController& ctl, uint64_t n)
{
  const auto deadline = std::chrono::steady_clock::now() + 30s;
  while (ctl.job().batches_committed < n) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

static size_t png_dimension(const std::vector<uint8_t>& png, size_t offset)
{
  return (size_t(png[offset]) << 24) | (size_t(png[offset + 1]) << 16) |
         (size_t(png[offset + 2]) << 8) | size_t(png[offset + 3]);
}

TEST_CASE("render job: end to end render and export") {
  RenderJobController ctl(160, 120, 0, 2024);

  RenderParameters p;
  p.iterations   = 1000;
  p.samples      = 100'000;
  p.zoom         = 1.0;
  p.center_x     = -0.7;
  p.center_y     = 0.0;
  p.color_scheme = ColorScheme::Classic;
  REQUIRE_FALSE(ctl.set_parameters(p));

  std::atomic<int> completions{0};
  std::atomic<int> errors{0};
  std::shared_ptr<const AccumulationBuffer> delivered;
  RenderCallbacks cb;
  cb.on_complete = [&](std::shared_ptr<const AccumulationBuffer> buf) {
    delivered = buf;
    ++completions;
  };
  cb.on_error = [&](const RenderError&) { ++errors; };

  JobHandle handle;
  REQUIRE_FALSE(ctl.render(cb, handle));
  CHECK(handle.valid());
  ctl.wait();

  CHECK(ctl.status() == JobStatus::Complete);
  CHECK(handle.status() == JobStatus::Complete);
  CHECK(completions == 1);
  CHECK(errors == 0);

  const RenderJob job = ctl.job();
  CHECK(job.id == handle.id());
  CHECK(job.progress == 1.0);
  CHECK(job.processed_samples == 100'000u);
  CHECK(job.batches_committed == 10u);
  CHECK(job.max_density > 0.0f);

  const auto result = ctl.result();
  REQUIRE(result);
  CHECK(result == delivered);
  CHECK(result->width == 160);
  CHECK(result->height == 120);
  CHECK(result->max_density == job.max_density);

  const auto metrics = ctl.performance_metrics();
  REQUIRE(metrics.has_value());
  CHECK(metrics->total_samples == 100'000u);
  CHECK(metrics->memory_bytes == 160u * 120u * sizeof(float));
  CHECK(metrics->elapsed_seconds > 0.0);
  CHECK(metrics->samples_per_second > 0.0);

  PixelBuffer preview;
  REQUIRE(ctl.preview(preview));
  CHECK(std::any_of(preview.pixels.begin(), preview.pixels.end(),
                    [](uint32_t px) { return px != 0xFF000000u; }));

  ExportOptions opt;
  const ExportResult png = ctl.export_image(opt);
  REQUIRE_FALSE(png.error);
  REQUIRE(png.bytes.size() > 24);
  CHECK(png.bytes[0] == 0x89);
  CHECK(png.bytes[1] == 'P');
  CHECK(png.bytes[2] == 'N');
  CHECK(png.bytes[3] == 'G');
  CHECK(png_dimension(png.bytes, 16) == 160u);
  CHECK(png_dimension(png.bytes, 20) == 120u);

  opt.format = ExportFormat::Vector;
  const ExportResult svg = ctl.export_image_async(opt).get();
  REQUIRE_FALSE(svg.error);
  const std::string text(svg.bytes.begin(), svg.bytes.end());
  CHECK(text.find("<svg") == 0);
  CHECK(text.find("<rect x=") != std::string::npos);
}

TEST_CASE("render job: progress is monotonic and ends at exactly 1") {
  RenderJobController ctl(64, 48, 2, 3);
  ctl.set_batch_size(3'000);
  REQUIRE_FALSE(ctl.set_parameters(short_params()));

  std::mutex mtx;
  std::vector<double> progress;
  std::vector<float>  maxima;
  RenderCallbacks cb;
  cb.on_progress = [&](double pr, float max_d) {
    std::lock_guard<std::mutex> lock(mtx);
    progress.push_back(pr);
    maxima.push_back(max_d);
  };

  JobHandle handle;
  REQUIRE_FALSE(ctl.render(cb, handle));
  ctl.wait();

  std::lock_guard<std::mutex> lock(mtx);
  REQUIRE(progress.size() == 7);   // 20000 in batches of 3000
  CHECK(std::is_sorted(progress.begin(), progress.end()));
  CHECK(std::is_sorted(maxima.begin(), maxima.end()));
  CHECK(progress.front() > 0.0);
  CHECK(progress.back() == 1.0);
  for (size_t i = 0; i + 1 < progress.size(); ++i)
    CHECK(progress[i] < 1.0);
}

TEST_CASE("render job: invalid parameters leave the running job alone") {
  RenderJobController ctl(64, 48, 2, 11);
  ctl.set_batch_size(1'000);
  REQUIRE_FALSE(ctl.start(long_params()));
  REQUIRE(wait_for_batches(ctl, 1));
  const uint64_t id = ctl.job().id;

  RenderParameters bad = long_params();
  bad.zoom = 0.0;
  CHECK(ctl.start(bad).kind == ErrorKind::InvalidParameters);
  bad = long_params();
  bad.iterations = 0;
  CHECK(ctl.start(bad).kind == ErrorKind::InvalidParameters);
  CHECK(ctl.set_parameters(bad).kind == ErrorKind::InvalidParameters);

  const RenderJob job = ctl.job();
  CHECK(job.id == id);
  CHECK(job.status == JobStatus::Running);
  CHECK(ctl.parameters().iterations == RenderParameters().iterations);

  ctl.cancel();
  ctl.wait();
  CHECK(ctl.status() == JobStatus::Cancelled);
}

TEST_CASE("render job: no buffer writes after cancel returns") {
  RenderJobController ctl(64, 48, 2, 5);
  ctl.set_batch_size(1'000);
  REQUIRE_FALSE(ctl.start(long_params()));
  REQUIRE(wait_for_batches(ctl, 2));

  ctl.cancel();
  const RenderJob at_cancel = ctl.job();
  CHECK(at_cancel.status == JobStatus::Cancelled);

  ctl.wait();
  std::this_thread::sleep_for(20ms);
  const RenderJob later = ctl.job();
  CHECK(later.status == JobStatus::Cancelled);
  CHECK(later.batches_committed == at_cancel.batches_committed);
  CHECK(later.processed_samples == at_cancel.processed_samples);
  CHECK(later.progress < 1.0);

  CHECK_FALSE(ctl.result());
  CHECK_FALSE(ctl.performance_metrics().has_value());
  CHECK(ctl.export_image(ExportOptions()).error.kind == ErrorKind::ExportFailure);
}

TEST_CASE("render job: a new start supersedes the running job") {
  RenderJobController ctl(64, 48, 2, 8);
  ctl.set_batch_size(1'000);

  std::atomic<int> first_done{0};
  RenderCallbacks first_cb;
  first_cb.on_complete = [&](std::shared_ptr<const AccumulationBuffer>) { ++first_done; };
  first_cb.on_error    = [&](const RenderError&) { ++first_done; };

  REQUIRE_FALSE(ctl.start(long_params(), first_cb));
  const JobHandle first = ctl.handle();
  REQUIRE(wait_for_batches(ctl, 1));

  std::atomic<int> second_done{0};
  RenderCallbacks second_cb;
  second_cb.on_complete = [&](std::shared_ptr<const AccumulationBuffer>) { ++second_done; };

  REQUIRE_FALSE(ctl.start(short_params(), second_cb));
  const JobHandle second = ctl.handle();
  CHECK(second.id() > first.id());
  ctl.wait();

  CHECK(first.status() == JobStatus::Cancelled);
  CHECK(second.status() == JobStatus::Complete);
  CHECK(first_done == 0);
  CHECK(second_done == 1);

  const RenderJob job = ctl.job();
  CHECK(job.id == second.id());
  CHECK(job.processed_samples == short_params().samples);
  CHECK(job.parameters.iterations == short_params().iterations);

  // Cancelling a superseded handle does not touch the current job
  JobHandle stale = first;
  stale.cancel();
  CHECK(ctl.status() == JobStatus::Complete);
}

TEST_CASE("render job: handle cancel") {
  RenderJobController ctl(32, 32, 1, 21);
  ctl.set_batch_size(1'000);
  REQUIRE_FALSE(ctl.set_parameters(long_params()));

  JobHandle handle;
  REQUIRE_FALSE(ctl.render(RenderCallbacks(), handle));
  handle.cancel();
  CHECK(handle.status() == JobStatus::Cancelled);
  ctl.wait();
  CHECK(ctl.status() == JobStatus::Cancelled);

  // Cancelling again is harmless
  handle.cancel();
  ctl.cancel();
  CHECK(ctl.status() == JobStatus::Cancelled);
}

TEST_CASE("render job: a throwing callback reports a computation failure") {
  RenderJobController ctl(32, 32, 1, 4);
  ctl.set_batch_size(5'000);
  REQUIRE_FALSE(ctl.set_parameters(short_params()));

  std::mutex mtx;
  std::vector<RenderError> errors;
  std::atomic<int> completions{0};
  RenderCallbacks cb;
  cb.on_progress = [](double pr, float) {
    if (pr >= 0.5) throw std::runtime_error("display went away");
  };
  cb.on_error = [&](const RenderError& e) {
    std::lock_guard<std::mutex> lock(mtx);
    errors.push_back(e);
  };
  cb.on_complete = [&](std::shared_ptr<const AccumulationBuffer>) { ++completions; };

  JobHandle handle;
  REQUIRE_FALSE(ctl.render(cb, handle));
  ctl.wait();

  CHECK(ctl.status() == JobStatus::Failed);
  CHECK(ctl.job().batches_committed == 2u);
  CHECK(completions == 0);
  std::lock_guard<std::mutex> lock(mtx);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0].kind == ErrorKind::ComputationFailure);
  CHECK(errors[0].message == "display went away");
  CHECK_FALSE(ctl.result());
  PixelBuffer preview;
  CHECK_FALSE(ctl.preview(preview));
}

TEST_CASE("render job: resolution is capped at the pixel index range") {
  RenderJobController ctl(32, 32, 1, 4);
  CHECK(ctl.set_resolution(70'000, 70'000).kind == ErrorKind::InvalidParameters);
  CHECK(ctl.set_resolution(INT_MAX, INT_MAX).kind == ErrorKind::InvalidParameters);
  CHECK(ctl.viewport().width == 32);
  CHECK(ctl.viewport().height == 32);
  CHECK_FALSE(ctl.set_resolution(65'536, 65'535));
  CHECK(ctl.viewport().width == 65'536);
}

TEST_CASE("render job: no progress report after cancel returns") {
  RenderJobController ctl(64, 48, 2, 17);
  ctl.set_batch_size(500);

  std::atomic<bool> cancelled{false};
  std::atomic<int>  late{0};
  RenderCallbacks cb;
  cb.on_progress = [&](double, float) {
    std::this_thread::sleep_for(2ms);
    if (cancelled) ++late;
  };
  REQUIRE_FALSE(ctl.start(long_params(), cb));
  REQUIRE(wait_for_batches(ctl, 3));

  ctl.cancel();
  cancelled = true;
  ctl.wait();
  CHECK(late == 0);

  // Same through a handle
  cancelled = false;
  JobHandle handle;
  REQUIRE_FALSE(ctl.set_parameters(long_params()));
  REQUIRE_FALSE(ctl.render(cb, handle));
  REQUIRE(wait_for_batches(ctl, 3));
  handle.cancel();
  cancelled = true;
  ctl.wait();
  CHECK(late == 0);
}

TEST_CASE("render job: a progress callback may cancel its own job") {
  RenderJobController ctl(32, 32, 1, 19);
  ctl.set_batch_size(1'000);

  std::atomic<int> reports{0};
  RenderCallbacks cb;
  cb.on_progress = [&](double, float) {
    if (++reports == 3) ctl.cancel();
  };
  REQUIRE_FALSE(ctl.start(long_params(), cb));
  REQUIRE(ctl.wait_for(30s));
  CHECK(ctl.status() == JobStatus::Cancelled);
  CHECK(reports == 3);
  CHECK(ctl.job().batches_committed == 3u);
}

TEST_CASE("render job: render returns the handle of the job it started") {
  RenderJobController ctl(32, 32, 1, 23);
  REQUIRE_FALSE(ctl.set_parameters(short_params()));

  // The first job's completion immediately starts a second one.
  std::atomic<bool> restarted{false};
  std::atomic<bool> restart_failed{false};
  RenderCallbacks cb;
  cb.on_complete = [&](std::shared_ptr<const AccumulationBuffer>) {
    if (!restarted.exchange(true) && ctl.start(short_params()))
      restart_failed = true;
  };

  JobHandle handle;
  REQUIRE_FALSE(ctl.render(cb, handle));
  CHECK(handle.id() == 1u);

  const auto deadline = std::chrono::steady_clock::now() + 30s;
  while (ctl.job().id != 2u && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(1ms);
  REQUIRE(ctl.job().id == 2u);
  ctl.wait();

  CHECK_FALSE(restart_failed);
  CHECK(handle.id() == 1u);
  CHECK(handle.status() == JobStatus::Complete);
  CHECK(ctl.status() == JobStatus::Complete);
}

TEST_CASE("render job: scaled raster export renders at the larger size") {
  RenderJobController ctl(40, 30, 2, 6);
  REQUIRE_FALSE(ctl.set_parameters(short_params()));
  JobHandle handle;
  REQUIRE_FALSE(ctl.render(RenderCallbacks(), handle));
  ctl.wait();
  REQUIRE(ctl.status() == JobStatus::Complete);

  ExportOptions opt;
  opt.scale = 2;
  const ExportResult res = ctl.export_image(opt);
  REQUIRE_FALSE(res.error);
  REQUIRE(res.bytes.size() > 24);
  CHECK(png_dimension(res.bytes, 16) == 80u);
  CHECK(png_dimension(res.bytes, 20) == 60u);

  opt.scale = 9;
  CHECK(ctl.export_image(opt).error.kind == ErrorKind::InvalidParameters);

  // Export leaves the completed render as it was
  CHECK(ctl.status() == JobStatus::Complete);
  CHECK(ctl.result()->width == 40);
}

TEST_CASE("render job: a cancelled scaled export returns promptly with an error") {
  RenderJobController ctl(64, 48, 2, 31);
  RenderParameters p;
  p.iterations = 2'000;
  p.samples    = 200'000;
  REQUIRE_FALSE(ctl.set_parameters(p));
  JobHandle handle;
  REQUIRE_FALSE(ctl.render(RenderCallbacks(), handle));
  ctl.wait();
  REQUIRE(ctl.status() == JobStatus::Complete);

  ExportOptions opt;
  opt.scale = 8;
  std::future<ExportResult> running = ctl.export_image_async(opt);
  std::this_thread::sleep_for(20ms);
  ctl.cancel_export();
  REQUIRE(running.wait_for(10s) == std::future_status::ready);
  const ExportResult res = running.get();
  CHECK(res.error.kind == ErrorKind::ExportFailure);
  CHECK(res.error.message == "export cancelled");
  CHECK(res.bytes.empty());

  // Only exports started before the cancel are affected
  opt.scale = 1;
  CHECK_FALSE(ctl.export_image(opt).error);
  CHECK(ctl.status() == JobStatus::Complete);
}

TEST_CASE("render job: pending parameters and navigation") {
  RenderJobController ctl(200, 100, 1, 1);
  CHECK(ctl.job().id == 0);
  CHECK_FALSE(ctl.performance_metrics().has_value());
  CHECK(ctl.get_presets().size() == 4);

  CHECK_FALSE(ctl.load_preset("artistic"));
  CHECK(ctl.parameters().zoom == 1.5);
  CHECK(ctl.parameters().color_scheme == ColorScheme::Fire);

  const RenderParameters before = ctl.parameters();
  CHECK(ctl.load_preset("nope").kind == ErrorKind::InvalidParameters);
  CHECK(ctl.parameters().samples == before.samples);

  CHECK_FALSE(ctl.set_parameter("iterations", "321"));
  CHECK(ctl.parameters().iterations == 321);
  CHECK(ctl.set_parameter("zoom", "-1"));
  CHECK(ctl.parameters().zoom == 1.5);

  CHECK_FALSE(ctl.zoom_in(2.0));
  CHECK(ctl.parameters().zoom == doctest::Approx(3.0));
  CHECK_FALSE(ctl.zoom_out(3.0));
  CHECK(ctl.parameters().zoom == doctest::Approx(1.0));
  CHECK(ctl.zoom_in(0.0).kind == ErrorKind::InvalidParameters);
  CHECK(ctl.zoom_out(-2.0));

  ctl.reset_view();
  ctl.pan_to(0.0, 50.0);
  CHECK(ctl.parameters().center_x == doctest::Approx(-2.7));
  CHECK(ctl.parameters().center_y == doctest::Approx(0.0));
  ctl.reset_view();
  CHECK(ctl.parameters().center_x == -0.7);
  CHECK(ctl.parameters().zoom == 1.0);

  CHECK(ctl.set_resolution(0, 10));
  CHECK_FALSE(ctl.set_resolution(320, 240));
  CHECK(ctl.viewport().width == 320);
  CHECK(ctl.viewport().height == 240);

  ctl.set_batch_size(0);
  CHECK(ctl.batch_size() == DEFAULT_BATCH_SIZE);
  ctl.set_thread_count(2);
  CHECK(ctl.thread_count() == 2);
}

TEST_CASE("render job: parameter changes do not affect a running job") {
  RenderJobController ctl(32, 32, 1, 13);
  ctl.set_batch_size(1'000);
  REQUIRE_FALSE(ctl.start(long_params()));
  REQUIRE(wait_for_batches(ctl, 1));

  CHECK_FALSE(ctl.set_parameter("color_scheme", "ocean"));
  CHECK_FALSE(ctl.zoom_in(4.0));
  const RenderJob job = ctl.job();
  CHECK(job.parameters.color_scheme == ColorScheme::Classic);
  CHECK(job.parameters.zoom == 1.0);
  CHECK(job.width == 32);

  ctl.cancel();
  ctl.wait();
}
