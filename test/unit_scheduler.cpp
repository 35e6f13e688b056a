#include <doctest/doctest.h>

#include "batch_scheduler.hpp"

#include <stdexcept>
#include <vector>

static RenderParameters small_params(uint64_t samples)
{
  RenderParameters p;
  p.iterations = 200;
  p.samples    = samples;
  return p;
}

static double density_sum(const AccumulationBuffer& buf)
{
  double sum = 0.0;
  for (float d : buf.density) sum += d;
  return sum;
}

TEST_CASE("scheduler: every counted hit lands in the buffer") {
  const RenderParameters p = small_params(20'000);
  const Viewport vp = viewport_for(p, 64, 48);
  AccumulationBuffer buf;
  buf.resize(vp.width, vp.height);

  BatchScheduler sched(2, 1234);
  uint64_t hits = 0, escaped = 0, batches = 0;
  const uint64_t processed = sched.run(buf, p, vp, 3'000,
      [&](const BatchResult& r, uint64_t) {
        hits    += r.hits;
        escaped += r.escaped;
        CHECK(r.saturated == 0);
        CHECK(r.escaped <= r.processed);
        ++batches;
        return true;
      });

  CHECK(processed == p.samples);
  CHECK(batches == 7);          // 6 full batches + 2000
  CHECK(hits > 0);
  CHECK(escaped > 0);
  CHECK(escaped < p.samples);
  CHECK(density_sum(buf) == static_cast<double>(hits));

  float max_d = 0.0f;
  for (float d : buf.density) max_d = d > max_d ? d : max_d;
  CHECK(buf.max_density == max_d);
}

TEST_CASE("scheduler: cumulative sample count per batch") {
  const RenderParameters p = small_params(2'500);
  const Viewport vp = viewport_for(p, 32, 32);
  AccumulationBuffer buf;
  buf.resize(vp.width, vp.height);

  BatchScheduler sched(1, 9);
  std::vector<uint64_t> seen;
  sched.run(buf, p, vp, 1'000, [&](const BatchResult& r, uint64_t total) {
    seen.push_back(total);
    CHECK(r.processed <= 1'000u);
    return true;
  });
  REQUIRE(seen.size() == 3);
  CHECK(seen[0] == 1'000u);
  CHECK(seen[1] == 2'000u);
  CHECK(seen[2] == 2'500u);
}

TEST_CASE("scheduler: callback stops at a batch boundary") {
  const RenderParameters p = small_params(100'000);
  const Viewport vp = viewport_for(p, 32, 32);
  AccumulationBuffer buf;
  buf.resize(vp.width, vp.height);

  BatchScheduler sched(2, 5);
  const uint64_t processed = sched.run(buf, p, vp, 4'000,
      [](const BatchResult&, uint64_t) { return false; });
  CHECK(processed == 4'000u);
}

TEST_CASE("scheduler: same seed gives the same image at any thread count") {
  const RenderParameters p = small_params(12'000);
  const Viewport vp = viewport_for(p, 48, 48);

  AccumulationBuffer a, b;
  a.resize(vp.width, vp.height);
  b.resize(vp.width, vp.height);

  BatchScheduler one(1, 42);
  BatchScheduler four(4, 42);
  one.run(a, p, vp, 5'000);
  four.run(b, p, vp, 5'000);

  CHECK(a.density == b.density);
  CHECK(a.max_density == b.max_density);

  // Rewinding replays the same random streams
  AccumulationBuffer c;
  c.resize(vp.width, vp.height);
  four.rewind();
  four.run(c, p, vp, 5'000);
  CHECK(c.density == a.density);
}

TEST_CASE("scheduler: different seeds differ") {
  const RenderParameters p = small_params(10'000);
  const Viewport vp = viewport_for(p, 48, 48);
  AccumulationBuffer a, b;
  a.resize(vp.width, vp.height);
  b.resize(vp.width, vp.height);
  BatchScheduler(2, 1).run(a, p, vp, 5'000);
  BatchScheduler(2, 2).run(b, p, vp, 5'000);
  CHECK_FALSE(a.density == b.density);
}

TEST_CASE("scheduler: saturated cells stop counting") {
  AccumulationBuffer buf;
  buf.resize(2, 1);
  buf.density[0]  = DENSITY_CEILING;
  buf.max_density = DENSITY_CEILING;

  BatchHits hits;
  hits.chunks    = {{0, 1}, {0, 1}};
  hits.processed = 2;
  hits.escaped   = 2;

  const BatchResult r = BatchScheduler::commit(buf, hits);
  CHECK(r.hits == 2);
  CHECK(r.saturated == 2);
  CHECK(buf.density[0] == DENSITY_CEILING);
  CHECK(buf.density[1] == 2.0f);
  CHECK(r.new_max_density == DENSITY_CEILING);
}

TEST_CASE("scheduler: sampling touches no buffer") {
  const RenderParameters p = small_params(3'000);
  const Viewport vp = viewport_for(p, 16, 16);
  BatchScheduler sched(2, 77);

  const BatchHits hits = sched.sample_batch(p, vp, 3'000);
  CHECK(hits.processed == 3'000u);
  CHECK(hits.chunks.size() == (3'000 + CHUNK_SAMPLES - 1) / CHUNK_SAMPLES);
  for (const auto& chunk : hits.chunks)
    for (uint32_t idx : chunk)
      CHECK(idx < vp.pixel_count());

  CHECK(sched.sample_batch(p, vp, 0).processed == 0u);
}

TEST_CASE("scheduler: thread count") {
  BatchScheduler sched(3, 1);
  CHECK(sched.thread_count == 3);
  CHECK(sched.seed() == 1u);
  sched.set_thread_count(0);
  CHECK(sched.thread_count == sched.hw_concurrency);
  CHECK(sched.hw_concurrency >= 1);
}

TEST_CASE("scheduler: empty viewport is rejected") {
  RenderParameters p = small_params(10);
  AccumulationBuffer buf;
  BatchScheduler sched(1, 1);
  uint64_t calls = 0;
  CHECK_THROWS_AS(sched.run(buf, p, Viewport{}, 5,
                            [&](const BatchResult&, uint64_t) { return ++calls < 100; }),
                  std::invalid_argument);
  CHECK(calls == 0);
  CHECK_THROWS_AS(sched.sample_batch(p, Viewport{}, 5), std::invalid_argument);
}

TEST_CASE("scheduler: buffer must match the viewport") {
  const RenderParameters p = small_params(2'000);
  const Viewport vp = viewport_for(p, 32, 32);
  BatchScheduler sched(2, 5);

  AccumulationBuffer small;
  small.resize(4, 4);
  CHECK_THROWS_AS(sched.run_batch(small, p, vp, 2'000), std::invalid_argument);
  CHECK_THROWS_AS(sched.run(small, p, vp, 1'000), std::invalid_argument);
  CHECK(density_sum(small) == 0.0);

  AccumulationBuffer empty;
  CHECK_THROWS_AS(sched.run_batch(empty, p, vp, 2'000), std::invalid_argument);
}

TEST_CASE("scheduler: commit refuses hits outside the buffer") {
  AccumulationBuffer buf;
  buf.resize(2, 2);
  BatchHits hits;
  hits.chunks    = {{4}};
  hits.processed = 1;
  CHECK_THROWS_AS(BatchScheduler::commit(buf, hits), std::out_of_range);
}

TEST_CASE("scheduler: viewports past the 32-bit index range are rejected") {
  RenderParameters p = small_params(10);
  Viewport vp = viewport_for(p, 70'000, 70'000);
  BatchScheduler sched(1, 1);
  CHECK_THROWS_AS(sched.sample_batch(p, vp, 10), std::invalid_argument);

  CHECK(pixel_count_fits(65'536, 65'535));
  CHECK_FALSE(pixel_count_fits(65'536, 65'536));
  CHECK_FALSE(pixel_count_fits(0, 10));
}
