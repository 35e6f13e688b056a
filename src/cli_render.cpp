#include "cli_render.hpp"
#include "cli_benchmark.hpp"
#include "export.hpp"
#include "render_job.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>
#include <string>
#include <vector>

struct CliOptions {
    std::string              preset;
    std::vector<std::string> assignments;   // --set key=value, in order
    int                      width       = 800;
    int                      height      = 600;
    int                      threads     = 0;
    bool                     has_seed    = false;
    uint64_t                 seed        = 0;
    uint64_t                 batch       = DEFAULT_BATCH_SIZE;
    std::string              out         = "buddhabrot.png";
    double                   quality     = 0.95;
    int                      scale       = 1;
    int                      vector_step = 0;
    bool                     benchmark   = false;
    bool                     list        = false;
    bool                     quiet       = false;
};

static void print_usage(const char* argv0)
{
    fprintf(stderr,
        "Usage: %s [options]\n"
        "  --preset NAME        start from a preset (default, detailed, quick, artistic)\n"
        "  --set KEY=VALUE      override a parameter: iterations, samples, zoom,\n"
        "                       center_x, center_y, color_scheme (repeatable)\n"
        "  --size WxH           output resolution (default 800x600)\n"
        "  --threads N          worker threads (default: all cores)\n"
        "  --seed N             fixed random seed\n"
        "  --batch N            samples per batch (default %llu)\n"
        "  --out FILE           output file; .png, .jxl or .svg (default buddhabrot.png)\n"
        "  --quality Q          export quality 0..1 (default 0.95)\n"
        "  --scale S            re-render raster export at S x resolution (1..8)\n"
        "  --step N             SVG grid step in pixels (default: from quality)\n"
        "  --list-presets       print presets and exit\n"
        "  --benchmark          sampling throughput per thread count\n"
        "  --quiet              no progress output\n",
        argv0, static_cast<unsigned long long>(DEFAULT_BATCH_SIZE));
}

static bool parse_int(const char* s, long long lo, long long hi, long long& out)
{
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v < lo || v > hi) return false;
    out = v;
    return true;
}

static bool parse_size(const char* s, int& w, int& h)
{
    const char* x = std::strchr(s, 'x');
    if (!x) return false;
    long long lw, lh;
    const std::string ws(s, x);
    if (!parse_int(ws.c_str(), 1, 16384, lw) || !parse_int(x + 1, 1, 16384, lh))
        return false;
    w = static_cast<int>(lw);
    h = static_cast<int>(lh);
    return true;
}

static bool ends_with(const std::string& s, const char* suffix)
{
    const size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

// Returns false (after printing why) on a bad command line.
static bool parse_args(int argc, char* argv[], CliOptions& opt)
{
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                fprintf(stderr, "error: %s needs a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };
        long long n;

        if (a == "--preset") {
            const char* v = value("--preset"); if (!v) return false;
            opt.preset = v;
        } else if (a == "--set") {
            const char* v = value("--set"); if (!v) return false;
            opt.assignments.push_back(v);
        } else if (a == "--size") {
            const char* v = value("--size"); if (!v) return false;
            if (!parse_size(v, opt.width, opt.height)) {
                fprintf(stderr, "error: bad --size '%s' (expected WxH)\n", v);
                return false;
            }
        } else if (a == "--threads") {
            const char* v = value("--threads"); if (!v) return false;
            if (!parse_int(v, 0, 1024, n)) {
                fprintf(stderr, "error: bad --threads '%s'\n", v);
                return false;
            }
            opt.threads = static_cast<int>(n);
        } else if (a == "--seed") {
            const char* v = value("--seed"); if (!v) return false;
            if (!parse_int(v, 0, 0x7fffffffffffffffLL, n)) {
                fprintf(stderr, "error: bad --seed '%s'\n", v);
                return false;
            }
            opt.seed     = static_cast<uint64_t>(n);
            opt.has_seed = true;
        } else if (a == "--batch") {
            const char* v = value("--batch"); if (!v) return false;
            if (!parse_int(v, 1, 100000000, n)) {
                fprintf(stderr, "error: bad --batch '%s'\n", v);
                return false;
            }
            opt.batch = static_cast<uint64_t>(n);
        } else if (a == "--out") {
            const char* v = value("--out"); if (!v) return false;
            opt.out = v;
        } else if (a == "--quality") {
            const char* v = value("--quality"); if (!v) return false;
            char* end = nullptr;
            opt.quality = std::strtod(v, &end);
            if (end == v || *end != '\0') {
                fprintf(stderr, "error: bad --quality '%s'\n", v);
                return false;
            }
        } else if (a == "--scale") {
            const char* v = value("--scale"); if (!v) return false;
            if (!parse_int(v, 1, 8, n)) {
                fprintf(stderr, "error: bad --scale '%s' (1..8)\n", v);
                return false;
            }
            opt.scale = static_cast<int>(n);
        } else if (a == "--step") {
            const char* v = value("--step"); if (!v) return false;
            if (!parse_int(v, 1, 1024, n)) {
                fprintf(stderr, "error: bad --step '%s'\n", v);
                return false;
            }
            opt.vector_step = static_cast<int>(n);
        } else if (a == "--list-presets") {
            opt.list = true;
        } else if (a == "--benchmark") {
            opt.benchmark = true;
        } else if (a == "--quiet") {
            opt.quiet = true;
        } else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            fprintf(stderr, "error: unknown option '%s'\n", a.c_str());
            print_usage(argv[0]);
            return false;
        }
    }
    return true;
}

static void list_presets()
{
    printf("%-10s %10s %12s %6s %8s %8s  %s\n",
           "name", "iterations", "samples", "zoom", "center_x", "center_y", "scheme");
    for (const Preset& p : presets()) {
        printf("%-10s %10u %12llu %6.2f %8.3f %8.3f  %s\n",
               p.name, p.params.iterations,
               static_cast<unsigned long long>(p.params.samples),
               p.params.zoom, p.params.center_x, p.params.center_y,
               color_scheme_name(p.params.color_scheme));
    }
}

int run_cli(int argc, char* argv[])
{
    CliOptions opt;
    if (!parse_args(argc, argv, opt))
        return 2;

    if (opt.list) {
        list_presets();
        return 0;
    }
    if (opt.benchmark)
        return run_cli_benchmark(opt.threads);

    ExportOptions eo;
    eo.quality     = opt.quality;
    eo.scale       = opt.scale;
    eo.vector_step = opt.vector_step;
    if (ends_with(opt.out, ".svg")) {
        eo.format = ExportFormat::Vector;
    } else if (ends_with(opt.out, ".jxl")) {
        eo.codec = RasterCodec::Jxl;
    } else if (!ends_with(opt.out, ".png")) {
        fprintf(stderr, "error: output must end in .png, .jxl or .svg: %s\n", opt.out.c_str());
        return 2;
    }
    RenderError err = check_export_options(eo);
    if (err) {
        fprintf(stderr, "error: %s\n", err.message.c_str());
        return 2;
    }

    if (!opt.has_seed) {
        std::random_device rd;
        opt.seed = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    }
    RenderJobController ctl(opt.width, opt.height, opt.threads, opt.seed);
    ctl.set_batch_size(opt.batch);

    if (!opt.preset.empty()) {
        err = ctl.load_preset(opt.preset);
        if (err) {
            fprintf(stderr, "error: %s\n", err.message.c_str());
            return 2;
        }
    }
    for (const std::string& kv : opt.assignments) {
        RenderParameters p = ctl.parameters();
        err = apply_assignment(p, kv);
        if (!err) err = ctl.set_parameters(p);
        if (err) {
            fprintf(stderr, "error: %s\n", err.message.c_str());
            return 2;
        }
    }

    const RenderParameters p = ctl.parameters();
    if (!opt.quiet) {
        fprintf(stderr, "Rendering %dx%d  iter %u  samples %llu  zoom %.3f  center (%.5f, %.5f)  %s  [%d threads, seed %llu]\n",
                opt.width, opt.height, p.iterations,
                static_cast<unsigned long long>(p.samples), p.zoom,
                p.center_x, p.center_y, color_scheme_name(p.color_scheme),
                ctl.thread_count(), static_cast<unsigned long long>(opt.seed));
    }

    std::atomic<int> last_pct{-1};
    RenderCallbacks cb;
    cb.on_progress = [&](double progress, float max_density) {
        const int pct = static_cast<int>(progress * 100.0);
        if (!opt.quiet && pct / 5 != last_pct.load() / 5) {
            last_pct = pct;
            fprintf(stderr, "\r  %3d%%  max density %.0f", pct, max_density);
        }
    };
    cb.on_error = [](const RenderError& e) {
        fprintf(stderr, "\nerror: %s: %s\n", error_kind_name(e.kind), e.message.c_str());
    };

    JobHandle handle;
    err = ctl.render(cb, handle);
    if (err) {
        fprintf(stderr, "error: %s\n", err.message.c_str());
        return 2;
    }
    ctl.wait();
    if (!opt.quiet) fprintf(stderr, "\n");

    if (ctl.status() != JobStatus::Complete)
        return 1;

    if (!opt.quiet) {
        if (auto m = ctl.performance_metrics()) {
            fprintf(stderr, "Done in %.2f s  (%.0f samples/s, %.1f MB buffer)\n",
                    m->elapsed_seconds, m->samples_per_second,
                    static_cast<double>(m->memory_bytes) / (1024.0 * 1024.0));
        }
    }

    const ExportResult res = ctl.export_image(eo);
    if (res.error) {
        fprintf(stderr, "error: %s: %s\n", error_kind_name(res.error.kind),
                res.error.message.c_str());
        return 1;
    }
    const std::string msg = write_file(opt.out.c_str(), res.bytes);
    if (!msg.empty()) {
        fprintf(stderr, "error: %s\n", msg.c_str());
        return 1;
    }
    if (!opt.quiet)
        fprintf(stderr, "Saved: %s (%zu bytes)\n", opt.out.c_str(), res.bytes.size());
    return 0;
}
