#include "render_params.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

const char* g_color_scheme_names[COLOR_SCHEME_COUNT] = {
    "classic",
    "monochrome",
    "spectral",
    "fire",
    "ocean",
};

bool parse_color_scheme(const std::string& name, ColorScheme& out)
{
    for (int i = 0; i < COLOR_SCHEME_COUNT; ++i) {
        if (name == g_color_scheme_names[i]) {
            out = static_cast<ColorScheme>(i);
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Presets
// ---------------------------------------------------------------------------
const std::vector<Preset>& presets()
{
    //                                 iter   samples    zoom  cx    cy   scheme
    static const std::vector<Preset> list = {
        {"default",  {5000, 10000000ull, 1.0, -0.7, 0.0, ColorScheme::Classic   }},
        {"detailed", {8000, 50000000ull, 1.0, -0.7, 0.0, ColorScheme::Spectral  }},
        {"quick",    {1000,  1000000ull, 1.0, -0.7, 0.0, ColorScheme::Monochrome}},
        {"artistic", {6000, 25000000ull, 1.5, -0.8, 0.2, ColorScheme::Fire      }},
    };
    return list;
}

const Preset* find_preset(const std::string& name)
{
    for (const Preset& p : presets())
        if (name == p.name) return &p;
    return nullptr;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
RenderError validate(const RenderParameters& p)
{
    if (p.iterations == 0)
        return RenderError::invalid("iterations must be > 0");
    if (p.samples == 0)
        return RenderError::invalid("samples must be > 0");
    if (!std::isfinite(p.zoom) || p.zoom <= 0.0)
        return RenderError::invalid("zoom must be a finite value > 0");
    if (!std::isfinite(p.center_x) || !std::isfinite(p.center_y))
        return RenderError::invalid("center must be finite");
    const int s = static_cast<int>(p.color_scheme);
    if (s < 0 || s >= COLOR_SCHEME_COUNT)
        return RenderError::invalid("unknown color scheme");
    return {};
}

// ---------------------------------------------------------------------------
// Textual field updates
// ---------------------------------------------------------------------------
static bool parse_u64(const std::string& s, uint64_t& out)
{
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = static_cast<uint64_t>(v);
    return true;
}

static bool parse_double(const std::string& s, double& out)
{
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

RenderError apply_parameter(RenderParameters& p, const std::string& key,
                            const std::string& value)
{
    RenderParameters next = p;

    if (key == "iterations") {
        uint64_t v;
        if (!parse_u64(value, v) || v > std::numeric_limits<uint32_t>::max())
            return RenderError::invalid("iterations: not an unsigned 32-bit integer: " + value);
        next.iterations = static_cast<uint32_t>(v);
    } else if (key == "samples") {
        uint64_t v;
        if (!parse_u64(value, v))
            return RenderError::invalid("samples: not an unsigned integer: " + value);
        next.samples = v;
    } else if (key == "zoom") {
        if (!parse_double(value, next.zoom))
            return RenderError::invalid("zoom: not a number: " + value);
    } else if (key == "center_x") {
        if (!parse_double(value, next.center_x))
            return RenderError::invalid("center_x: not a number: " + value);
    } else if (key == "center_y") {
        if (!parse_double(value, next.center_y))
            return RenderError::invalid("center_y: not a number: " + value);
    } else if (key == "color_scheme") {
        if (!parse_color_scheme(value, next.color_scheme))
            return RenderError::invalid("unknown color scheme: " + value);
    } else {
        return RenderError::invalid("unknown parameter: " + key);
    }

    RenderError err = validate(next);
    if (err) return err;
    p = next;
    return {};
}

RenderError apply_assignment(RenderParameters& p, const std::string& assignment)
{
    const size_t eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0)
        return RenderError::invalid("expected key=value, got: " + assignment);
    return apply_parameter(p, assignment.substr(0, eq), assignment.substr(eq + 1));
}
