#pragma once

#include "render_error.hpp"
#include "viewport.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class ColorScheme {
    Classic    = 0,
    Monochrome = 1,
    Spectral   = 2,
    Fire       = 3,
    Ocean      = 4,
};
constexpr int COLOR_SCHEME_COUNT = 5;

extern const char* g_color_scheme_names[COLOR_SCHEME_COUNT];

inline const char* color_scheme_name(ColorScheme s)
{
    const int i = static_cast<int>(s);
    return (i >= 0 && i < COLOR_SCHEME_COUNT) ? g_color_scheme_names[i] : "unknown";
}

// Case-sensitive lookup by lower-case name ("classic", "spectral", ...).
bool parse_color_scheme(const std::string& name, ColorScheme& out);

struct RenderParameters {
    uint32_t    iterations   = 5000;      // max steps per trajectory
    uint64_t    samples      = 10000000;  // total points to test
    double      zoom         = DEFAULT_ZOOM;
    double      center_x     = DEFAULT_CENTER_X;
    double      center_y     = DEFAULT_CENTER_Y;
    ColorScheme color_scheme = ColorScheme::Classic;
};

struct Preset {
    const char*      name;
    RenderParameters params;
};

// Built-in presets, in display order.
const std::vector<Preset>& presets();

// nullptr when no preset has that name.
const Preset* find_preset(const std::string& name);

RenderError validate(const RenderParameters& p);

// Apply one textual "key=value" field. Known keys: iterations, samples, zoom,
// center_x, center_y, color_scheme. `p` is unchanged on error.
RenderError apply_parameter(RenderParameters& p, const std::string& key,
                            const std::string& value);

// Same, for a single "key=value" string.
RenderError apply_assignment(RenderParameters& p, const std::string& assignment);

// Viewport for the given parameters at a resolution.
inline Viewport viewport_for(const RenderParameters& p, int width, int height)
{
    Viewport vp;
    vp.width    = width;
    vp.height   = height;
    vp.zoom     = p.zoom;
    vp.center_x = p.center_x;
    vp.center_y = p.center_y;
    return vp;
}
