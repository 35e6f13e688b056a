#include "color_map.hpp"

#include <algorithm>
#include <cmath>

const SchemeTint g_scheme_tints[COLOR_SCHEME_COUNT] = {
    {1.0f, 0.3f, 0.3f},   // classic
    {1.0f, 1.0f, 1.0f},   // monochrome
    {0.0f, 0.0f, 0.0f},   // spectral (hue rotation, tint unused)
    {1.0f, 0.5f, 0.0f},   // fire
    {0.0f, 0.7f, 1.0f},   // ocean
};

static uint8_t to_channel(double v)
{
    return static_cast<uint8_t>(std::max(0.0, std::min(255.0, v)));
}

// Three sinusoids 120 degrees apart; avoids the banding of a stepped LUT.
static Rgb spectral_color(double t)
{
    constexpr double TWO_PI = 6.283185307179586;
    const double r = std::sin(t * TWO_PI)                  * 0.5 + 0.5;
    const double g = std::sin(t * TWO_PI + TWO_PI / 3.0)   * 0.5 + 0.5;
    const double b = std::sin(t * TWO_PI + TWO_PI * 2/3.0) * 0.5 + 0.5;
    return { to_channel(std::floor(r * 255.0)),
             to_channel(std::floor(g * 255.0)),
             to_channel(std::floor(b * 255.0)) };
}

Rgb map_density(float density, float max_density, ColorScheme scheme)
{
    if (!(density > 0.0f) || !(max_density > 0.0f))
        return {};

    // A stale max during live preview can put density above it.
    const double normalized = std::min(1.0, static_cast<double>(density) / max_density);

    if (scheme == ColorScheme::Spectral)
        return spectral_color(normalized);

    const int s = static_cast<int>(scheme);
    const SchemeTint& tint = g_scheme_tints[(s >= 0 && s < COLOR_SCHEME_COUNT) ? s : 0];
    const double intensity = std::pow(normalized, DENSITY_GAMMA) * 255.0;
    return { to_channel(intensity * tint.r),
             to_channel(intensity * tint.g),
             to_channel(intensity * tint.b) };
}

void colorize(const AccumulationBuffer& acc, ColorScheme scheme, PixelBuffer& out)
{
    if (out.width != acc.width || out.height != acc.height)
        out.resize(acc.width, acc.height);

    const float max_d = acc.max_density;
    const size_t n = acc.density.size();
    for (size_t i = 0; i < n; ++i)
        out.pixels[i] = pack_rgba(map_density(acc.density[i], max_d, scheme));
}
