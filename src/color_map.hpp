#pragma once

#include "buffers.hpp"
#include "render_params.hpp"

#include <cstdint>

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Rgb& a, const Rgb& b)
{
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

// Per-channel multipliers of the tinted schemes. Spectral has no tint.
struct SchemeTint { float r, g, b; };
extern const SchemeTint g_scheme_tints[COLOR_SCHEME_COUNT];

static constexpr double DENSITY_GAMMA = 0.5;

// Map one density sample to a color. Zero density is always black.
Rgb map_density(float density, float max_density, ColorScheme scheme);

// Packed 0xAABBGGRR, opaque (see PixelBuffer).
inline uint32_t pack_rgba(const Rgb& c)
{
    return 0xFF000000u
         | (static_cast<uint32_t>(c.b) << 16)
         | (static_cast<uint32_t>(c.g) <<  8)
         |  static_cast<uint32_t>(c.r);
}

// Rasterize a whole buffer (completed or in progress). `out` is resized to
// the buffer's dimensions.
void colorize(const AccumulationBuffer& acc, ColorScheme scheme, PixelBuffer& out);
