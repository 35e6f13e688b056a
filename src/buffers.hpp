#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Pixel buffer: RGBA, little-endian packed as 0xAABBGGRR
struct PixelBuffer {
    std::vector<uint32_t> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0xFF000000u);
    }
};

// Largest float at which +1 is still exact. Cells stop counting here instead
// of silently stalling somewhere above it.
static constexpr float DENSITY_CEILING = 16777216.0f;  // 2^24

// Hit indices are 32-bit, so no raster may have more cells than this.
static constexpr uint64_t MAX_PIXELS = 0xFFFFFFFFull;

inline bool pixel_count_fits(int w, int h)
{
    return w > 0 && h > 0 &&
           static_cast<uint64_t>(w) * static_cast<uint64_t>(h) <= MAX_PIXELS;
}

// Per-pixel visit counts of a Buddhabrot render.
struct AccumulationBuffer {
    std::vector<float> density;
    int   width       = 0;
    int   height      = 0;
    float max_density = 0.0f;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        density.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0.0f);
        max_density = 0.0f;
    }

    // Returns false when the cell is already saturated.
    bool increment(size_t idx)
    {
        float& d = density[idx];
        if (d >= DENSITY_CEILING) return false;
        d += 1.0f;
        if (d > max_density) max_density = d;
        return true;
    }

    float at(int x, int y) const
    {
        return density[static_cast<size_t>(y) * width + x];
    }

    size_t memory_bytes() const { return density.size() * sizeof(float); }
};
