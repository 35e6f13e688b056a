#pragma once

#include "viewport.hpp"

#include <cstdint>
#include <optional>
#include <vector>

using Trajectory = std::vector<ComplexPoint>;

static constexpr double BAILOUT_SQR = 4.0;

// Iterate z <- z^2 + c from z0 = 0, appending every z_n to `out` before it is
// stepped. Returns true when |z_n|^2 > 4 for some n < max_iter (the point
// escaped and `out` holds its orbit), false for bounded points.
// `out` is cleared first so the caller can reuse its capacity across samples.
inline bool trace_trajectory(const ComplexPoint& c, uint32_t max_iter, Trajectory& out)
{
    out.clear();
    double zr = 0.0, zi = 0.0;
    for (uint32_t n = 0; n < max_iter; ++n) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        if (zr2 + zi2 > BAILOUT_SQR)
            return true;
        out.push_back({zr, zi});
        const double new_zr = zr2 - zi2 + c.re;
        zi = 2.0 * zr * zi + c.im;
        zr = new_zr;
    }
    return false;
}

// Owning variant; nullopt for points that never escape within max_iter.
inline std::optional<Trajectory> sample_trajectory(const ComplexPoint& c, uint32_t max_iter)
{
    Trajectory t;
    if (!trace_trajectory(c, max_iter, t))
        return std::nullopt;
    return t;
}
