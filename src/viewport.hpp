#pragma once

#include <cmath>
#include <cstdint>

struct ComplexPoint {
    double re = 0.0;
    double im = 0.0;
};

// Home view of the Buddhabrot: the whole set fits at zoom 1.
static constexpr double DEFAULT_CENTER_X = -0.7;
static constexpr double DEFAULT_CENTER_Y =  0.0;
static constexpr double DEFAULT_ZOOM     =  1.0;

// Screen <-> complex-plane mapping.
//   screen = (complex - center) * zoom / 4 * resolution + resolution / 2
// applied independently per axis, so the visible rectangle is always
// center +/- 2/zoom on both axes regardless of aspect ratio.
struct Viewport {
    int    width    = 0;
    int    height   = 0;
    double zoom     = DEFAULT_ZOOM;
    double center_x = DEFAULT_CENTER_X;
    double center_y = DEFAULT_CENTER_Y;

    // Continuous screen coordinate, before flooring to a pixel.
    double screen_x(double re) const
    {
        return (re - center_x) * zoom / 4.0 * width + width * 0.5;
    }
    double screen_y(double im) const
    {
        return (im - center_y) * zoom / 4.0 * height + height * 0.5;
    }

    // Pixel containing c. Returns false (and leaves x, y untouched) when the
    // point lies outside the raster; callers must drop it, never clamp.
    bool to_screen(const ComplexPoint& c, int& x, int& y) const
    {
        const double sx = std::floor(screen_x(c.re));
        const double sy = std::floor(screen_y(c.im));
        if (!(sx >= 0.0 && sx < width && sy >= 0.0 && sy < height))
            return false;
        x = static_cast<int>(sx);
        y = static_cast<int>(sy);
        return true;
    }

    ComplexPoint to_complex(double sx, double sy) const
    {
        return { (sx - width  * 0.5) * 4.0 / (zoom * width)  + center_x,
                 (sy - height * 0.5) * 4.0 / (zoom * height) + center_y };
    }

    // Half extent of the visible rectangle in complex-plane units.
    double half_span() const { return 2.0 / zoom; }

    size_t pixel_count() const
    {
        return static_cast<size_t>(width) * static_cast<size_t>(height);
    }
};

// Navigation helpers. Factors <= 0 are rejected by the controller before they
// get here.
inline void zoom_in(Viewport& vp, double factor)  { vp.zoom *= factor; }
inline void zoom_out(Viewport& vp, double factor) { vp.zoom /= factor; }

inline void pan_to(Viewport& vp, double sx, double sy)
{
    const ComplexPoint c = vp.to_complex(sx, sy);
    vp.center_x = c.re;
    vp.center_y = c.im;
}

// Reset navigation (center, zoom) but keep the resolution.
inline void reset_view(Viewport& vp)
{
    vp.zoom     = DEFAULT_ZOOM;
    vp.center_x = DEFAULT_CENTER_X;
    vp.center_y = DEFAULT_CENTER_Y;
}
