#pragma once

#include "buffers.hpp"
#include "render_error.hpp"
#include "render_params.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class ExportFormat {
    Raster = 0,
    Vector = 1,
};

enum class RasterCodec {
    Png = 0,
    Jxl = 1,   // only with HAVE_JXL
};

struct ExportOptions {
    ExportFormat format      = ExportFormat::Raster;
    RasterCodec  codec       = RasterCodec::Png;
    double       quality     = 0.95;  // 0..1
    int          scale       = 1;     // raster only; >1 re-renders, 1..8
    int          vector_step = 0;     // grid step in pixels; 0 = from quality
};

// zlib effort for PNG: quality 0 -> level 0, quality 1 -> level 9.
int png_level_for_quality(double quality);

// Vector grid step: quality 1 -> 1 px, quality 0 -> 10 px.
int vector_step_for_quality(double quality);

RenderError check_export_options(const ExportOptions& opt);

// ExportFailure when a width x height render at `scale` would not fit the
// pixel index range.
RenderError check_export_size(int width, int height, int scale);

// All encoders return an empty string on success, or an error message on
// failure. `out` is replaced with the encoded bytes.
std::string encode_png(const PixelBuffer& buf, int compression_level,
                       std::vector<uint8_t>& out);

#ifdef HAVE_JXL
// quality >= 1 is lossless, below that a perceptual distance is derived.
std::string encode_jxl(const PixelBuffer& buf, double quality,
                       std::vector<uint8_t>& out);
#endif

// One step x step rectangle per non-zero grid cell, opacity = normalized
// density. Approximate by construction.
std::string encode_svg(const AccumulationBuffer& acc, ColorScheme scheme,
                       int step, std::vector<uint8_t>& out);

// Colour + encode a buffer at its own resolution (scale is ignored here).
RenderError export_buffer(const AccumulationBuffer& acc, ColorScheme scheme,
                          const ExportOptions& opt, std::vector<uint8_t>& out);

std::string write_file(const char* path, const std::vector<uint8_t>& bytes);

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}
