#include "export.hpp"
#include "color_map.hpp"

#include <png.h>
#include <algorithm>
#include <cmath>
#include <climits>
#include <cstdio>
#include <cstring>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

int png_level_for_quality(double quality)
{
    const double q = std::max(0.0, std::min(1.0, quality));
    return static_cast<int>(std::lround(q * 9.0));
}

int vector_step_for_quality(double quality)
{
    const double q = std::max(0.0, std::min(1.0, quality));
    return static_cast<int>(std::lround(10.0 - 9.0 * q));
}

RenderError check_export_options(const ExportOptions& opt)
{
    if (!(opt.quality >= 0.0 && opt.quality <= 1.0))
        return RenderError::invalid("export quality must be in [0, 1]");
    if (opt.scale < 1 || opt.scale > 8)
        return RenderError::invalid("export scale must be in [1, 8]");
    if (opt.vector_step < 0)
        return RenderError::invalid("vector step must be >= 0");
    if (opt.format == ExportFormat::Raster && opt.codec == RasterCodec::Jxl && !jxl_available())
        return RenderError::invalid("JPEG XL support not compiled in");
    return {};
}

RenderError check_export_size(int width, int height, int scale)
{
    if (width <= 0 || height <= 0 || scale < 1)
        return RenderError::export_failure("nothing to export");
    const uint64_t w = static_cast<uint64_t>(width)  * static_cast<uint64_t>(scale);
    const uint64_t h = static_cast<uint64_t>(height) * static_cast<uint64_t>(scale);
    if (w > static_cast<uint64_t>(INT_MAX) || h > static_cast<uint64_t>(INT_MAX) ||
        w * h > MAX_PIXELS)
        return RenderError::export_failure("scaled export exceeds " +
                                           std::to_string(MAX_PIXELS) + " pixels");
    return {};
}

// ---------------------------------------------------------------------------
// PNG export
//
// Pixel layout: each uint32_t stores 0xAA BB GG RR.
// On a little-endian machine the bytes in memory are [R, G, B, A], which is
// exactly what PNG_COLOR_TYPE_RGBA expects, so no conversion is needed.
// ---------------------------------------------------------------------------
static void png_append(png_structp png, png_bytep data, png_size_t len)
{
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + len);
}

static void png_flush_noop(png_structp) {}

std::string encode_png(const PixelBuffer& buf, int compression_level,
                       std::vector<uint8_t>& out)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "empty image";

    // Encode into a local vector so `out` is untouched on failure.
    std::vector<uint8_t> bytes;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png)
        return "png_create_write_struct failed";

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return "PNG write error (libpng longjmp)";
    }

    png_set_write_fn(png, &bytes, png_append, png_flush_noop);
    png_set_compression_level(png, std::max(0, std::min(9, compression_level)));
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        const png_const_bytep row = reinterpret_cast<png_const_bytep>(
            buf.pixels.data() + static_cast<size_t>(y) * buf.width);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    out.swap(bytes);
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (RGBA, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string encode_jxl(const PixelBuffer& buf, double quality,
                       std::vector<uint8_t>& out)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "empty image";

    const bool lossless = quality >= 1.0;

    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    // Basic image info
    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                     = static_cast<uint32_t>(buf.width);
    bi.ysize                     = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample           = 8;
    bi.exponent_bits_per_sample  = 0;
    bi.alpha_bits                = 8;
    bi.alpha_exponent_bits       = 0;
    bi.num_color_channels        = 3;
    bi.num_extra_channels        = 1;
    bi.uses_original_profile     = lossless ? JXL_TRUE : JXL_FALSE;

    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetBasicInfo failed";
    }

    // Alpha extra-channel info
    JxlExtraChannelInfo eci;
    JxlEncoderInitExtraChannelInfo(JXL_CHANNEL_ALPHA, &eci);
    eci.bits_per_sample          = 8;
    eci.exponent_bits_per_sample = 0;
    if (JxlEncoderSetExtraChannelInfo(enc, 0, &eci) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetExtraChannelInfo failed";
    }

    // sRGB colour encoding
    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetColorEncoding failed";
    }

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (lossless) {
        if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS) {
            JxlEncoderDestroy(enc);
            return "JxlEncoderSetFrameLossless failed";
        }
    } else {
        // quality 0 -> distance 15 (worst), quality ~1 -> distance 0.1
        const float distance = static_cast<float>(
            0.1 + (1.0 - std::max(0.0, quality)) * 14.9);
        if (JxlEncoderSetFrameDistance(opts, distance) != JXL_ENC_SUCCESS) {
            JxlEncoderDestroy(enc);
            return "JxlEncoderSetFrameDistance failed";
        }
    }

    // Add image frame (raw RGBA bytes, see PixelBuffer for layout)
    JxlPixelFormat fmt = {4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    const size_t data_size = static_cast<size_t>(buf.width) * buf.height * 4;
    if (JxlEncoderAddImageFrame(opts, &fmt, buf.pixels.data(), data_size)
            != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderAddImageFrame failed";
    }
    JxlEncoderCloseInput(enc);

    // Collect compressed output
    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    JxlEncoderDestroy(enc);

    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";

    output.resize(static_cast<size_t>(next_out - output.data()));
    out.swap(output);
    return {};  // success
}
#endif  // HAVE_JXL

// ---------------------------------------------------------------------------
// SVG export: coarse grid of translucent rectangles
// ---------------------------------------------------------------------------
std::string encode_svg(const AccumulationBuffer& acc, ColorScheme scheme,
                       int step, std::vector<uint8_t>& out)
{
    if (acc.width <= 0 || acc.height <= 0)
        return "empty buffer";
    if (step < 1)
        return "vector step must be >= 1";

    const int   W     = acc.width;
    const int   H     = acc.height;
    const float max_d = acc.max_density;

    std::string svg;
    char line[256];
    std::snprintf(line, sizeof(line),
                  "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"%d\" height=\"%d\" "
                  "viewBox=\"0 0 %d %d\">\n", W, H, W, H);
    svg += line;
    svg += "<rect width=\"100%\" height=\"100%\" fill=\"black\"/>\n";

    if (max_d > 0.0f) {
        for (int y = 0; y < H; y += step) {
            for (int x = 0; x < W; x += step) {
                const float d = acc.at(x, y);
                if (d <= 0.0f) continue;
                const double norm = std::min(1.0, static_cast<double>(d) / max_d);
                // Tinted schemes use their full-intensity tint; opacity
                // carries the density. Spectral keeps its per-density hue.
                const Rgb c = map_density(scheme == ColorScheme::Spectral ? d : max_d,
                                          max_d, scheme);
                std::snprintf(line, sizeof(line),
                              "<rect x=\"%d\" y=\"%d\" width=\"%d\" height=\"%d\" "
                              "fill=\"#%02x%02x%02x\" opacity=\"%.4f\"/>\n",
                              x, y, std::min(step, W - x), std::min(step, H - y),
                              c.r, c.g, c.b, norm);
                svg += line;
            }
        }
    }

    svg += "</svg>\n";
    out.assign(svg.begin(), svg.end());
    return {};  // success
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
RenderError export_buffer(const AccumulationBuffer& acc, ColorScheme scheme,
                          const ExportOptions& opt, std::vector<uint8_t>& out)
{
    RenderError err = check_export_options(opt);
    if (err) return err;

    std::string msg;
    if (opt.format == ExportFormat::Vector) {
        const int step = opt.vector_step > 0 ? opt.vector_step
                                             : vector_step_for_quality(opt.quality);
        msg = encode_svg(acc, scheme, step, out);
    } else {
        PixelBuffer pixels;
        colorize(acc, scheme, pixels);
        if (opt.codec == RasterCodec::Jxl) {
#ifdef HAVE_JXL
            msg = encode_jxl(pixels, opt.quality, out);
#endif
        } else {
            msg = encode_png(pixels, png_level_for_quality(opt.quality), out);
        }
    }

    if (!msg.empty())
        return RenderError::export_failure(msg);
    return {};
}

std::string write_file(const char* path, const std::vector<uint8_t>& bytes)
{
    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;
    const size_t n = std::fwrite(bytes.data(), 1, bytes.size(), fp);
    const bool   ok = (n == bytes.size());
    if (std::fclose(fp) != 0 || !ok)
        return std::string("Short write to: ") + path;
    return {};  // success
}
