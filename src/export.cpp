#include "export.hpp"
#include "log.hpp"

#include <png.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

#ifdef HAVE_JXL
#include <jxl/color_encoding.h>
#include <jxl/encode.h>
#endif

namespace {

std::string lower_extension(const std::string& path)
{
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || path.find_first_of("/\\", dot) != std::string::npos)
        return {};
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

std::string check_buffer(const PixelBuffer& buf)
{
    if (buf.empty()) return "Nothing to export: framebuffer is empty";
    if (buf.pixels.size() != static_cast<size_t>(buf.width) * buf.height)
        return "Nothing to export: framebuffer size mismatch";
    return {};
}

}  // namespace

const char* image_extension(ImageFormat fmt)
{
    return fmt == ImageFormat::Jxl ? ".jxl" : ".png";
}

// ---------------------------------------------------------------------------
// PNG (8-bit RGBA)
//
// Pixels are 0xAABBGGRR, i.e. bytes R, G, B, A in memory on little-endian
// hosts, which is the row layout PNG_COLOR_TYPE_RGBA expects.
// ---------------------------------------------------------------------------
std::string save_png(const std::string& path, const PixelBuffer& buf)
{
    std::string err = check_buffer(buf);
    if (!err.empty()) return err;

    FILE* fp = std::fopen(path.c_str(), "wb");
    if (!fp) return "Cannot open file for writing: " + path;

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop   info = png ? png_create_info_struct(png) : nullptr;
    if (!png || !info) {
        png_destroy_write_struct(png ? &png : nullptr, nullptr);
        std::fclose(fp);
        return "libpng initialization failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error: " + path;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        const auto* row = reinterpret_cast<png_const_bytep>(
            buf.pixels.data() + static_cast<size_t>(y) * buf.width);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0) return "Write failed: " + path;
    return {};
}

// ---------------------------------------------------------------------------
// JPEG XL (lossless RGBA, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
namespace {

std::string encode_jxl(JxlEncoder* enc, const PixelBuffer& buf, std::vector<uint8_t>& out)
{
    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                 = static_cast<uint32_t>(buf.width);
    bi.ysize                 = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample       = 8;
    bi.alpha_bits            = 8;
    bi.num_color_channels    = 3;
    bi.num_extra_channels    = 1;
    bi.uses_original_profile = JXL_TRUE;
    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetBasicInfo failed";

    JxlExtraChannelInfo alpha;
    JxlEncoderInitExtraChannelInfo(JXL_CHANNEL_ALPHA, &alpha);
    alpha.bits_per_sample = 8;
    if (JxlEncoderSetExtraChannelInfo(enc, 0, &alpha) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetExtraChannelInfo failed";

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetColorEncoding failed";

    JxlEncoderFrameSettings* frame = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (JxlEncoderSetFrameLossless(frame, JXL_TRUE) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetFrameLossless failed";

    const JxlPixelFormat fmt  = {4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    const size_t         size = buf.pixels.size() * sizeof(uint32_t);
    if (JxlEncoderAddImageFrame(frame, &fmt, buf.pixels.data(), size) != JXL_ENC_SUCCESS)
        return "JxlEncoderAddImageFrame failed";
    JxlEncoderCloseInput(enc);

    out.resize(1 << 16);
    uint8_t* next  = out.data();
    size_t   avail = out.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next, &avail)) == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = static_cast<size_t>(next - out.data());
        out.resize(out.size() * 2);
        next  = out.data() + used;
        avail = out.size() - used;
    }
    if (status != JXL_ENC_SUCCESS) return "JxlEncoderProcessOutput failed";
    out.resize(static_cast<size_t>(next - out.data()));
    return {};
}

}  // namespace
#endif

std::string save_jxl(const std::string& path, const PixelBuffer& buf)
{
#ifdef HAVE_JXL
    std::string err = check_buffer(buf);
    if (!err.empty()) return err;

    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";
    std::vector<uint8_t> encoded;
    err = encode_jxl(enc, buf, encoded);
    JxlEncoderDestroy(enc);
    if (!err.empty()) return err;

    FILE* fp = std::fopen(path.c_str(), "wb");
    if (!fp) return "Cannot open file for writing: " + path;
    const size_t written = std::fwrite(encoded.data(), 1, encoded.size(), fp);
    if (std::fclose(fp) != 0 || written != encoded.size()) return "Write failed: " + path;
    return {};
#else
    (void)buf;
    return "JPEG XL support is not compiled in: " + path;
#endif
}

std::string save_image(const std::string& path, const PixelBuffer& buf)
{
    const std::string ext = lower_extension(path);
    std::string err;
    if (ext == ".png")
        err = save_png(path, buf);
    else if (ext == ".jxl")
        err = save_jxl(path, buf);
    else
        err = "Unsupported image extension '" + ext + "' (use .png or .jxl)";

    if (err.empty())
        fractal_log().info("Exported {}x{} image to {}", buf.width, buf.height, path);
    else
        fractal_log().error("Export failed: {}", err);
    return err;
}
