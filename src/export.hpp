#pragma once

#include "pixel_buffer.hpp"

#include <string>

enum class ImageFormat {
    Png = 0,
    Jxl = 1,
};

// All return "" on success, otherwise an error message.
std::string save_png(const std::string& path, const PixelBuffer& buf);
std::string save_jxl(const std::string& path, const PixelBuffer& buf);

// Picks the encoder from the file extension (.png or .jxl, any case).
std::string save_image(const std::string& path, const PixelBuffer& buf);

// Lower-case extension for `fmt`, with the dot.
const char* image_extension(ImageFormat fmt);

inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}
