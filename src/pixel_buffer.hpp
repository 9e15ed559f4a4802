#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

// RGBA pixels, packed 0xAABBGGRR, row-major from the top-left corner.
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

    void clear(uint32_t color = 0xFF000000u) { std::fill(pixels.begin(), pixels.end(), color); }

    bool empty() const { return width <= 0 || height <= 0; }

    uint32_t& at(int x, int y)       { return pixels[static_cast<size_t>(y) * width + x]; }
    uint32_t  at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
};
