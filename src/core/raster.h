#pragma once

#include "display_layout.h"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace wallspan::core {

constexpr int NUM_CHANNELS = 3;
constexpr int MIN_SPLINE_ORDER = 0;
constexpr int MAX_SPLINE_ORDER = 5;
constexpr int DEFAULT_SPLINE_ORDER = 3;

using Rgb = std::array<unsigned char, 3>;

// Row-major 8-bit RGB pixel buffer.
struct Raster {
    int height = 0;
    int width = 0;
    std::vector<unsigned char> pixels;

    [[nodiscard]] Extent extent() const { return {height, width}; }
    [[nodiscard]] bool empty() const { return height <= 0 || width <= 0; }

    [[nodiscard]] size_t index_of(int y, int x) const {
        return ((static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x)) * NUM_CHANNELS;
    }
    unsigned char* pixel(int y, int x) { return pixels.data() + index_of(y, x); }
    [[nodiscard]] const unsigned char* pixel(int y, int x) const { return pixels.data() + index_of(y, x); }
};

bool allocate_raster(int height, int width, Raster& out, std::string& error);

void fill_raster(Raster& raster, const Rgb& color);

// Resamples source to exactly target. A target equal to the current size
// returns the source unchanged. spline_order selects the filter: 0 nearest
// neighbour, 1 triangle, 2 cubic B-spline, 3 Mitchell, 4 Catmull-Rom and
// 5 Catmull-Rom blended in sRGB space.
bool scale_raster(const Raster& source,
                  Extent target,
                  int spline_order,
                  Raster& out,
                  std::string& error);

// Copies an extents-sized block from src at src_start into dst at dst_start.
// The block is clipped against both rasters; out of range input shrinks the
// copy, possibly to nothing, and is never an error.
void copy_region(Extent extents,
                 const Raster& src,
                 Offset src_start,
                 Raster& dst,
                 Offset dst_start);

} // namespace wallspan::core
