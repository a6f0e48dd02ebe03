#include "raster.h"

#include <algorithm>
#include <cstring>
#include <limits>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize.h>

namespace wallspan::core {

namespace {

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

struct FilterChoice {
    stbir_filter filter;
    stbir_colorspace colorspace;
};

FilterChoice filter_for_spline_order(int spline_order) {
    switch (spline_order) {
        case 1:
            return {STBIR_FILTER_TRIANGLE, STBIR_COLORSPACE_LINEAR};
        case 2:
            return {STBIR_FILTER_CUBICBSPLINE, STBIR_COLORSPACE_LINEAR};
        case 3:
            return {STBIR_FILTER_MITCHELL, STBIR_COLORSPACE_LINEAR};
        case 4:
            return {STBIR_FILTER_CATMULLROM, STBIR_COLORSPACE_LINEAR};
        default:
            return {STBIR_FILTER_CATMULLROM, STBIR_COLORSPACE_SRGB};
    }
}

// Samples the source pixel whose area contains the centre of each output pixel.
int nearest_source_index(int out_index, int out_size, int source_size) {
    const long long scaled = (2LL * out_index + 1) * source_size / (2LL * out_size);
    return static_cast<int>(std::min<long long>(scaled, source_size - 1));
}

void scale_nearest(const Raster& source, Raster& out) {
    std::vector<int> sample_cols(static_cast<size_t>(out.width));
    for (int col = 0; col < out.width; ++col) {
        sample_cols[static_cast<size_t>(col)] = nearest_source_index(col, out.width, source.width);
    }
    for (int row = 0; row < out.height; ++row) {
        const int sample_y = nearest_source_index(row, out.height, source.height);
        for (int col = 0; col < out.width; ++col) {
            std::memcpy(out.pixel(row, col),
                        source.pixel(sample_y, sample_cols[static_cast<size_t>(col)]),
                        NUM_CHANNELS);
        }
    }
}

// Narrows one dimension of a copy so that [src_start, src_start + extent)
// and [dst_start, dst_start + extent) both lie inside their rasters.
void clamp_copy_dimension(long long& extent,
                          long long& src_start,
                          long long src_size,
                          long long& dst_start,
                          long long dst_size) {
    extent = std::max(0LL, extent);
    if (src_start < 0) {
        extent += src_start;
        dst_start -= src_start;
        src_start = 0;
    }
    if (dst_start < 0) {
        extent += dst_start;
        src_start -= dst_start;
        dst_start = 0;
    }
    if (src_start >= src_size || dst_start >= dst_size) {
        extent = 0;
        return;
    }
    extent = std::min(extent, src_size - src_start);
    extent = std::min(extent, dst_size - dst_start);
    extent = std::max(0LL, extent);
}

} // namespace

bool allocate_raster(int height, int width, Raster& out, std::string& error) {
    if (height <= 0 || width <= 0) {
        error = "invalid raster size " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }
    size_t pixel_count = 0;
    size_t byte_count = 0;
    if (!checked_mul_size_t(static_cast<size_t>(height), static_cast<size_t>(width), pixel_count)
        || !checked_mul_size_t(pixel_count, NUM_CHANNELS, byte_count)) {
        error = "raster size is too large";
        return false;
    }
    out.height = height;
    out.width = width;
    out.pixels.assign(byte_count, 0);
    return true;
}

void fill_raster(Raster& raster, const Rgb& color) {
    for (size_t offset = 0; offset + NUM_CHANNELS <= raster.pixels.size(); offset += NUM_CHANNELS) {
        raster.pixels[offset + 0] = color[0];
        raster.pixels[offset + 1] = color[1];
        raster.pixels[offset + 2] = color[2];
    }
}

bool scale_raster(const Raster& source,
                  Extent target,
                  int spline_order,
                  Raster& out,
                  std::string& error) {
    if (source.empty()) {
        error = "cannot scale an empty image";
        return false;
    }
    if (spline_order < MIN_SPLINE_ORDER || spline_order > MAX_SPLINE_ORDER) {
        error = "spline order " + std::to_string(spline_order) + " is not in the range 0-5";
        return false;
    }
    if (target == source.extent()) {
        out = source;
        return true;
    }

    Raster scaled;
    if (!allocate_raster(target.height, target.width, scaled, error)) {
        return false;
    }

    if (spline_order == 0) {
        scale_nearest(source, scaled);
    } else {
        const FilterChoice choice = filter_for_spline_order(spline_order);
        const int ok = stbir_resize_uint8_generic(
            source.pixels.data(), source.width, source.height, source.width * NUM_CHANNELS,
            scaled.pixels.data(), scaled.width, scaled.height, scaled.width * NUM_CHANNELS,
            NUM_CHANNELS, STBIR_ALPHA_CHANNEL_NONE, 0,
            STBIR_EDGE_CLAMP, choice.filter, choice.colorspace, nullptr);
        if (ok == 0) {
            error = "image resampling failed";
            return false;
        }
    }

    out = std::move(scaled);
    return true;
}

void copy_region(Extent extents,
                 const Raster& src,
                 Offset src_start,
                 Raster& dst,
                 Offset dst_start) {
    long long rows = extents.height;
    long long cols = extents.width;
    long long src_y = src_start.y;
    long long src_x = src_start.x;
    long long dst_y = dst_start.y;
    long long dst_x = dst_start.x;

    clamp_copy_dimension(rows, src_y, src.height, dst_y, dst.height);
    clamp_copy_dimension(cols, src_x, src.width, dst_x, dst.width);
    if (rows <= 0 || cols <= 0) {
        return;
    }

    const size_t row_bytes = static_cast<size_t>(cols) * NUM_CHANNELS;
    for (long long row = 0; row < rows; ++row) {
        std::memcpy(dst.pixel(static_cast<int>(dst_y + row), static_cast<int>(dst_x)),
                    src.pixel(static_cast<int>(src_y + row), static_cast<int>(src_x)),
                    row_bytes);
    }
}

} // namespace wallspan::core
