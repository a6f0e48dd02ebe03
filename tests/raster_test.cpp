#include "core/raster.h"

#include <gtest/gtest.h>

using namespace wallspan::core;

namespace {

// Every pixel gets a distinct color derived from its position.
Raster make_gradient(int height, int width) {
    Raster raster;
    std::string error;
    EXPECT_TRUE(allocate_raster(height, width, raster, error));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            unsigned char* px = raster.pixel(y, x);
            px[0] = static_cast<unsigned char>(y);
            px[1] = static_cast<unsigned char>(x);
            px[2] = 7;
        }
    }
    return raster;
}

Raster make_solid(int height, int width, Rgb color) {
    Raster raster;
    std::string error;
    EXPECT_TRUE(allocate_raster(height, width, raster, error));
    fill_raster(raster, color);
    return raster;
}

bool pixel_is(const Raster& raster, int y, int x, Rgb color) {
    const unsigned char* px = raster.pixel(y, x);
    return px[0] == color[0] && px[1] == color[1] && px[2] == color[2];
}

} // namespace

TEST(Raster, AllocateRejectsEmptySize) {
    Raster raster;
    std::string error;
    EXPECT_FALSE(allocate_raster(0, 10, raster, error));
    EXPECT_FALSE(error.empty());
    ASSERT_TRUE(allocate_raster(2, 3, raster, error));
    EXPECT_EQ(raster.pixels.size(), 2u * 3u * NUM_CHANNELS);
}

TEST(Raster, ScaleToSameSizeIsIdentity) {
    const Raster source = make_gradient(5, 9);
    for (int order = MIN_SPLINE_ORDER; order <= MAX_SPLINE_ORDER; ++order) {
        Raster out;
        std::string error;
        ASSERT_TRUE(scale_raster(source, source.extent(), order, out, error)) << error;
        EXPECT_EQ(out.extent(), source.extent());
        EXPECT_EQ(out.pixels, source.pixels);
    }
}

TEST(Raster, ScaleProducesRequestedSizeForEveryOrder) {
    const Raster source = make_gradient(600, 800);
    const Extent target{768, 1024};
    for (int order = MIN_SPLINE_ORDER; order <= MAX_SPLINE_ORDER; ++order) {
        Raster out;
        std::string error;
        ASSERT_TRUE(scale_raster(source, target, order, out, error)) << "order " << order << ": " << error;
        EXPECT_EQ(out.extent(), target);
    }
}

TEST(Raster, ScaleDownProducesRequestedSize) {
    const Raster source = make_gradient(101, 77);
    Raster out;
    std::string error;
    ASSERT_TRUE(scale_raster(source, {33, 25}, DEFAULT_SPLINE_ORDER, out, error)) << error;
    EXPECT_EQ(out.extent(), (Extent{33, 25}));
}

TEST(Raster, NearestNeighbourDoublesPixels) {
    const Raster source = make_gradient(2, 2);
    Raster out;
    std::string error;
    ASSERT_TRUE(scale_raster(source, {4, 4}, 0, out, error)) << error;
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            EXPECT_EQ(out.pixel(y, x)[0], y / 2);
            EXPECT_EQ(out.pixel(y, x)[1], x / 2);
        }
    }
}

TEST(Raster, SmoothScalingKeepsSolidColor) {
    const Rgb color{200, 100, 50};
    const Raster source = make_solid(10, 10, color);
    Raster out;
    std::string error;
    ASSERT_TRUE(scale_raster(source, {25, 17}, 1, out, error)) << error;
    EXPECT_TRUE(pixel_is(out, 12, 8, color));
}

TEST(Raster, ScaleRejectsBadInput) {
    Raster out;
    std::string error;
    EXPECT_FALSE(scale_raster(Raster{}, {10, 10}, 3, out, error));
    EXPECT_FALSE(scale_raster(make_gradient(4, 4), {8, 8}, 6, out, error));
    EXPECT_FALSE(scale_raster(make_gradient(4, 4), {8, 8}, -1, out, error));
}

TEST(Raster, CopyRegionCopiesBlock) {
    const Raster src = make_gradient(4, 4);
    Raster dst = make_solid(6, 6, {0, 0, 0});
    copy_region({2, 3}, src, {1, 1}, dst, {3, 2});
    EXPECT_EQ(dst.pixel(3, 2)[0], 1);
    EXPECT_EQ(dst.pixel(3, 2)[1], 1);
    EXPECT_EQ(dst.pixel(4, 4)[0], 2);
    EXPECT_EQ(dst.pixel(4, 4)[1], 3);
    EXPECT_TRUE(pixel_is(dst, 2, 2, {0, 0, 0}));
    EXPECT_TRUE(pixel_is(dst, 3, 5, {0, 0, 0}));
}

TEST(Raster, CopyRegionClipsAgainstBothRasters) {
    const Raster src = make_gradient(4, 4);
    Raster dst = make_solid(3, 3, {9, 9, 9});
    // Extents larger than both rasters, source overlapping the far edge.
    copy_region({100, 100}, src, {2, 2}, dst, {1, 1});
    EXPECT_EQ(dst.pixel(1, 1)[0], 2);
    EXPECT_EQ(dst.pixel(2, 2)[0], 3);
    EXPECT_EQ(dst.pixel(2, 2)[1], 3);
    EXPECT_TRUE(pixel_is(dst, 0, 0, {9, 9, 9}));
}

TEST(Raster, CopyRegionOutOfRangeIsNoop) {
    const Raster src = make_gradient(4, 4);
    Raster dst = make_solid(3, 3, {9, 9, 9});
    const auto before = dst.pixels;
    copy_region({2, 2}, src, {10, 0}, dst, {0, 0});
    copy_region({2, 2}, src, {0, 0}, dst, {3, 3});
    copy_region({0, 5}, src, {0, 0}, dst, {0, 0});
    copy_region({-2, 5}, src, {0, 0}, dst, {0, 0});
    EXPECT_EQ(dst.pixels, before);
}

TEST(Raster, CopyRegionClipsNegativeStarts) {
    const Raster src = make_gradient(4, 4);
    Raster dst = make_solid(4, 4, {9, 9, 9});
    // Only the part of the block that starts at source (0,0) is copied.
    copy_region({3, 3}, src, {-1, -1}, dst, {0, 0});
    EXPECT_TRUE(pixel_is(dst, 0, 0, {9, 9, 9}));
    EXPECT_EQ(dst.pixel(1, 1)[0], 0);
    EXPECT_EQ(dst.pixel(1, 1)[1], 0);
    EXPECT_EQ(dst.pixel(2, 2)[0], 1);

    Raster dst2 = make_solid(4, 4, {9, 9, 9});
    copy_region({3, 3}, src, {0, 0}, dst2, {-1, -2});
    EXPECT_EQ(dst2.pixel(0, 0)[0], 1);
    EXPECT_EQ(dst2.pixel(0, 0)[1], 2);
    EXPECT_TRUE(pixel_is(dst2, 0, 1, {9, 9, 9}));
}
