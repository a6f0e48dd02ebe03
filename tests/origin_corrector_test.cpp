#include "core/origin_corrector.h"

#include <gtest/gtest.h>

using namespace wallspan::core;

namespace {

Raster make_numbered(int height, int width) {
    Raster raster;
    std::string error;
    EXPECT_TRUE(allocate_raster(height, width, raster, error));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            unsigned char* px = raster.pixel(y, x);
            px[0] = static_cast<unsigned char>(y);
            px[1] = static_cast<unsigned char>(x);
            px[2] = static_cast<unsigned char>(y * width + x);
        }
    }
    return raster;
}

} // namespace

TEST(OriginCorrector, ShiftsCanvasCircularly) {
    const Raster canvas = make_numbered(5, 7);
    const Offset origin{2, 3};
    Raster out;
    std::string error;
    ASSERT_TRUE(correct_origin(canvas, origin, out, error)) << error;
    ASSERT_EQ(out.extent(), canvas.extent());
    for (int y = 0; y < canvas.height; ++y) {
        for (int x = 0; x < canvas.width; ++x) {
            const unsigned char* px = out.pixel(y, x);
            EXPECT_EQ(px[0], (y + origin.y) % canvas.height);
            EXPECT_EQ(px[1], (x + origin.x) % canvas.width);
        }
    }
}

TEST(OriginCorrector, InverseShiftRestoresCanvas) {
    const Raster canvas = make_numbered(6, 9);
    const Offset origin{4, 2};
    Raster shifted;
    Raster restored;
    std::string error;
    ASSERT_TRUE(correct_origin(canvas, origin, shifted, error));
    ASSERT_TRUE(correct_origin(shifted, {canvas.height - origin.y, canvas.width - origin.x}, restored, error));
    EXPECT_EQ(restored.pixels, canvas.pixels);
}

TEST(OriginCorrector, ZeroOriginIsIdentity) {
    const Raster canvas = make_numbered(4, 4);
    Raster out;
    std::string error;
    ASSERT_TRUE(correct_origin(canvas, {0, 0}, out, error));
    EXPECT_EQ(out.pixels, canvas.pixels);
}

TEST(OriginCorrector, FullSizeOriginWrapsToIdentity) {
    const Raster canvas = make_numbered(4, 6);
    Raster out;
    std::string error;
    ASSERT_TRUE(correct_origin(canvas, {4, 6}, out, error));
    EXPECT_EQ(out.pixels, canvas.pixels);
}

TEST(OriginCorrector, PrimaryDisplayMovesToTopLeft) {
    // Secondary 2x2 display on the left, primary 2x3 on the right at x=2.
    Raster canvas;
    std::string error;
    ASSERT_TRUE(allocate_raster(2, 5, canvas, error));
    fill_raster(canvas, {1, 1, 1});
    for (int y = 0; y < 2; ++y) {
        for (int x = 2; x < 5; ++x) {
            canvas.pixel(y, x)[0] = 200;
        }
    }
    Raster out;
    ASSERT_TRUE(correct_origin(canvas, {0, 2}, out, error));
    for (int x = 0; x < 3; ++x) {
        EXPECT_EQ(out.pixel(0, x)[0], 200);
    }
    EXPECT_EQ(out.pixel(1, 3)[0], 1);
    EXPECT_EQ(out.pixel(1, 4)[0], 1);
}

TEST(OriginCorrector, EmptyCanvasIsAnError) {
    Raster out;
    std::string error;
    EXPECT_FALSE(correct_origin(Raster{}, {0, 0}, out, error));
    EXPECT_FALSE(error.empty());
}
