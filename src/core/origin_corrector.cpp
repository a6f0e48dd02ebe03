#include "origin_corrector.h"

namespace wallspan::core {

namespace {

int wrap(int value, int size) {
    const int r = value % size;
    return r < 0 ? r + size : r;
}

} // namespace

bool correct_origin(const Raster& canvas, Offset primary_origin, Raster& out, std::string& error) {
    if (canvas.empty()) {
        error = "cannot correct the origin of an empty canvas";
        return false;
    }
    const int high_y = canvas.height;
    const int high_x = canvas.width;
    const int y0 = wrap(primary_origin.y, high_y);
    const int x0 = wrap(primary_origin.x, high_x);

    Raster shifted;
    if (!allocate_raster(high_y, high_x, shifted, error)) {
        return false;
    }

    // The origin splits the canvas into four pieces that trade places.
    // top left -> bottom right
    copy_region({y0, x0}, canvas, {0, 0}, shifted, {high_y - y0, high_x - x0});
    // bottom right -> top left
    copy_region({high_y - y0, high_x - x0}, canvas, {y0, x0}, shifted, {0, 0});
    // bottom left -> top right
    copy_region({high_y - y0, x0}, canvas, {y0, 0}, shifted, {0, high_x - x0});
    // top right -> bottom left
    copy_region({y0, high_x - x0}, canvas, {0, x0}, shifted, {high_y - y0, 0});

    out = std::move(shifted);
    return true;
}

} // namespace wallspan::core
