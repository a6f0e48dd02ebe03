#pragma once

#include "display_layout.h"
#include "raster.h"

#include <string>

namespace wallspan::core {

// Rearranges a canvas laid out with (0,0) at the top left of the display
// bounding box into tiled-wallpaper order, where (0,0) is the top left of the
// primary display found at `primary_origin`. The result is the canvas
// circularly shifted by (-primary_origin.y, -primary_origin.x).
bool correct_origin(const Raster& canvas, Offset primary_origin, Raster& out, std::string& error);

} // namespace wallspan::core
