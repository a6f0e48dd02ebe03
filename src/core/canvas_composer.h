#pragma once

#include "display_layout.h"
#include "raster.h"
#include "scaling_planner.h"

#include <optional>
#include <string>
#include <vector>

namespace wallspan::core {

struct CompositeOptions {
    FitPolicy fit_policy = FitPolicy::Fill;
    // Color of the display area around a fitted image. Used only by FitPolicy::Fit.
    Rgb pad_color = {0, 0, 0};
    // Color of canvas area not covered by any display.
    std::optional<Rgb> background_color;
    bool single_image = false;
    int spline_order = DEFAULT_SPLINE_ORDER;
    // When set, the finished canvas is wrapped around this primary display origin.
    std::optional<Offset> origin_correction;
    bool verbose = false;
};

// Builds the combined wallpaper: a canvas the size of the displays' bounding
// box with images[i] scaled into rects[i]. In single image mode only
// images[0] is used, stretched over the whole bounding box.
bool compose_canvas(const std::vector<DisplayRect>& rects,
                    const std::vector<Raster>& images,
                    const CompositeOptions& options,
                    Raster& canvas,
                    std::string& error);

} // namespace wallspan::core
