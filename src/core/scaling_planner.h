#pragma once

#include "display_layout.h"

#include <vector>

namespace wallspan::core {

enum class FitPolicy {
    Fill, // scale to cover the display, crop the excess
    Fit,  // scale to fit inside the display, pad the remainder
};

struct ScalingOptions {
    FitPolicy policy = FitPolicy::Fill;
    bool single_image = false;
};

struct ScalingPlan {
    Extent current;
    Extent target;
    Offset fit_offsets;
    double error_fraction = 0.0;
};

// Chooses the size an image of extent `source` is scaled to for the display
// `target`.
//
// Fill: the smallest aspect-preserving size covering the display;
// error_fraction is the share of the scaled image that gets cropped away.
// Fit: the largest aspect-preserving size inside the display, centred by
// fit_offsets; error_fraction is the share of the display left uncovered.
// With single_image set the error is instead the relative difference between
// the scaled area and the summed area of `all_targets`.
ScalingPlan plan_scaling(Extent source,
                         const DisplayRect& target,
                         const std::vector<DisplayRect>& all_targets,
                         const ScalingOptions& options);

} // namespace wallspan::core
