#include "scaling_planner.h"

#include <algorithm>
#include <cmath>

namespace wallspan::core {

namespace {

int round_to_int(double value) {
    return static_cast<int>(std::lround(value));
}

double fill_error_fraction(Extent scaled, const DisplayRect& target) {
    // Share of the scaled image falling outside the display. The cropped
    // corner is counted once even when both dimensions overflow.
    const double scaled_area = static_cast<double>(scaled.height) * scaled.width;
    const double shown_area = static_cast<double>(std::min(scaled.height, target.height))
                              * std::min(scaled.width, target.width);
    return (scaled_area - shown_area) / scaled_area;
}

} // namespace

ScalingPlan plan_scaling(Extent source,
                         const DisplayRect& target,
                         const std::vector<DisplayRect>& all_targets,
                         const ScalingOptions& options) {
    ScalingPlan plan;
    plan.current = source;
    if (source.height <= 0 || source.width <= 0 || target.height <= 0 || target.width <= 0) {
        plan.target = target.extent();
        plan.error_fraction = 1.0;
        return plan;
    }

    const double zoom_y = static_cast<double>(target.height) / source.height;
    const double zoom_x = static_cast<double>(target.width) / source.width;
    const Extent exact_height{target.height, std::max(1, round_to_int(source.width * zoom_y))};
    const Extent exact_width{std::max(1, round_to_int(source.height * zoom_x)), target.width};

    Extent scaled = exact_height;
    if (options.policy == FitPolicy::Fit) {
        const double display_area = static_cast<double>(target.height) * target.width;
        if (scaled.width > target.width) {
            scaled = exact_width;
            scaled.height = std::min(scaled.height, target.height);
            plan.fit_offsets = {round_to_int(std::abs(scaled.height - target.height) / 2.0), 0};
            plan.error_fraction = static_cast<double>(target.height - scaled.height) * target.width / display_area;
        } else {
            plan.fit_offsets = {0, round_to_int(std::abs(scaled.width - target.width) / 2.0)};
            plan.error_fraction = static_cast<double>(target.width - scaled.width) * target.height / display_area;
        }
    } else {
        if (scaled.width < target.width) {
            scaled = exact_width;
        }
        plan.error_fraction = fill_error_fraction(scaled, target);
    }
    plan.target = scaled;

    if (options.single_image) {
        const long long screen_area = total_display_area(all_targets);
        if (screen_area > 0) {
            const double scaled_area = static_cast<double>(scaled.height) * scaled.width;
            plan.error_fraction = std::abs(scaled_area - static_cast<double>(screen_area))
                                  / static_cast<double>(screen_area);
        }
    }
    return plan;
}

} // namespace wallspan::core
