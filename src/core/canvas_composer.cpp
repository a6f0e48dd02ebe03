#include "canvas_composer.h"

#include "origin_corrector.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace wallspan::core {

namespace {

struct ScaledImage {
    Raster raster;
    Offset fit_offsets;
};

// Start of the centred crop window inside an image scaled to cover its
// display. A slightly undersized zoom result gives a negative overlap, which
// is treated as zero.
Offset centered_crop_start(Extent scaled, const DisplayRect& target) {
    const double y_start = std::max(0.0, (scaled.height - target.height) / 2.0);
    const double x_start = std::max(0.0, (scaled.width - target.width) / 2.0);
    return {static_cast<int>(std::lround(y_start)), static_cast<int>(std::lround(x_start))};
}

} // namespace

bool compose_canvas(const std::vector<DisplayRect>& rects,
                    const std::vector<Raster>& images,
                    const CompositeOptions& options,
                    Raster& canvas,
                    std::string& error) {
    Extent box;
    if (!compute_bounding_box(rects, box, error)) {
        return false;
    }
    if (options.verbose) {
        std::cout << "Creating a large image of size " << box.width << "x" << box.height
                  << ", a bounding box on all the displays" << std::endl;
    }

    Raster giant;
    if (!allocate_raster(box.height, box.width, giant, error)) {
        return false;
    }

    std::vector<DisplayRect> targets = rects;
    if (options.single_image) {
        targets = {DisplayRect{box.height, box.width, 0, 0}};
    }
    if (images.size() < targets.size()) {
        error = "expected " + std::to_string(targets.size()) + " images for the displays, got "
                + std::to_string(images.size());
        return false;
    }

    ScalingOptions scaling_options;
    scaling_options.policy = options.fit_policy;
    scaling_options.single_image = options.single_image;

    std::vector<ScaledImage> scaled_images;
    scaled_images.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        const Raster& image = images[i];
        const ScalingPlan plan = plan_scaling(image.extent(), targets[i], targets, scaling_options);
        if (options.verbose) {
            std::cout << "Image " << i << " has initial size " << image.width << "x" << image.height
                      << ", scaling to " << plan.target.width << "x" << plan.target.height << std::endl;
        }
        ScaledImage scaled;
        scaled.fit_offsets = plan.fit_offsets;
        if (!scale_raster(image, plan.target, options.spline_order, scaled.raster, error)) {
            error = "image " + std::to_string(i) + ": " + error;
            return false;
        }
        if (options.verbose && scaled.raster.extent() != plan.target) {
            std::cout << "Warning: Imperfect scaling of image " << i << std::endl;
        }
        scaled_images.push_back(std::move(scaled));
    }

    std::optional<Rgb> fill_color = options.background_color;
    if (options.fit_policy == FitPolicy::Fit) {
        fill_color = options.pad_color;
    }
    if (fill_color) {
        fill_raster(giant, *fill_color);
    }

    for (size_t i = 0; i < targets.size(); ++i) {
        const DisplayRect& target = targets[i];
        const ScaledImage& scaled = scaled_images[i];
        Offset from_start;
        if (options.fit_policy == FitPolicy::Fill) {
            from_start = centered_crop_start(scaled.raster.extent(), target);
        }
        // Fit offsets never exceed the display size, so this stays within the bounding box.
        const Offset to_start{target.y_offset + scaled.fit_offsets.y, target.x_offset + scaled.fit_offsets.x};
        if (options.verbose) {
            std::cout << "Copying image " << i << " from pixel (" << from_start.y << "," << from_start.x
                      << ") to canvas pixel (" << to_start.y << "," << to_start.x << ")" << std::endl;
        }
        copy_region(target.extent(), scaled.raster, from_start, giant, to_start);
    }

    if (options.origin_correction) {
        if (options.verbose) {
            std::cout << "Correcting the origin of the image to (" << options.origin_correction->y << ","
                      << options.origin_correction->x << ")" << std::endl;
        }
        Raster corrected;
        if (!correct_origin(giant, *options.origin_correction, corrected, error)) {
            return false;
        }
        giant = std::move(corrected);
    }

    canvas = std::move(giant);
    return true;
}

} // namespace wallspan::core
