#include "image_selector.h"

#include <cmath>
#include <iostream>

namespace wallspan::core {

ImageSelector::ImageSelector(SelectorOptions options, ImageDecoder decoder, std::uint32_t seed)
    : options_(std::move(options)), decoder_(std::move(decoder)), rng_(seed) {}

size_t ImageSelector::draw_index(std::vector<size_t>& indices) {
    size_t position = 0;
    if (options_.order == SelectionOrder::Random && indices.size() > 1) {
        std::uniform_int_distribution<size_t> dist(0, indices.size() - 1);
        position = dist(rng_);
    }
    const size_t index = indices[position];
    indices.erase(indices.begin() + static_cast<std::ptrdiff_t>(position));
    return index;
}

double ImageSelector::error_fraction_for(const Raster& image,
                                         const DisplayRect& target,
                                         const std::vector<DisplayRect>& all_targets) const {
    if (options_.scaling.single_image) {
        // One image covers the bounding box of every display.
        Extent box;
        std::string ignored;
        if (compute_bounding_box(all_targets, box, ignored)) {
            const DisplayRect combined{box.height, box.width, 0, 0};
            return plan_scaling(image.extent(), combined, all_targets, options_.scaling).error_fraction;
        }
    }
    return plan_scaling(image.extent(), target, all_targets, options_.scaling).error_fraction;
}

std::optional<SelectedImage> ImageSelector::select_next(const DisplayRect& target,
                                                        const std::vector<DisplayRect>& all_targets,
                                                        CandidatePool& pool,
                                                        std::string& error) {
    std::vector<size_t> indices(pool.size());
    for (size_t i = 0; i < indices.size(); ++i) {
        indices[i] = i;
    }
    bool reload_done = false;

    while (true) {
        if (indices.empty()) {
            if (reload_done) {
                return std::nullopt;
            }
            reload_done = true;
            if (!pool.reload(error)) {
                return std::nullopt;
            }
            if (options_.verbose) {
                std::cout << "Loading or reloading the list of image files. Found " << pool.size()
                          << " image filenames." << std::endl;
            }
            indices.resize(pool.size());
            for (size_t i = 0; i < indices.size(); ++i) {
                indices[i] = i;
            }
            continue;
        }

        const size_t index = draw_index(indices);
        const std::string& candidate = pool.at(index);

        Raster image;
        std::string decode_error;
        if (!decoder_(candidate, image, decode_error)) {
            std::cerr << "Warning: The file " << candidate << " " << decode_error << ". Ignoring it.\n";
            continue;
        }

        if (options_.max_error_percent) {
            const double err_fraction = error_fraction_for(image, target, all_targets);
            const double err_percent = err_fraction * 100.0;
            const bool rejected = err_percent > *options_.max_error_percent;
            if (options_.verbose) {
                std::cout << "Error percentage is " << std::round(err_percent * 10.0) / 10.0
                          << (rejected ? "; rejecting image " : "; accepting image ") << candidate << std::endl;
            }
            if (rejected) {
                continue;
            }
        }

        SelectedImage selected{candidate, std::move(image)};
        pool.remove_at(index);
        return selected;
    }
}

} // namespace wallspan::core
