#pragma once

#include "candidate_pool.h"
#include "display_layout.h"
#include "image_io.h"
#include "raster.h"
#include "scaling_planner.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace wallspan::core {

enum class SelectionOrder { Sequential, Random };

struct SelectorOptions {
    SelectionOrder order = SelectionOrder::Random;
    // Reject images whose scaling error exceeds this many percent.
    std::optional<double> max_error_percent;
    ScalingOptions scaling;
    bool verbose = false;
};

struct SelectedImage {
    std::string path;
    Raster raster;
};

using ImageDecoder = std::function<bool(const std::string& path, Raster& out, std::string& error)>;

class ImageSelector {
public:
    explicit ImageSelector(SelectorOptions options,
                           ImageDecoder decoder = decode_image_file,
                           std::uint32_t seed = std::random_device{}());

    // Draws the next usable image for `target`. Unreadable files and files
    // over the error threshold are skipped; the pool is reloaded at most once
    // when it runs out. On success the chosen entry is removed from the pool.
    // Returns nullopt when no acceptable image exists; `error` is set only
    // when reloading the pool failed outright.
    std::optional<SelectedImage> select_next(const DisplayRect& target,
                                             const std::vector<DisplayRect>& all_targets,
                                             CandidatePool& pool,
                                             std::string& error);

private:
    size_t draw_index(std::vector<size_t>& indices);
    double error_fraction_for(const Raster& image,
                              const DisplayRect& target,
                              const std::vector<DisplayRect>& all_targets) const;

    SelectorOptions options_;
    ImageDecoder decoder_;
    std::mt19937 rng_;
};

} // namespace wallspan::core
