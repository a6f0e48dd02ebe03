// wallspan_command.cpp
// MIT License (c) 2026 Pedro

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/candidate_pool.h"
#include "core/canvas_composer.h"
#include "core/cli_parse.h"
#include "core/display_layout.h"
#include "core/image_io.h"
#include "core/image_selector.h"
#include "core/profile_config.h"
#include "platform/desktop_backend.h"

namespace fs = std::filesystem;

namespace {
using wallspan::core::CandidatePool;
using wallspan::core::CompositeOptions;
using wallspan::core::DisplayRect;
using wallspan::core::FitPolicy;
using wallspan::core::ImageSelector;
using wallspan::core::Offset;
using wallspan::core::ProfileDefinition;
using wallspan::core::Raster;
using wallspan::core::Rgb;
using wallspan::core::SelectedImage;
using wallspan::core::SelectionOrder;
using wallspan::core::SelectorOptions;

struct Config {
    std::vector<std::string> sources;
    std::string outfile;
    std::string log_current_path;
    std::vector<std::string> reslist;
    std::optional<Offset> windows_origin;
    std::optional<std::uint32_t> seed;
    std::string profile_name;
    std::string profiles_config_path;

    bool verbose = false;
    bool one_image = false;
    FitPolicy fit_policy = FitPolicy::Fill;
    Rgb pad_color = {0, 0, 0};
    std::optional<Rgb> background_color;
    std::optional<double> delay_minutes;
    std::optional<double> max_error_percent;
    int spline_order = wallspan::core::DEFAULT_SPLINE_ORDER;
    SelectionOrder order = SelectionOrder::Random;
    bool recursive = false;
    bool dont_apply = false;
    bool no_clobber = false;
    bool suppress_origin_correction = false;

    bool has_verbose_override = false;
    bool has_one_image_override = false;
    bool has_fit_override = false;
    bool has_background_override = false;
    bool has_delay_override = false;
    bool has_error_override = false;
    bool has_spline_override = false;
    bool has_order_override = false;
    bool has_recursive_override = false;
    bool has_origin_override = false;
};

void print_usage() {
    std::cout << "Usage: wallspan IMAGE_FILE_OR_DIR... -o OUTFILE [OPTIONS]\n"
              << "\n"
              << "Build one wallpaper image spanning every display and set it as the\n"
              << "desktop background. Sources are image files, directories of images\n"
              << "or tar archives of images.\n"
              << "\n"
              << "Options:\n"
              << "  -o, --outfile PATH         Output image (.png, .jpg, .jpeg, .bmp or .tga)\n"
              << "  -v, --verbose              Print progress information\n"
              << "  -1, --oneimage             Stretch a single image over all displays\n"
              << "  -f, --fitimage R,G,B       Fit images inside displays, padding with R,G,B\n"
              << "  -c, --colorfill R,G,B      Color of canvas area outside every display\n"
              << "  -t, --timedelay MINUTES    Repeat forever, waiting MINUTES between images\n"
              << "  -p, --percenterror PCT     Reject images whose scaling error exceeds PCT\n"
              << "  -z, --zoomspline N         Resampling spline order 0-5 (default: 3)\n"
              << "  -s, --sequential           Take images in order instead of at random\n"
              << "  -R, --recursive            Search image directories recursively\n"
              << "  -d, --dontapply            Write the image but do not set the wallpaper\n"
              << "      --noclobber            Never overwrite an existing output file\n"
              << "  -r, --reslist WxH+X+Y...   Use these display geometries instead of the system's\n"
              << "  -w, --windows X,Y          Primary display origin; wraps the image around it\n"
              << "  -x, --x11                  Never wrap the image around the primary display\n"
              << "  -L, --logcurrent PATH      Write the names of the chosen images to PATH\n"
              << "      --seed N               Seed for random image selection\n"
              << "      --profile NAME         Load defaults from profile NAME\n"
              << "      --profiles-config PATH Profiles file to load NAME from\n"
              << "  -h, --help                 Show this help message\n";
}

bool apply_profile(Config& config, const fs::path& exec_dir) {
    std::vector<ProfileDefinition> profile_definitions;
    std::string config_error;
    std::vector<std::string> tried_candidates;
    bool loaded_profile_file = false;
    for (const fs::path& candidate :
         wallspan::core::profile_config_candidates(config.profiles_config_path, exec_dir)) {
        std::error_code ec;
        const bool exists = fs::exists(candidate, ec);
        if (ec || !exists) {
            tried_candidates.push_back(candidate.string());
            continue;
        }
        if (!wallspan::core::load_profiles_config_from_file(candidate, profile_definitions, config_error)) {
            std::cerr << "Error: Failed to load profile config (" << candidate << "): " << config_error << "\n";
            return false;
        }
        loaded_profile_file = true;
        break;
    }
    if (!loaded_profile_file) {
        std::cerr << "Error: Failed to load profile config. Tried:";
        for (const std::string& candidate : tried_candidates) {
            std::cerr << " " << candidate;
        }
        std::cerr << "\n";
        return false;
    }

    std::unordered_map<std::string, ProfileDefinition> profile_map;
    for (const auto& def : profile_definitions) {
        profile_map.emplace(def.name, def);
    }
    auto profile_it = profile_map.find(config.profile_name);
    if (profile_it == profile_map.end()) {
        std::string available;
        for (size_t idx = 0; idx < profile_definitions.size(); ++idx) {
            if (idx > 0) {
                available += ", ";
            }
            available += profile_definitions[idx].name;
        }
        std::cerr << "Error: Invalid profile '" << config.profile_name << "'. Available profiles: "
                  << available << "\n";
        return false;
    }

    const ProfileDefinition& profile = profile_it->second;
    if (!config.has_fit_override) {
        if (profile.fit_policy) {
            config.fit_policy = *profile.fit_policy;
        }
        if (profile.pad_color) {
            config.pad_color = *profile.pad_color;
        }
    }
    if (!config.has_background_override && profile.background_color) {
        config.background_color = profile.background_color;
    }
    if (!config.has_one_image_override && profile.one_image) {
        config.one_image = *profile.one_image;
    }
    if (!config.has_order_override && profile.order) {
        config.order = *profile.order;
    }
    if (!config.has_error_override && profile.max_error_percent) {
        config.max_error_percent = profile.max_error_percent;
    }
    if (!config.has_spline_override && profile.spline_order) {
        config.spline_order = *profile.spline_order;
    }
    if (!config.has_recursive_override && profile.recursive) {
        config.recursive = *profile.recursive;
    }
    if (!config.has_delay_override && profile.delay_minutes) {
        config.delay_minutes = profile.delay_minutes;
    }
    if (!config.has_origin_override && profile.origin_correction) {
        config.suppress_origin_correction = !*profile.origin_correction;
    }
    if (!config.has_verbose_override && profile.verbose) {
        config.verbose = *profile.verbose;
    }
    return true;
}

// Checks the output path before any image work is done. Returns false with
// exit_code set when the command has to stop.
bool check_output_path(const Config& config, const fs::path& save_path, int& exit_code) {
    if (!wallspan::core::is_writable_image_extension(save_path)) {
        std::cerr << "Error: No recognized image file suffix on the output filename: " << save_path.string() << "\n";
        exit_code = 1;
        return false;
    }
    std::error_code ec;
    const fs::path dirname = save_path.parent_path();
    if (!fs::is_directory(dirname, ec)) {
        std::cerr << "Error: The directory for the output image file does not exist: " << save_path.string() << "\n";
        exit_code = 1;
        return false;
    }
    const bool exists = fs::exists(save_path, ec);
    if (exists && !fs::is_regular_file(save_path, ec)) {
        std::cerr << "Error: The output pathname exists but is not a file: " << save_path.string() << "\n";
        exit_code = 1;
        return false;
    }
    if (config.no_clobber && exists) {
        std::cerr << "Warning: The output file " << config.outfile
                  << " already exists. No file was written due to the noclobber option.\n";
        exit_code = 0;
        return false;
    }
    return true;
}

bool write_log_current(const fs::path& log_path, const std::vector<std::string>& image_names) {
    std::ofstream log(log_path);
    if (!log) {
        return false;
    }
    for (size_t count = 0; count < image_names.size(); ++count) {
        log << "Image on display " << count << " is\n    " << image_names[count] << "\n\n";
    }
    return static_cast<bool>(log);
}

} // namespace

int run_wallspan(int argc, char** argv) {
    Config config;

    auto missing_value = [&](const std::string& arg) {
        std::cerr << "Error: Missing value for " << arg << "\n";
        return 1;
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "-o" || arg == "--outfile") {
            if (i + 1 >= argc) return missing_value(arg);
            config.outfile = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
            config.has_verbose_override = true;
        } else if (arg == "-1" || arg == "--oneimage") {
            config.one_image = true;
            config.has_one_image_override = true;
        } else if (arg == "-f" || arg == "--fitimage") {
            if (i + 1 >= argc) return missing_value(arg);
            if (!wallspan::core::parse_rgb(argv[++i], config.pad_color)) {
                std::cerr << "Error: Invalid pad color (expected R,G,B): " << argv[i] << "\n";
                return 1;
            }
            config.fit_policy = FitPolicy::Fit;
            config.has_fit_override = true;
        } else if (arg == "-c" || arg == "--colorfill") {
            if (i + 1 >= argc) return missing_value(arg);
            Rgb color{};
            if (!wallspan::core::parse_rgb(argv[++i], color)) {
                std::cerr << "Error: Invalid background color (expected R,G,B): " << argv[i] << "\n";
                return 1;
            }
            config.background_color = color;
            config.has_background_override = true;
        } else if (arg == "-t" || arg == "--timedelay") {
            if (i + 1 >= argc) return missing_value(arg);
            double minutes = 0.0;
            if (!wallspan::core::parse_non_negative_double(argv[++i], minutes)) {
                std::cerr << "Error: Invalid time delay: " << argv[i] << "\n";
                return 1;
            }
            config.delay_minutes = minutes;
            config.has_delay_override = true;
        } else if (arg == "-p" || arg == "--percenterror") {
            if (i + 1 >= argc) return missing_value(arg);
            double percent = 0.0;
            if (!wallspan::core::parse_non_negative_double(argv[++i], percent)) {
                std::cerr << "Error: Invalid error percentage: " << argv[i] << "\n";
                return 1;
            }
            config.max_error_percent = percent;
            config.has_error_override = true;
        } else if (arg == "-z" || arg == "--zoomspline") {
            if (i + 1 >= argc) return missing_value(arg);
            int order = 0;
            if (!wallspan::core::parse_int(argv[++i], order)
                || order < wallspan::core::MIN_SPLINE_ORDER || order > wallspan::core::MAX_SPLINE_ORDER) {
                std::cerr << "Error: The spline order " << argv[i] << " is not in the range 0-5.\n";
                return 1;
            }
            config.spline_order = order;
            config.has_spline_override = true;
        } else if (arg == "-s" || arg == "--sequential") {
            config.order = SelectionOrder::Sequential;
            config.has_order_override = true;
        } else if (arg == "-R" || arg == "--recursive") {
            config.recursive = true;
            config.has_recursive_override = true;
        } else if (arg == "-d" || arg == "--dontapply") {
            config.dont_apply = true;
        } else if (arg == "--noclobber") {
            config.no_clobber = true;
        } else if (arg == "-r" || arg == "--reslist") {
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                config.reslist.emplace_back(argv[++i]);
            }
            if (config.reslist.empty()) return missing_value(arg);
        } else if (arg == "-w" || arg == "--windows") {
            if (i + 1 >= argc) return missing_value(arg);
            int x = 0;
            int y = 0;
            if (!wallspan::core::parse_pair(argv[++i], x, y) || x < 0 || y < 0) {
                std::cerr << "Error: Invalid primary display origin (expected X,Y): " << argv[i] << "\n";
                return 1;
            }
            config.windows_origin = Offset{y, x};
        } else if (arg == "-x" || arg == "--x11") {
            config.suppress_origin_correction = true;
            config.has_origin_override = true;
        } else if (arg == "-L" || arg == "--logcurrent") {
            if (i + 1 >= argc) return missing_value(arg);
            config.log_current_path = argv[++i];
        } else if (arg == "--seed") {
            if (i + 1 >= argc) return missing_value(arg);
            unsigned int seed = 0;
            if (!wallspan::core::parse_non_negative_uint(argv[++i], seed)) {
                std::cerr << "Error: Invalid seed: " << argv[i] << "\n";
                return 1;
            }
            config.seed = seed;
        } else if (arg == "--profile") {
            if (i + 1 >= argc) return missing_value(arg);
            config.profile_name = argv[++i];
        } else if (arg == "--profiles-config") {
            if (i + 1 >= argc) return missing_value(arg);
            config.profiles_config_path = argv[++i];
        } else if (arg.starts_with("-") && arg.size() > 1) {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else {
            config.sources.push_back(arg);
        }
    }

    if (config.sources.empty() || config.outfile.empty()) {
        std::cerr << "Error: Image source and output file arguments are required.\n";
        print_usage();
        return 1;
    }

    fs::path cwd = fs::current_path();
    fs::path exec_path(argv[0]);
    if (exec_path.is_relative() && !cwd.empty()) {
        exec_path = cwd / exec_path;
    }
    fs::path exec_dir = exec_path.parent_path();
    if (exec_dir.empty()) {
        exec_dir = cwd;
    }

    if (!config.profile_name.empty() && !apply_profile(config, exec_dir)) {
        return 1;
    }

    const fs::path save_path = wallspan::core::resolve_user_path(config.outfile);
    int exit_code = 0;
    if (!check_output_path(config, save_path, exit_code)) {
        return exit_code;
    }

    std::vector<DisplayRect> explicit_displays;
    if (!config.reslist.empty()) {
        std::string error;
        if (!wallspan::core::parse_display_geometry_list(config.reslist, explicit_displays, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }

    std::unique_ptr<wallspan::platform::DesktopBackend> backend =
        wallspan::platform::make_system_backend(config.verbose);

    SelectorOptions selector_options;
    selector_options.order = config.order;
    selector_options.max_error_percent = config.max_error_percent;
    selector_options.scaling.policy = config.fit_policy;
    selector_options.scaling.single_image = config.one_image;
    selector_options.verbose = config.verbose;
    std::uint32_t seed = config.seed ? *config.seed : std::random_device{}();
    ImageSelector selector(selector_options, wallspan::core::decode_image_file, seed);
    CandidatePool pool(config.sources, config.recursive);

    if (config.verbose) {
        std::cout << "Running wallspan..." << std::endl;
    }

    while (true) {
        std::vector<DisplayRect> displays = explicit_displays;
        if (displays.empty()) {
            std::string error;
            if (!backend->list_displays(displays, error)) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
        }
        if (displays.empty()) {
            std::cerr << "Error: No displays detected. Maybe try explicitly setting the resolutions"
                      << " with the '--reslist' option.\n";
            return 1;
        }
        if (config.verbose) {
            std::cout << "Detected " << displays.size() << " displays:";
            for (const auto& rect : displays) {
                std::cout << " " << wallspan::core::format_display_rect(rect);
            }
            std::cout << std::endl;
        }

        std::vector<Raster> images;
        std::vector<std::string> image_names;
        for (size_t count = 0; count < displays.size(); ++count) {
            std::string error;
            std::optional<SelectedImage> selected = selector.select_next(displays[count], displays, pool, error);
            if (!error.empty()) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
            if (!selected) {
                std::cerr << "Error: No suitable image files found for display " << count << ".\n";
                return 1;
            }
            if (config.verbose) {
                std::cout << "Image selected for display " << count << " is " << selected->path << std::endl;
            }
            image_names.push_back(selected->path);
            images.push_back(std::move(selected->raster));
            if (config.one_image) {
                break;
            }
        }

        if (!config.log_current_path.empty()) {
            const fs::path log_path = wallspan::core::resolve_user_path(config.log_current_path);
            if (!write_log_current(log_path, image_names)) {
                std::cerr << "Warning: Could not write the current image names to " << log_path.string() << "\n";
            }
        }

        CompositeOptions composite;
        composite.fit_policy = config.fit_policy;
        composite.pad_color = config.pad_color;
        composite.background_color = config.background_color;
        composite.single_image = config.one_image;
        composite.spline_order = config.spline_order;
        composite.verbose = config.verbose;
        if (!config.suppress_origin_correction) {
            if (config.windows_origin) {
                composite.origin_correction = config.windows_origin;
            } else if (backend->uses_primary_origin_wrap() && config.reslist.empty()) {
                composite.origin_correction = backend->primary_origin();
            }
            if (composite.origin_correction && config.verbose) {
                std::cout << "Correcting the origin of the image." << std::endl;
            }
        }

        Raster canvas;
        std::string compose_error;
        if (!wallspan::core::compose_canvas(displays, images, composite, canvas, compose_error)) {
            std::cerr << "Error: " << compose_error << "\n";
            return 1;
        }

        if (config.verbose) {
            std::cout << "Writing the combined image to the file " << save_path.string() << std::endl;
        }
        std::string write_error;
        const bool written = wallspan::core::write_image_file(save_path, canvas, write_error);
        if (!written) {
            std::cerr << "Warning: Could not save to file " << save_path.string() << ": " << write_error << "\n";
        }

        if (written && !config.dont_apply) {
            if (config.verbose) {
                std::cout << "Setting the new image as the current background wallpaper." << std::endl;
            }
            std::string apply_error;
            if (!backend->apply_wallpaper(save_path, apply_error)) {
                std::cerr << "Warning: The image was created but setting it as the background failed: "
                          << apply_error << "\n";
            }
        }

        if (!config.delay_minutes) {
            break;
        }
        if (config.verbose) {
            std::cout << "---------- Sleeping for " << *config.delay_minutes << " minutes." << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::duration<double>(*config.delay_minutes * 60.0));
    }

    if (config.verbose) {
        std::cout << "Finished execution of wallspan." << std::endl;
    }
    return 0;
}
