#pragma once

#include "image_selector.h"
#include "raster.h"
#include "scaling_planner.h"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#ifndef WALLSPAN_GLOBAL_PROFILE_CONFIG
#define WALLSPAN_GLOBAL_PROFILE_CONFIG "/usr/local/share/wallspan/wallspan.cfg"
#endif

namespace wallspan::core {

constexpr const char* k_profiles_config_filename = "wallspan.cfg";
constexpr const char* k_user_profiles_config_relpath = ".config/wallspan/wallspan.cfg";
constexpr const char* k_global_profiles_config_path = WALLSPAN_GLOBAL_PROFILE_CONFIG;

// A named set of defaults. Unset fields leave the built-in default (or the
// command line) in charge.
struct ProfileDefinition {
    std::string name;
    std::optional<FitPolicy> fit_policy;
    std::optional<Rgb> pad_color;
    std::optional<Rgb> background_color;
    std::optional<bool> one_image;
    std::optional<SelectionOrder> order;
    std::optional<double> max_error_percent;
    std::optional<int> spline_order;
    std::optional<bool> recursive;
    std::optional<double> delay_minutes;
    std::optional<bool> origin_correction;
    std::optional<bool> verbose;
};

bool parse_fit_policy_from_string(const std::string& value, FitPolicy& out, std::string& error);
bool parse_selection_order_from_string(const std::string& value, SelectionOrder& out, std::string& error);

bool parse_profiles_config(std::istream& input,
                           std::vector<ProfileDefinition>& out,
                           std::string& error);

bool load_profiles_config_from_file(const std::filesystem::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error);

std::optional<std::filesystem::path> resolve_user_profiles_config_path();

// Candidate config files in lookup order: the explicit path when given,
// otherwise the user config, the one beside the executable and the global one.
std::vector<std::filesystem::path> profile_config_candidates(const std::string& explicit_path,
                                                             const std::filesystem::path& exec_dir);

} // namespace wallspan::core
