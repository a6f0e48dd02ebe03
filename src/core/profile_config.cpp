#include "profile_config.h"

#include "cli_parse.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace wallspan::core {

bool parse_fit_policy_from_string(const std::string& value, FitPolicy& out, std::string& error) {
    std::string lower = to_lower_copy(value);
    if (lower == "fill") {
        out = FitPolicy::Fill;
        return true;
    }
    if (lower == "fit") {
        out = FitPolicy::Fit;
        return true;
    }
    error = "invalid fit policy '" + value + "'";
    return false;
}

bool parse_selection_order_from_string(const std::string& value, SelectionOrder& out, std::string& error) {
    std::string lower = to_lower_copy(value);
    if (lower == "sequential") {
        out = SelectionOrder::Sequential;
        return true;
    }
    if (lower == "random") {
        out = SelectionOrder::Random;
        return true;
    }
    error = "invalid selection order '" + value + "'";
    return false;
}

bool parse_profiles_config(std::istream& input,
                           std::vector<ProfileDefinition>& out,
                           std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<ProfileDefinition> current;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(*current);
                current.reset();
            }
            std::string header = trimmed.substr(1, trimmed.size() - 2);
            std::istringstream iss(header);
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header at line " + std::to_string(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                error = "unsupported section '" + section_type + "' at line " + std::to_string(line_number);
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing profile name at line " + std::to_string(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in profile header at line " +
                        std::to_string(line_number);
                return false;
            }
            if (seen_names.find(name) != seen_names.end()) {
                error = "duplicate profile '" + name + "' at line " + std::to_string(line_number);
                return false;
            }
            seen_names.insert(name);
            ProfileDefinition def;
            def.name = name;
            current = def;
            continue;
        }

        if (!current) {
            error = "entry outside of profile section at line " + std::to_string(line_number);
            return false;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "' at line " + std::to_string(line_number);
            return false;
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key at line " + std::to_string(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }

        auto parse_flag = [&](std::optional<bool>& field) {
            bool parsed = false;
            if (!parse_bool_value(value, parsed)) {
                error = "invalid " + key + " '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            field = parsed;
            return true;
        };
        auto parse_color = [&](std::optional<Rgb>& field) {
            Rgb parsed{};
            if (!parse_rgb(value, parsed)) {
                error = "invalid " + key + " '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            field = parsed;
            return true;
        };

        std::string lower_key = to_lower_copy(key);
        if (lower_key == "fit") {
            FitPolicy parsed_policy = FitPolicy::Fill;
            if (!parse_fit_policy_from_string(value, parsed_policy, error)) {
                error += " at line " + std::to_string(line_number);
                return false;
            }
            current->fit_policy = parsed_policy;
        } else if (lower_key == "pad_color") {
            if (!parse_color(current->pad_color)) {
                return false;
            }
        } else if (lower_key == "background") {
            if (!parse_color(current->background_color)) {
                return false;
            }
        } else if (lower_key == "one_image") {
            if (!parse_flag(current->one_image)) {
                return false;
            }
        } else if (lower_key == "order") {
            SelectionOrder parsed_order = SelectionOrder::Random;
            if (!parse_selection_order_from_string(value, parsed_order, error)) {
                error += " at line " + std::to_string(line_number);
                return false;
            }
            current->order = parsed_order;
        } else if (lower_key == "max_error_percent") {
            double parsed_percent = 0.0;
            if (!parse_non_negative_double(value, parsed_percent)) {
                error = "invalid max_error_percent '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->max_error_percent = parsed_percent;
        } else if (lower_key == "spline") {
            int parsed_spline = 0;
            if (!parse_non_negative_int(value, parsed_spline) || parsed_spline > MAX_SPLINE_ORDER) {
                error = "invalid spline '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->spline_order = parsed_spline;
        } else if (lower_key == "recursive") {
            if (!parse_flag(current->recursive)) {
                return false;
            }
        } else if (lower_key == "delay_minutes") {
            double parsed_delay = 0.0;
            if (!parse_non_negative_double(value, parsed_delay)) {
                error = "invalid delay_minutes '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->delay_minutes = parsed_delay;
        } else if (lower_key == "origin_correction") {
            if (!parse_flag(current->origin_correction)) {
                return false;
            }
        } else if (lower_key == "verbose") {
            if (!parse_flag(current->verbose)) {
                return false;
            }
        } else {
            error = "unknown key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }
    }

    if (current) {
        out.push_back(*current);
    }

    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_profiles_config_from_file(const fs::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_profiles_config(input, out, error);
}

std::optional<fs::path> resolve_user_profiles_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_profiles_config_relpath;
}

std::vector<fs::path> profile_config_candidates(const std::string& explicit_path, const fs::path& exec_dir) {
    std::vector<fs::path> candidates;
    if (!explicit_path.empty()) {
        std::error_code ec;
        fs::path candidate = fs::absolute(fs::path(explicit_path), ec);
        candidates.push_back(ec ? fs::path(explicit_path) : candidate);
        return candidates;
    }
    if (std::optional<fs::path> user_config = resolve_user_profiles_config_path()) {
        candidates.push_back(*user_config);
    }
    candidates.push_back(exec_dir / k_profiles_config_filename);
    candidates.push_back(fs::path(k_global_profiles_config_path));
    return candidates;
}

} // namespace wallspan::core
