#include "display_layout.h"

#include "cli_parse.h"

#include <algorithm>
#include <limits>
#include <sstream>

namespace wallspan::core {

bool compute_bounding_box(const std::vector<DisplayRect>& rects, Extent& out, std::string& error) {
    if (rects.empty()) {
        error = "empty display layout";
        return false;
    }
    long long height = 0;
    long long width = 0;
    for (const auto& r : rects) {
        height = std::max(height, static_cast<long long>(r.y_offset) + r.height);
        width = std::max(width, static_cast<long long>(r.x_offset) + r.width);
    }
    if (height > std::numeric_limits<int>::max() || width > std::numeric_limits<int>::max()) {
        error = "display layout is too large";
        return false;
    }
    out = {static_cast<int>(height), static_cast<int>(width)};
    return true;
}

long long total_display_area(const std::vector<DisplayRect>& rects) {
    long long area = 0;
    for (const auto& r : rects) {
        area += static_cast<long long>(r.height) * static_cast<long long>(r.width);
    }
    return area;
}

bool parse_display_geometry(const std::string& token, DisplayRect& out, std::string& error) {
    // WxH+X+Y, split on the 'x' and both '+' separators.
    const size_t sep = token.find('x');
    const size_t plus_x = token.find('+');
    const size_t plus_y = (plus_x == std::string::npos) ? std::string::npos : token.find('+', plus_x + 1);
    if (sep == std::string::npos || plus_x == std::string::npos || plus_y == std::string::npos
        || sep == 0 || plus_x < sep + 2 || plus_y < plus_x + 2 || plus_y + 1 >= token.size()) {
        error = "invalid display geometry '" + token + "', expected WxH+X+Y";
        return false;
    }
    if (token.find('+', plus_y + 1) != std::string::npos || token.find('x', sep + 1) != std::string::npos) {
        error = "invalid display geometry '" + token + "', expected WxH+X+Y";
        return false;
    }

    DisplayRect parsed;
    if (!parse_positive_int(token.substr(0, sep), parsed.width)
        || !parse_positive_int(token.substr(sep + 1, plus_x - sep - 1), parsed.height)) {
        error = "invalid display size in '" + token + "'";
        return false;
    }
    if (!parse_non_negative_int(token.substr(plus_x + 1, plus_y - plus_x - 1), parsed.x_offset)
        || !parse_non_negative_int(token.substr(plus_y + 1), parsed.y_offset)) {
        error = "invalid display offset in '" + token + "'";
        return false;
    }
    if (static_cast<long long>(parsed.x_offset) + parsed.width > std::numeric_limits<int>::max()
        || static_cast<long long>(parsed.y_offset) + parsed.height > std::numeric_limits<int>::max()) {
        error = "display geometry '" + token + "' is out of range";
        return false;
    }
    out = parsed;
    return true;
}

bool parse_display_geometry_list(const std::vector<std::string>& tokens,
                                 std::vector<DisplayRect>& out,
                                 std::string& error) {
    std::vector<DisplayRect> parsed;
    parsed.reserve(tokens.size());
    for (const auto& token : tokens) {
        DisplayRect rect;
        if (!parse_display_geometry(token, rect, error)) {
            return false;
        }
        parsed.push_back(rect);
    }
    out = std::move(parsed);
    return true;
}

Offset normalize_display_origins(std::vector<DisplayRect>& rects) {
    if (rects.empty()) {
        return {};
    }
    int min_y = 0;
    int min_x = 0;
    for (const auto& r : rects) {
        min_y = std::min(min_y, r.y_offset);
        min_x = std::min(min_x, r.x_offset);
    }
    for (auto& r : rects) {
        r.y_offset -= min_y;
        r.x_offset -= min_x;
    }
    return {-min_y, -min_x};
}

std::string format_display_rect(const DisplayRect& rect) {
    std::ostringstream oss;
    oss << rect.width << "x" << rect.height << "+" << rect.x_offset << "+" << rect.y_offset;
    return oss.str();
}

} // namespace wallspan::core
