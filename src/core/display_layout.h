#pragma once

#include <string>
#include <vector>

namespace wallspan::core {

// All geometry in wallspan is ordered (y, x) / (height, width), matching the
// row-major layout of the pixel buffers.

struct Extent {
    int height = 0;
    int width = 0;

    bool operator==(const Extent&) const = default;
};

struct Offset {
    int y = 0;
    int x = 0;

    bool operator==(const Offset&) const = default;
};

// One display's size and position inside the virtual desktop. Offsets are
// non-negative once a layout has been normalized.
struct DisplayRect {
    int height = 0;
    int width = 0;
    int y_offset = 0;
    int x_offset = 0;

    [[nodiscard]] Extent extent() const { return {height, width}; }
    [[nodiscard]] Offset offset() const { return {y_offset, x_offset}; }

    bool operator==(const DisplayRect&) const = default;
};

bool compute_bounding_box(const std::vector<DisplayRect>& rects, Extent& out, std::string& error);

long long total_display_area(const std::vector<DisplayRect>& rects);

// Parses an xrandr style "WxH+X+Y" token.
bool parse_display_geometry(const std::string& token, DisplayRect& out, std::string& error);
bool parse_display_geometry_list(const std::vector<std::string>& tokens,
                                 std::vector<DisplayRect>& out,
                                 std::string& error);

// Shifts rects whose offsets are relative to a primary display at (0,0) (and
// may be negative) so that every offset is non-negative. Returns where the
// primary display's origin ends up after the shift.
Offset normalize_display_origins(std::vector<DisplayRect>& rects);

std::string format_display_rect(const DisplayRect& rect);

} // namespace wallspan::core
