#pragma once

#include "core/display_layout.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace wallspan::platform {

// What the compositor needs from the desktop: where the displays are and a
// way to install the finished image as the wallpaper.
class DesktopBackend {
public:
    virtual ~DesktopBackend() = default;

    // Display rectangles in the system's own order, with non-negative offsets.
    virtual bool list_displays(std::vector<core::DisplayRect>& out, std::string& error) = 0;

    // True when the desktop tiles the wallpaper from the primary display's
    // top left corner, so the canvas has to be origin corrected.
    [[nodiscard]] virtual bool uses_primary_origin_wrap() const = 0;

    // Position of the primary display inside the last listed layout.
    [[nodiscard]] virtual core::Offset primary_origin() const = 0;

    virtual bool apply_wallpaper(const std::filesystem::path& image_path, std::string& error) = 0;
};

std::unique_ptr<DesktopBackend> make_system_backend(bool verbose);

} // namespace wallspan::platform
