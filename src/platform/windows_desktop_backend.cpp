#include "desktop_backend.h"

#ifdef _WIN32

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <iostream>

namespace fs = std::filesystem;

namespace wallspan::platform {

namespace {

BOOL CALLBACK collect_monitor(HMONITOR monitor, HDC, LPRECT, LPARAM data) {
    auto* rects = reinterpret_cast<std::vector<core::DisplayRect>*>(data);
    MONITORINFO info{};
    info.cbSize = sizeof(info);
    if (!GetMonitorInfoW(monitor, &info)) {
        return TRUE;
    }
    core::DisplayRect rect;
    rect.height = info.rcMonitor.bottom - info.rcMonitor.top;
    rect.width = info.rcMonitor.right - info.rcMonitor.left;
    rect.y_offset = info.rcMonitor.top;
    rect.x_offset = info.rcMonitor.left;
    rects->push_back(rect);
    return TRUE;
}

bool set_registry_string(HKEY key, const wchar_t* name, const wchar_t* value) {
    const auto bytes = static_cast<DWORD>((wcslen(value) + 1) * sizeof(wchar_t));
    return RegSetValueExW(key, name, 0, REG_SZ, reinterpret_cast<const BYTE*>(value), bytes) == ERROR_SUCCESS;
}

class WindowsDesktopBackend : public DesktopBackend {
public:
    explicit WindowsDesktopBackend(bool verbose) : verbose_(verbose) {}

    bool list_displays(std::vector<core::DisplayRect>& out, std::string& error) override {
        out.clear();
        if (!EnumDisplayMonitors(nullptr, nullptr, collect_monitor, reinterpret_cast<LPARAM>(&out))) {
            error = "EnumDisplayMonitors failed";
            return false;
        }
        // Monitor coordinates are relative to the primary display at (0,0).
        primary_origin_ = core::normalize_display_origins(out);
        return true;
    }

    [[nodiscard]] bool uses_primary_origin_wrap() const override { return true; }
    [[nodiscard]] core::Offset primary_origin() const override { return primary_origin_; }

    bool apply_wallpaper(const fs::path& image_path, std::string& error) override {
        if (verbose_) {
            std::cout << "Setting background on Windows." << std::endl;
        }
        HKEY desktop_key = nullptr;
        if (RegOpenKeyExW(HKEY_CURRENT_USER, L"Control Panel\\Desktop", 0, KEY_SET_VALUE, &desktop_key)
            == ERROR_SUCCESS) {
            const bool ok = set_registry_string(desktop_key, L"WallpaperStyle", L"0")
                            && set_registry_string(desktop_key, L"TileWallpaper", L"1");
            RegCloseKey(desktop_key);
            if (!ok) {
                std::cerr << "Warning: Failed to set the tiled wallpaper mode\n";
            }
        } else {
            std::cerr << "Warning: Failed to open the desktop registry key\n";
        }

        std::wstring wide_path = image_path.wstring();
        if (!SystemParametersInfoW(SPI_SETDESKWALLPAPER, 0, wide_path.data(),
                                   SPIF_UPDATEINIFILE | SPIF_SENDWININICHANGE)) {
            error = "SystemParametersInfoW failed with error " + std::to_string(GetLastError());
            return false;
        }
        return true;
    }

private:
    bool verbose_;
    core::Offset primary_origin_{};
};

} // namespace

std::unique_ptr<DesktopBackend> make_system_backend(bool verbose) {
    return std::make_unique<WindowsDesktopBackend>(verbose);
}

} // namespace wallspan::platform

#endif
