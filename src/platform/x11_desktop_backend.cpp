#include "desktop_backend.h"

#include "core/image_io.h"
#include "core/raster.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>

namespace fs = std::filesystem;

namespace wallspan::platform {

namespace {

struct DisplayCloser {
    void operator()(Display* dpy) const {
        if (dpy != nullptr) {
            XCloseDisplay(dpy);
        }
    }
};

using DisplayHandle = std::unique_ptr<Display, DisplayCloser>;

bool open_display(DisplayHandle& out, std::string& error) {
    out.reset(XOpenDisplay(nullptr));
    if (!out) {
        const char* name = std::getenv("DISPLAY");
        error = std::string("Cannot open X display ") + (name != nullptr ? name : "(DISPLAY not set)");
        return false;
    }
    return true;
}

// Runs a program and waits for it. GSETTINGS_BACKEND is forced to dconf when
// `dconf_backend` is set, and DISPLAY defaults to :0 when missing.
bool run_program(const std::vector<std::string>& args, bool dconf_backend, std::string& error) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        if (std::getenv("DISPLAY") == nullptr) {
            setenv("DISPLAY", ":0", 1);
        }
        if (dconf_backend) {
            setenv("GSETTINGS_BACKEND", "dconf", 1);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = std::string("waitpid failed: ") + std::strerror(errno);
            return false;
        }
    }
    if (!WIFEXITED(status)) {
        error = "'" + args.front() + "' was terminated";
        return false;
    }
    const int code = WEXITSTATUS(status);
    if (code == 127) {
        error = "Could not run '" + args.front() + "'. Be sure the program is installed on your system";
        return false;
    }
    if (code != 0) {
        error = "'" + args.front() + "' exited with status " + std::to_string(code);
        return false;
    }
    return true;
}

class X11DesktopBackend : public DesktopBackend {
public:
    explicit X11DesktopBackend(bool verbose) : verbose_(verbose) {}

    bool list_displays(std::vector<core::DisplayRect>& out, std::string& error) override {
        out.clear();
        DisplayHandle dpy;
        if (!open_display(dpy, error)) {
            return false;
        }
        Window root = DefaultRootWindow(dpy.get());
        XRRScreenResources* res = XRRGetScreenResourcesCurrent(dpy.get(), root);
        if (!res) {
            error = "XRandR screen resources are unavailable";
            return false;
        }
        for (int i = 0; i < res->ncrtc; ++i) {
            XRRCrtcInfo* crtc = XRRGetCrtcInfo(dpy.get(), res, res->crtcs[i]);
            if (!crtc) continue;
            // Disabled CRTCs report mode None and a zero size.
            if (crtc->mode != None && crtc->width > 0 && crtc->height > 0) {
                core::DisplayRect rect;
                rect.height = static_cast<int>(crtc->height);
                rect.width = static_cast<int>(crtc->width);
                rect.y_offset = crtc->y;
                rect.x_offset = crtc->x;
                out.push_back(rect);
            }
            XRRFreeCrtcInfo(crtc);
        }
        XRRFreeScreenResources(res);
        return true;
    }

    [[nodiscard]] bool uses_primary_origin_wrap() const override { return false; }
    [[nodiscard]] core::Offset primary_origin() const override { return {}; }

    bool apply_wallpaper(const fs::path& image_path, std::string& error) override {
        const char* desktop_env = std::getenv("XDG_CURRENT_DESKTOP");
        if (desktop_env == nullptr || desktop_env[0] == '\0') {
            if (verbose_) {
                std::cout << "No desktop environment detected, painting the X root window." << std::endl;
            }
            return paint_root_window(image_path, error);
        }

        const std::string desktop(desktop_env);
        if (verbose_) {
            std::cout << "Desktop environment variable is XDG_CURRENT_DESKTOP = " << desktop << std::endl;
        }
        if (desktop == "LXDE") {
            return run_program({"pcmanfm", "--set-wallpaper", image_path.string(), "--wallpaper-mode=fit"},
                               false, error);
        }
        if (verbose_) {
            if (desktop == "X-Cinnamon" || desktop == "Unity") {
                std::cout << "Detected " << desktop << ", using GNOME settings." << std::endl;
            } else if (desktop != "GNOME") {
                std::cout << "Assuming a GNOME compatible desktop." << std::endl;
            }
        }
        const std::string image_url = "file://" + image_path.string();
        if (!run_program({"gsettings", "set", "org.gnome.desktop.background", "picture-options", "spanned"},
                         true, error)) {
            return false;
        }
        return run_program({"gsettings", "set", "org.gnome.desktop.background", "picture-uri", image_url},
                           true, error);
    }

private:
    bool paint_root_window(const fs::path& image_path, std::string& error) {
        core::Raster image;
        if (!core::decode_image_file(image_path.string(), image, error)) {
            return false;
        }
        DisplayHandle dpy;
        if (!open_display(dpy, error)) {
            return false;
        }
        Display* display = dpy.get();
        const int screen = DefaultScreen(display);
        Window root = RootWindow(display, screen);
        const auto width = static_cast<unsigned int>(image.width);
        const auto height = static_cast<unsigned int>(image.height);

        // XDestroyImage frees the data with free().
        char* ximg_data = static_cast<char*>(std::malloc(static_cast<size_t>(width) * height * 4));
        if (!ximg_data) {
            error = "Failed to allocate XImage data";
            return false;
        }
        XImage* img = XCreateImage(display, DefaultVisual(display, screen), DefaultDepth(display, screen),
                                   ZPixmap, 0, ximg_data, width, height, 32, 0);
        if (!img) {
            std::free(ximg_data);
            error = "Failed to create XImage";
            return false;
        }
        for (int y = 0; y < image.height; ++y) {
            for (int x = 0; x < image.width; ++x) {
                const unsigned char* px = image.pixel(y, x);
                const unsigned long pixel = (static_cast<unsigned long>(px[0]) << 16)
                                            | (static_cast<unsigned long>(px[1]) << 8) | px[2];
                XPutPixel(img, x, y, pixel);
            }
        }

        Pixmap pixmap = XCreatePixmap(display, root, width, height, DefaultDepth(display, screen));
        if (!pixmap) {
            XDestroyImage(img);
            error = "Failed to create root pixmap";
            return false;
        }
        GC gc = XCreateGC(display, pixmap, 0, nullptr);
        XPutImage(display, pixmap, gc, img, 0, 0, 0, 0, width, height);
        XFreeGC(display, gc);
        XSetWindowBackgroundPixmap(display, root, pixmap);
        XClearWindow(display, root);
        XFlush(display);
        XFreePixmap(display, pixmap);
        XDestroyImage(img);
        return true;
    }

    bool verbose_;
};

} // namespace

std::unique_ptr<DesktopBackend> make_system_backend(bool verbose) {
    return std::make_unique<X11DesktopBackend>(verbose);
}

} // namespace wallspan::platform
