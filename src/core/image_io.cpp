#include "image_io.h"

#include "cli_parse.h"

#include <algorithm>
#include <cstdlib>
#include <memory>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;

namespace wallspan::core {

namespace {

constexpr int k_jpeg_quality = 95;
constexpr size_t k_max_extension_length = 10;

std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    if (ext.size() > k_max_extension_length) {
        return {};
    }
    return to_lower_copy(ext);
}

} // namespace

bool is_supported_image_extension(const fs::path& path) {
    const std::string ext = lower_extension(path);
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" ||
           ext == ".tga" || ext == ".gif" || ext == ".psd" || ext == ".pic" ||
           ext == ".pnm" || ext == ".pgm" || ext == ".ppm" || ext == ".hdr";
}

bool is_writable_image_extension(const fs::path& path) {
    const std::string ext = lower_extension(path);
    return ext == ".png" || ext == ".bmp" || ext == ".tga" || ext == ".jpg" || ext == ".jpeg";
}

bool decode_image_file(const std::string& path, Raster& out, std::string& error) {
    int w = 0;
    int h = 0;
    int channels = 0;
    std::unique_ptr<unsigned char, void (*)(void*)> data(
        stbi_load(path.c_str(), &w, &h, &channels, NUM_CHANNELS), stbi_image_free);
    if (!data) {
        const char* reason = stbi_failure_reason();
        error = "cannot be read as an image";
        if (reason != nullptr) {
            error += std::string(" (") + reason + ")";
        }
        return false;
    }

    Raster decoded;
    if (!allocate_raster(h, w, decoded, error)) {
        return false;
    }
    std::copy(data.get(), data.get() + decoded.pixels.size(), decoded.pixels.begin());
    out = std::move(decoded);
    return true;
}

bool write_image_file(const fs::path& path, const Raster& raster, std::string& error) {
    if (raster.empty()) {
        error = "refusing to write an empty image";
        return false;
    }
    const std::string ext = lower_extension(path);
    const std::string name = path.string();
    int ok = 0;
    if (ext == ".png") {
        ok = stbi_write_png(name.c_str(), raster.width, raster.height, NUM_CHANNELS,
                            raster.pixels.data(), raster.width * NUM_CHANNELS);
    } else if (ext == ".bmp") {
        ok = stbi_write_bmp(name.c_str(), raster.width, raster.height, NUM_CHANNELS, raster.pixels.data());
    } else if (ext == ".tga") {
        ok = stbi_write_tga(name.c_str(), raster.width, raster.height, NUM_CHANNELS, raster.pixels.data());
    } else if (ext == ".jpg" || ext == ".jpeg") {
        ok = stbi_write_jpg(name.c_str(), raster.width, raster.height, NUM_CHANNELS,
                            raster.pixels.data(), k_jpeg_quality);
    } else {
        error = "unsupported output image format '" + ext + "'";
        return false;
    }
    if (ok == 0) {
        error = "failed to write image file '" + name + "'";
        return false;
    }
    return true;
}

} // namespace wallspan::core
