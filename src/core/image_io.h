#pragma once

#include "raster.h"

#include <filesystem>
#include <string>

namespace wallspan::core {

bool is_supported_image_extension(const std::filesystem::path& path);
bool is_writable_image_extension(const std::filesystem::path& path);

// Decodes any stb_image format, converting grey, palette and alpha images to RGB.
bool decode_image_file(const std::string& path, Raster& out, std::string& error);

// Encodes by file suffix: .png, .bmp, .tga, .jpg or .jpeg.
bool write_image_file(const std::filesystem::path& path, const Raster& raster, std::string& error);

} // namespace wallspan::core
