#pragma once
#include <include/core/SkSurface.h>
#include <filesystem>

sk_sp<SkSurface> make_raster_surface(int width, int height);
bool write_surface_png(SkSurface* surface, const std::filesystem::path& filePath);
