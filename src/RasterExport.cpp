#include "RasterExport.hpp"
#include "Logger.hpp"
#include <include/core/SkImageInfo.h>
#include <include/core/SkPixmap.h>
#include <include/core/SkStream.h>
#include <include/core/SkData.h>
#include <include/encode/SkPngEncoder.h>
#include <fstream>

sk_sp<SkSurface> make_raster_surface(int width, int height) {
    SkImageInfo imgInfo = SkImageInfo::MakeN32Premul(width, height);
    sk_sp<SkSurface> surface = SkSurfaces::Raster(imgInfo);
    if(!surface)
        Logger::get().log("INFO", "[make_raster_surface] Could not make " + std::to_string(width) + "x" + std::to_string(height) + " surface");
    return surface;
}

bool write_surface_png(SkSurface* surface, const std::filesystem::path& filePath) {
    if(!surface)
        return false;

    SkPixmap px;
    if(!surface->peekPixels(&px)) {
        Logger::get().log("INFO", "[write_surface_png] Surface pixels are not readable");
        return false;
    }

    SkDynamicMemoryWStream out;
    if(!SkPngEncoder::Encode(&out, px, {})) {
        Logger::get().log("INFO", "[write_surface_png] Could not encode image");
        return false;
    }
    out.flush();

    std::ofstream fi(filePath, std::ios::out | std::ios::binary);
    if(!fi.is_open()) {
        Logger::get().log("INFO", "[write_surface_png] Could not open " + filePath.string());
        return false;
    }
    sk_sp<SkData> skData = out.detachAsData();
    fi.write(static_cast<const char*>(skData->data()), skData->size());
    fi.close();
    return !fi.fail();
}
