#pragma once
#include <include/core/SkCanvas.h>
#include <include/core/SkFont.h>
#include <functional>
#include <string>
#include "../DrawingObjects/DrawingOptions.hpp"

struct FontData;

// Everything a tool may touch on the host side during one call
struct ToolContext {
    SkCanvas* canvas = nullptr;
    FontData* fonts = nullptr;
    DrawingOptions options;
    std::function<std::string()> generateId;
    std::function<void()> redrawCanvas;
    std::function<void()> saveState;

    std::string generate_id();
    void redraw_canvas();
    void save_state();
    SkFont get_font(const DrawingOptions& fontOptions);
};

std::string generate_object_id();
