#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

enum class DrawingToolType : uint8_t {
    SELECT = 0,
    PEN,
    ARROW,
    RECTANGLE,
    CIRCLE,
    TEXT,
    HANDDRAWN,
    LINE,
    ERASER,
    HIGHLIGHTER,
    STAR,
    TRIANGLE
};

// Stable names used by configuration, replay scripts and tool descriptors
std::string_view drawing_tool_type_to_str(DrawingToolType type);
std::optional<DrawingToolType> drawing_tool_type_from_str(std::string_view str);
