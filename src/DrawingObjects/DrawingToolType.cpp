#include "DrawingToolType.hpp"
#include <array>
#include <utility>

namespace {
    constexpr std::array<std::pair<DrawingToolType, std::string_view>, 12> TOOL_TYPE_NAMES = {{
        {DrawingToolType::SELECT, "select"},
        {DrawingToolType::PEN, "pen"},
        {DrawingToolType::ARROW, "arrow"},
        {DrawingToolType::RECTANGLE, "rectangle"},
        {DrawingToolType::CIRCLE, "circle"},
        {DrawingToolType::TEXT, "text"},
        {DrawingToolType::HANDDRAWN, "hand-drawn"},
        {DrawingToolType::LINE, "line"},
        {DrawingToolType::ERASER, "eraser"},
        {DrawingToolType::HIGHLIGHTER, "highlighter"},
        {DrawingToolType::STAR, "star"},
        {DrawingToolType::TRIANGLE, "triangle"}
    }};
}

std::string_view drawing_tool_type_to_str(DrawingToolType type) {
    for(auto& [t, name] : TOOL_TYPE_NAMES) {
        if(t == type)
            return name;
    }
    return "unknown";
}

std::optional<DrawingToolType> drawing_tool_type_from_str(std::string_view str) {
    for(auto& [t, name] : TOOL_TYPE_NAMES) {
        if(name == str)
            return t;
    }
    return std::nullopt;
}
