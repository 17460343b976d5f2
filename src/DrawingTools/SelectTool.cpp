#include "SelectTool.hpp"

SelectTool::SelectTool():
    DrawingToolBase(DrawingToolType::SELECT, "select",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\" fill=\"none\"><path d=\"M2 2L14 2L14 14L2 14L2 2Z\" stroke=\"currentColor\" stroke-width=\"1.5\" fill=\"none\"/><path d=\"M6 6L10 6L10 10L6 10L6 6Z\" stroke=\"currentColor\" stroke-width=\"1.5\" fill=\"none\"/></svg>",
        "Select (V)")
{}

bool SelectTool::requires_drag() const {
    return false;
}

std::shared_ptr<DrawingObject> SelectTool::start_drawing(const Vector2f& p, ToolContext& ctx) {
    return nullptr;
}

void SelectTool::continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
}

DrawingFinishOutcome SelectTool::finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
    return DrawingFinishOutcome::CREATED;
}

void SelectTool::render(const DrawingObject& obj, ToolContext& ctx) const {
}

bool SelectTool::hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const {
    return obj.bounds.contains(p, margin);
}

DrawingBounds SelectTool::calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const {
    return obj.bounds;
}
