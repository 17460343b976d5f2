#include "EraserTool.hpp"

EraserTool::EraserTool():
    FreehandToolBase(DrawingToolType::ERASER, "eraser",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\"><rect x=\"2\" y=\"10\" width=\"8\" height=\"4\" fill=\"currentColor\"/><rect x=\"6\" y=\"2\" width=\"8\" height=\"8\" fill=\"currentColor\" opacity=\"0.5\"/></svg>",
        "Eraser (8)")
{}

// Punches through whatever was drawn below, color and opacity are irrelevant
void EraserTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    SkPaint p;
    p.setAntiAlias(true);
    p.setStyle(SkPaint::kStroke_Style);
    p.setStrokeWidth(freehand_width(obj));
    p.setColor4f({0.0f, 0.0f, 0.0f, 1.0f});
    p.setBlendMode(SkBlendMode::kDstOut);
    render_polyline(obj, ctx, p);
}
