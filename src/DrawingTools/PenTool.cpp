#include "PenTool.hpp"
#include "ToolPaint.hpp"

PenTool::PenTool():
    FreehandToolBase(DrawingToolType::PEN, "pen",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\" fill=\"none\"><path d=\"M2 14L14 2M14 2L11 2M14 2L14 5\" stroke=\"currentColor\" stroke-width=\"1.5\" fill=\"none\"/><circle cx=\"2\" cy=\"14\" r=\"1\" fill=\"currentColor\"/></svg>",
        "Pen (1)")
{}

// A stroke starts on press, even a click with no movement leaves a mark
bool PenTool::requires_drag() const {
    return false;
}

void PenTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    render_polyline(obj, ctx, make_stroke_paint(obj.options, obj.options.color, obj.options.strokeWidth));
}

bool PenTool::hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const {
    if(!obj.points || obj.points->size() < 2)
        return false;
    return FreehandToolBase::hit_test(p, obj, margin);
}

float PenTool::get_default_hit_margin() const {
    return DEFAULT_HIT_MARGIN;
}
