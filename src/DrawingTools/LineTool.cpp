#include "LineTool.hpp"
#include "ToolPaint.hpp"
#include "../ConvertVec.hpp"
#include "../DrawGeometry.hpp"

LineTool::LineTool():
    TwoPointToolBase(DrawingToolType::LINE, "line",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\"><line x1=\"3\" y1=\"13\" x2=\"13\" y2=\"3\" stroke=\"currentColor\" stroke-width=\"2\"/></svg>",
        "Line (7)")
{}

void LineTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    if(!ctx.canvas || !obj.endPoint)
        return;
    ctx.canvas->save();
    SkPaint p = make_stroke_paint(obj.options, obj.options.color, obj.options.strokeWidth);
    ctx.canvas->drawLine(convert_vec2(obj.startPoint), convert_vec2(obj.endPoint.value()), p);
    ctx.canvas->restore();
}

bool LineTool::hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const {
    if(!obj.endPoint || obj.startPoint == obj.endPoint.value())
        return false;
    return distance_to_line_segment(p, obj.startPoint, obj.endPoint.value()) <= margin;
}

float LineTool::get_default_hit_margin() const {
    return 4.0f;
}
