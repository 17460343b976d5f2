#include "ArrowTool.hpp"
#include "ToolPaint.hpp"
#include "../ConvertVec.hpp"
#include "../DrawGeometry.hpp"
#include <include/core/SkPathBuilder.h>
#include <algorithm>

ArrowTool::ArrowTool():
    TwoPointToolBase(DrawingToolType::ARROW, "arrow",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\" fill=\"none\"><path d=\"M2 16L16 2M16 2L16 9M16 2L9 2\" stroke=\"currentColor\" stroke-width=\"1.5\" fill=\"none\"/></svg>",
        "Arrow (2)")
{}

void ArrowTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    if(!ctx.canvas || !obj.endPoint)
        return;

    const Vector4f& color = obj.options.get_stroke_color();
    ctx.canvas->save();

    SkPaint shaftPaint = make_stroke_paint(obj.options, color, obj.options.strokeWidth);
    shaftPaint.setStrokeCap(SkPaint::kRound_Cap);
    shaftPaint.setStrokeJoin(SkPaint::kRound_Join);
    apply_shadow(shaftPaint, obj.options);
    ctx.canvas->drawLine(convert_vec2(obj.startPoint), convert_vec2(obj.endPoint.value()), shaftPaint);

    std::optional<ArrowHead> head = arrow_head_triangle(obj.startPoint, obj.endPoint.value());
    if(head) {
        SkPathBuilder headBuilder;
        headBuilder.moveTo(convert_vec2(head->p[0]));
        headBuilder.lineTo(convert_vec2(head->p[1]));
        headBuilder.lineTo(convert_vec2(head->p[2]));
        headBuilder.close();
        SkPaint headPaint = make_fill_paint(obj.options, color);
        apply_shadow(headPaint, obj.options);
        ctx.canvas->drawPath(headBuilder.detach(), headPaint);
    }

    ctx.canvas->restore();
}

bool ArrowTool::hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const {
    if(!obj.endPoint || obj.startPoint == obj.endPoint.value())
        return false;
    return distance_to_line_segment(p, obj.startPoint, obj.endPoint.value()) <= margin;
}

float ArrowTool::get_bounds_padding(const DrawingObject& obj) const {
    return std::max(ARROW_MIN_BOUNDS_PADDING, obj.options.strokeWidth);
}
