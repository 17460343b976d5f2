#include "TwoPointToolBase.hpp"
#include "../DrawGeometry.hpp"
#include "ToolPaint.hpp"

TwoPointToolBase::TwoPointToolBase(DrawingToolType initType, const std::string& initName, const std::string& initIcon, const std::string& initTitle):
    DrawingToolBase(initType, initName, initIcon, initTitle)
{}

bool TwoPointToolBase::requires_drag() const {
    return true;
}

std::shared_ptr<DrawingObject> TwoPointToolBase::start_drawing(const Vector2f& p, ToolContext& ctx) {
    std::shared_ptr<DrawingObject> obj = make_object(p, ctx);
    obj->endPoint = p;
    obj->bounds = calculate_bounds(*obj, ctx);
    return obj;
}

void TwoPointToolBase::continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
    obj.endPoint = p;
    obj.bounds = calculate_bounds(obj, ctx);
    ctx.redraw_canvas();
}

DrawingFinishOutcome TwoPointToolBase::finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
    obj.endPoint = p;
    obj.bounds = calculate_bounds(obj, ctx);
    return DrawingFinishOutcome::CREATED;
}

bool TwoPointToolBase::hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const {
    if(!obj.endPoint)
        return false;
    return normalized_anchor_bounds(obj.startPoint, obj.endPoint.value()).contains(p, margin);
}

DrawingBounds TwoPointToolBase::calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const {
    if(!obj.endPoint)
        return DrawingBounds{obj.startPoint.x(), obj.startPoint.y(), 0.0f, 0.0f};
    return normalized_anchor_bounds(obj.startPoint, obj.endPoint.value(), get_bounds_padding(obj));
}

float TwoPointToolBase::get_bounds_padding(const DrawingObject& obj) const {
    return 0.0f;
}

Vector2f TwoPointToolBase::get_end_point(const DrawingObject& obj) {
    return obj.endPoint.value_or(obj.startPoint);
}

// A zero stroke width still pads as if it were one pixel wide
float TwoPointToolBase::stroke_padding(const DrawingObject& obj) {
    float strokeWidth = obj.options.strokeWidth != 0.0f ? obj.options.strokeWidth : 1.0f;
    return strokeWidth * 0.5f;
}

void TwoPointToolBase::draw_shape_path(const DrawingObject& obj, ToolContext& ctx, const SkPath& path, const Vector4f& strokeColor, bool fillable) const {
    if(!ctx.canvas)
        return;
    ctx.canvas->save();
    if(fillable && obj.options.should_fill()) {
        SkPaint fillPaint = make_fill_paint(obj.options, obj.options.fillColor.value());
        apply_shadow(fillPaint, obj.options);
        ctx.canvas->drawPath(path, fillPaint);
    }
    SkPaint strokePaint = make_stroke_paint(obj.options, strokeColor, obj.options.strokeWidth);
    apply_shadow(strokePaint, obj.options);
    ctx.canvas->drawPath(path, strokePaint);
    ctx.canvas->restore();
}
