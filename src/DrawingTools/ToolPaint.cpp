#include "ToolPaint.hpp"
#include "../ConvertVec.hpp"
#include <include/effects/SkDashPathEffect.h>
#include <include/effects/SkImageFilters.h>
#include <algorithm>
#include <cmath>

namespace {
    void set_color_with_opacity(SkPaint& p, const Vector4f& color, float opacity) {
        SkColor4f c = convert_vec4(color);
        c.fA = std::clamp(c.fA * opacity, 0.0f, 1.0f);
        p.setColor4f(c);
    }
}

sk_sp<SkPathEffect> make_dash_effect(const std::vector<float>& lineDash) {
    if(lineDash.empty())
        return nullptr;

    float total = 0.0f;
    for(float d : lineDash) {
        if(d < 0.0f || !std::isfinite(d))
            return nullptr;
        total += d;
    }
    if(total <= 0.0f)
        return nullptr;

    std::vector<float> intervals = lineDash;
    if(intervals.size() % 2 == 1)
        intervals.insert(intervals.end(), lineDash.begin(), lineDash.end());
    return SkDashPathEffect::Make(intervals.data(), static_cast<int>(intervals.size()), 0.0f);
}

void apply_shadow(SkPaint& paint, const DrawingOptions& options) {
    if(!options.has_shadow())
        return;
    float sigma = options.shadowBlur * 0.5f;
    SkColor shadowColor = convert_vec4(options.shadowColor.value()).toSkColor();
    paint.setImageFilter(SkImageFilters::DropShadow(options.shadowOffset.x(), options.shadowOffset.y(), sigma, sigma, shadowColor, nullptr));
}

SkPaint make_stroke_paint(const DrawingOptions& options, const Vector4f& color, float strokeWidth) {
    SkPaint p;
    p.setAntiAlias(true);
    p.setStyle(SkPaint::kStroke_Style);
    p.setStrokeWidth(strokeWidth);
    set_color_with_opacity(p, color, options.opacity);
    p.setPathEffect(make_dash_effect(options.lineDash));
    return p;
}

SkPaint make_fill_paint(const DrawingOptions& options, const Vector4f& color) {
    SkPaint p;
    p.setAntiAlias(true);
    p.setStyle(SkPaint::kFill_Style);
    set_color_with_opacity(p, color, options.opacity);
    return p;
}
