#pragma once
#include <include/core/SkPaint.h>
#include <include/core/SkPathEffect.h>
#include <vector>
#include "../DrawingObjects/DrawingOptions.hpp"

// Paints are built per draw call from the object's own options, nothing is cached on the canvas

sk_sp<SkPathEffect> make_dash_effect(const std::vector<float>& lineDash);
SkPaint make_stroke_paint(const DrawingOptions& options, const Vector4f& color, float strokeWidth);
SkPaint make_fill_paint(const DrawingOptions& options, const Vector4f& color);
void apply_shadow(SkPaint& paint, const DrawingOptions& options);
