#include "HighlighterTool.hpp"
#include "ToolPaint.hpp"

HighlighterTool::HighlighterTool():
    FreehandToolBase(DrawingToolType::HIGHLIGHTER, "highlighter",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\"><rect x=\"2\" y=\"10\" width=\"12\" height=\"4\" fill=\"#FFD600\" opacity=\"0.5\"/><rect x=\"2\" y=\"2\" width=\"12\" height=\"8\" fill=\"#FFD600\"/></svg>",
        "Highlighter (9)")
{}

void HighlighterTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    DrawingOptions highlightOptions = obj.options;
    highlightOptions.opacity *= HIGHLIGHTER_ALPHA;
    highlightOptions.lineDash.clear();
    SkPaint p = make_stroke_paint(highlightOptions, obj.options.color, freehand_width(obj));
    p.setBlendMode(SkBlendMode::kMultiply);
    render_polyline(obj, ctx, p);
}
