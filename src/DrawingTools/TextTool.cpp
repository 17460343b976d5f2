#include "TextTool.hpp"
#include "ToolPaint.hpp"
#include "../FontData.hpp"
#include "../Logger.hpp"
#include <include/core/SkFontMetrics.h>
#include <algorithm>
#include <cctype>

TextTool::TextTool():
    DrawingToolBase(DrawingToolType::TEXT, "text",
        "<svg width=\"16\" height=\"16\" viewBox=\"0 0 16 16\" fill=\"none\"><path d=\"M4 3H12M8 3V13M6 13H10\" stroke=\"currentColor\" stroke-width=\"1.5\" fill=\"none\"/></svg>",
        "Text (T)")
{}

bool TextTool::requires_drag() const {
    return false;
}

bool TextTool::is_blank(const std::optional<std::string>& text) {
    if(!text)
        return true;
    return std::all_of(text->begin(), text->end(), [](unsigned char c) { return std::isspace(c); });
}

std::shared_ptr<DrawingObject> TextTool::start_drawing(const Vector2f& p, ToolContext& ctx) {
    std::shared_ptr<DrawingObject> obj = make_object(p, ctx);
    obj->text = "";
    obj->bounds = calculate_bounds(*obj, ctx);
    return obj;
}

void TextTool::continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
}

DrawingFinishOutcome TextTool::finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
    obj.bounds = calculate_bounds(obj, ctx);
    return DrawingFinishOutcome::CREATED_AND_ENTER_EDIT_MODE;
}

void TextTool::update_text(DrawingObject& obj, const std::string& newText, ToolContext& ctx) {
    if(obj.get_type() != DrawingToolType::TEXT) {
        Logger::get().log("WARNING", "[TextTool::update_text] Object " + obj.get_id() + " is not a text object");
        return;
    }
    obj.text = newText;
    obj.bounds = calculate_bounds(obj, ctx);
    ctx.save_state();
}

void TextTool::render(const DrawingObject& obj, ToolContext& ctx) const {
    if(!ctx.canvas || is_blank(obj.text))
        return;

    const std::string& str = obj.text.value();
    SkFont font = ctx.get_font(obj.options);
    float width = measure_text_width(font, str);

    float x = obj.startPoint.x();
    if(obj.options.textAlign == TextAlign::CENTER)
        x -= width * 0.5f;
    else if(obj.options.textAlign == TextAlign::RIGHT)
        x -= width;

    // Vertically centered on the anchor
    SkFontMetrics metrics;
    font.getMetrics(&metrics);
    float y = obj.startPoint.y() - (metrics.fAscent + metrics.fDescent) * 0.5f;

    SkPaint p = make_fill_paint(obj.options, obj.options.color);
    apply_shadow(p, obj.options);

    ctx.canvas->save();
    ctx.canvas->drawSimpleText(str.data(), str.length(), SkTextEncoding::kUTF8, x, y, font, p);
    ctx.canvas->restore();
}

bool TextTool::hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const {
    return obj.bounds.contains(p, margin);
}

DrawingBounds TextTool::calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const {
    std::string str = is_blank(obj.text) ? std::string(TEXT_PLACEHOLDER) : obj.text.value();
    SkFont font = ctx.get_font(obj.options);
    float width = measure_text_width(font, str);
    float height = obj.options.fontSize * TEXT_LINE_HEIGHT_RATIO;

    float x = obj.startPoint.x();
    if(obj.options.textAlign == TextAlign::CENTER)
        x -= width * 0.5f;
    else if(obj.options.textAlign == TextAlign::RIGHT)
        x -= width;

    return DrawingBounds{x, obj.startPoint.y() - height * 0.5f, width, height};
}
