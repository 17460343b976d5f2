#include "DrawingToolBase.hpp"
#include "PenTool.hpp"
#include "EraserTool.hpp"
#include "HighlighterTool.hpp"
#include "RectangleTool.hpp"
#include "CircleTool.hpp"
#include "ArrowTool.hpp"
#include "LineTool.hpp"
#include "HandDrawnTool.hpp"
#include "StarTool.hpp"
#include "TriangleTool.hpp"
#include "TextTool.hpp"
#include "SelectTool.hpp"

DrawingToolBase::DrawingToolBase(DrawingToolType initType, const std::string& initName, const std::string& initIcon, const std::string& initTitle):
    type(initType),
    name(initName),
    icon(initIcon),
    title(initTitle)
{}

DrawingToolType DrawingToolBase::get_type() const {
    return type;
}

const std::string& DrawingToolBase::get_name() const {
    return name;
}

const std::string& DrawingToolBase::get_icon() const {
    return icon;
}

const std::string& DrawingToolBase::get_title() const {
    return title;
}

std::shared_ptr<DrawingObject> DrawingToolBase::update_drawing(const Vector2f& p, const std::shared_ptr<DrawingObject>& obj, ToolContext& ctx) {
    if(!obj)
        return nullptr;
    continue_drawing(p, *obj, ctx);
    return obj;
}

float DrawingToolBase::get_default_hit_margin() const {
    return DEFAULT_HIT_MARGIN;
}

std::shared_ptr<DrawingObject> DrawingToolBase::make_object(const Vector2f& p, ToolContext& ctx) const {
    return std::make_shared<DrawingObject>(ctx.generate_id(), type, p, ctx.options);
}

std::unique_ptr<DrawingToolBase> DrawingToolBase::allocate_tool_type(DrawingToolType t) {
    switch(t) {
        case DrawingToolType::SELECT:
            return std::make_unique<SelectTool>();
        case DrawingToolType::PEN:
            return std::make_unique<PenTool>();
        case DrawingToolType::ARROW:
            return std::make_unique<ArrowTool>();
        case DrawingToolType::RECTANGLE:
            return std::make_unique<RectangleTool>();
        case DrawingToolType::CIRCLE:
            return std::make_unique<CircleTool>();
        case DrawingToolType::TEXT:
            return std::make_unique<TextTool>();
        case DrawingToolType::HANDDRAWN:
            return std::make_unique<HandDrawnTool>();
        case DrawingToolType::LINE:
            return std::make_unique<LineTool>();
        case DrawingToolType::ERASER:
            return std::make_unique<EraserTool>();
        case DrawingToolType::HIGHLIGHTER:
            return std::make_unique<HighlighterTool>();
        case DrawingToolType::STAR:
            return std::make_unique<StarTool>();
        case DrawingToolType::TRIANGLE:
            return std::make_unique<TriangleTool>();
    }
    return nullptr;
}

DrawingToolBase::~DrawingToolBase() { }
