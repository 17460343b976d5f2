#include "CanvasHost.hpp"
#include "DrawingTools/TextTool.hpp"
#include "ToolConfiguration.hpp"
#include "Logger.hpp"
#include <algorithm>

CanvasHost::CanvasHost(ToolManager& initToolMan, FontData* initFonts):
    toolMan(initToolMan),
    fonts(initFonts)
{}

void CanvasHost::apply_config(const ToolConfiguration& config) {
    options = config.defaultOptions;
    hitMargins.clear();
    for(DrawingToolType type : toolMan.get_tool_types()) {
        std::optional<float> margin = config.get_hit_margin(type);
        if(margin)
            hitMargins[type] = margin.value();
    }
}

ToolContext CanvasHost::make_context(SkCanvas* canvas) {
    ToolContext ctx;
    ctx.canvas = canvas;
    ctx.fonts = fonts;
    ctx.options = options;
    ctx.generateId = generate_object_id;
    ctx.redrawCanvas = [this]() { redrawRequests++; };
    ctx.saveState = [this]() { checkpoints++; };
    return ctx;
}

void CanvasHost::press(const Vector2f& p) {
    if(objBeingDrawn) {
        Logger::get().log("WARNING", "[CanvasHost::press] Press while object " + objBeingDrawn->get_id() + " is still being drawn, discarding it");
        cancel();
    }
    finish_text_editing();

    DrawingToolBase* tool = toolMan.get_current_tool();
    if(tool && tool->get_type() == DrawingToolType::SELECT) {
        std::shared_ptr<DrawingObject> hit = object_at(p);
        selectedId = hit ? std::optional<std::string>(hit->get_id()) : std::nullopt;
    }

    ToolContext ctx = make_context();
    objBeingDrawn = toolMan.start_drawing(p, ctx);
    pressPos = p;
    movedSincePress = false;
}

void CanvasHost::move(const Vector2f& p) {
    if(!objBeingDrawn)
        return;
    ToolContext ctx = make_context();
    objBeingDrawn = toolMan.update_drawing(p, objBeingDrawn, ctx);
    movedSincePress |= p != pressPos;
}

std::shared_ptr<DrawingObject> CanvasHost::release(const Vector2f& p) {
    if(!objBeingDrawn)
        return nullptr;

    if(toolMan.get_current_tool_type() != objBeingDrawn->get_type()) {
        Logger::get().log("WARNING", "[CanvasHost::release] Current tool changed while drawing object " + objBeingDrawn->get_id() + ", discarding it");
        cancel();
        return nullptr;
    }

    movedSincePress |= p != pressPos;
    // Tools that need a drag don't register a plain click
    if(toolMan.requires_drag() && !movedSincePress) {
        cancel();
        return nullptr;
    }

    ToolContext ctx = make_context();
    DrawingFinishResult result = toolMan.finish_drawing(p, objBeingDrawn, ctx);
    objBeingDrawn = nullptr;
    if(!result.obj)
        return nullptr;

    objects.emplace_back(result.obj);
    if(result.outcome == DrawingFinishOutcome::CREATED_AND_ENTER_EDIT_MODE) {
        editingTextId = result.obj->get_id();
        selectedId = result.obj->get_id();
    }
    else
        ctx.save_state();
    ctx.redraw_canvas();
    return result.obj;
}

void CanvasHost::cancel() {
    objBeingDrawn = nullptr;
    movedSincePress = false;
}

bool CanvasHost::is_drawing() const {
    return objBeingDrawn != nullptr;
}

const std::shared_ptr<DrawingObject>& CanvasHost::get_object_being_drawn() const {
    return objBeingDrawn;
}

bool CanvasHost::update_text(const std::string& id, const std::string& text) {
    std::shared_ptr<DrawingObject> obj = get_object(id);
    TextTool* textTool = dynamic_cast<TextTool*>(toolMan.get_tool(DrawingToolType::TEXT));
    if(!obj || obj->get_type() != DrawingToolType::TEXT || !textTool) {
        Logger::get().log("WARNING", "[CanvasHost::update_text] No editable text object " + id);
        return false;
    }
    ToolContext ctx = make_context();
    textTool->update_text(*obj, text, ctx);
    return true;
}

const std::optional<std::string>& CanvasHost::get_editing_text_id() const {
    return editingTextId;
}

// Text left blank when editing ends is dropped
void CanvasHost::finish_text_editing() {
    if(!editingTextId)
        return;
    std::shared_ptr<DrawingObject> obj = get_object(editingTextId.value());
    if(obj && TextTool::is_blank(obj->text))
        remove_object(obj->get_id());
    editingTextId = std::nullopt;
}

std::shared_ptr<DrawingObject> CanvasHost::object_at(const Vector2f& p) const {
    for(auto it = objects.rbegin(); it != objects.rend(); ++it) {
        auto marginIt = hitMargins.find((*it)->get_type());
        std::optional<float> margin = marginIt != hitMargins.end() ? std::optional<float>(marginIt->second) : std::nullopt;
        if(toolMan.hit_test(p, **it, margin))
            return *it;
    }
    return nullptr;
}

std::shared_ptr<DrawingObject> CanvasHost::get_object(const std::string& id) const {
    auto it = std::find_if(objects.begin(), objects.end(), [&](auto& obj) {
        return obj->get_id() == id;
    });
    return it != objects.end() ? *it : nullptr;
}

const std::vector<std::shared_ptr<DrawingObject>>& CanvasHost::get_objects() const {
    return objects;
}

bool CanvasHost::remove_object(const std::string& id) {
    auto it = std::find_if(objects.begin(), objects.end(), [&](auto& obj) {
        return obj->get_id() == id;
    });
    if(it == objects.end())
        return false;
    objects.erase(it);
    if(selectedId == id)
        selectedId = std::nullopt;
    if(editingTextId == id)
        editingTextId = std::nullopt;
    return true;
}

const std::optional<std::string>& CanvasHost::get_selected_id() const {
    return selectedId;
}

void CanvasHost::render_all(SkCanvas* canvas) {
    ToolContext ctx = make_context(canvas);
    for(auto& obj : objects)
        toolMan.render_object(*obj, ctx);
    if(objBeingDrawn)
        toolMan.render_object(*objBeingDrawn, ctx);
}

unsigned CanvasHost::get_redraw_request_count() const {
    return redrawRequests;
}

unsigned CanvasHost::get_checkpoint_count() const {
    return checkpoints;
}
