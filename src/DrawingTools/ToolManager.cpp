#include "ToolManager.hpp"
#include "../Logger.hpp"

void ToolManager::register_tool(std::unique_ptr<DrawingToolBase> tool) {
    if(!tool) {
        Logger::get().log("WARNING", "[ToolManager::register_tool] Tried to register a null tool");
        return;
    }
    DrawingToolType type = tool->get_type();
    tools[type] = std::move(tool);
}

bool ToolManager::unregister_tool(DrawingToolType type) {
    auto it = tools.find(type);
    if(it == tools.end())
        return false;
    tools.erase(it);
    if(currentTool == type)
        currentTool = std::nullopt;
    return true;
}

void ToolManager::register_default_tools() {
    for(uint8_t i = static_cast<uint8_t>(DrawingToolType::SELECT); i <= static_cast<uint8_t>(DrawingToolType::TRIANGLE); i++)
        register_tool(DrawingToolBase::allocate_tool_type(static_cast<DrawingToolType>(i)));
}

void ToolManager::clear_all_tools() {
    tools.clear();
    currentTool = std::nullopt;
}

bool ToolManager::set_current_tool(DrawingToolType type) {
    if(!has_tool(type)) {
        Logger::get().log("WARNING", "[ToolManager::set_current_tool] Tool " + std::string(drawing_tool_type_to_str(type)) + " is not registered");
        return false;
    }
    currentTool = type;
    return true;
}

bool ToolManager::set_current_tool(std::string_view name) {
    std::optional<DrawingToolType> type = drawing_tool_type_from_str(name);
    if(!type) {
        Logger::get().log("WARNING", "[ToolManager::set_current_tool] Unknown tool name " + std::string(name));
        return false;
    }
    return set_current_tool(type.value());
}

DrawingToolBase* ToolManager::get_current_tool() const {
    if(!currentTool)
        return nullptr;
    return get_tool(currentTool.value());
}

std::optional<DrawingToolType> ToolManager::get_current_tool_type() const {
    return currentTool;
}

DrawingToolBase* ToolManager::get_tool(DrawingToolType type) const {
    auto it = tools.find(type);
    if(it == tools.end())
        return nullptr;
    return it->second.get();
}

bool ToolManager::has_tool(DrawingToolType type) const {
    return tools.contains(type);
}

size_t ToolManager::get_tool_count() const {
    return tools.size();
}

std::vector<DrawingToolBase*> ToolManager::get_all_tools() const {
    std::vector<DrawingToolBase*> toRet;
    for(auto& [type, tool] : tools)
        toRet.emplace_back(tool.get());
    return toRet;
}

std::vector<DrawingToolType> ToolManager::get_tool_types() const {
    std::vector<DrawingToolType> toRet;
    for(auto& [type, tool] : tools)
        toRet.emplace_back(type);
    return toRet;
}

std::vector<ToolDescriptor> ToolManager::get_tools_for_ui() const {
    std::vector<ToolDescriptor> toRet;
    for(auto& [type, tool] : tools)
        toRet.emplace_back(ToolDescriptor{type, tool->get_name(), tool->get_icon(), tool->get_title(), tool->requires_drag()});
    return toRet;
}

DrawingToolBase* ToolManager::current_tool_or_warn(const char* caller) const {
    DrawingToolBase* tool = get_current_tool();
    if(!tool)
        Logger::get().log("WARNING", std::string("[") + caller + "] No current tool selected");
    return tool;
}

DrawingToolBase* ToolManager::gesture_tool_or_warn(const char* caller, const DrawingObject& obj) const {
    DrawingToolBase* tool = current_tool_or_warn(caller);
    if(tool && tool->get_type() != obj.get_type()) {
        Logger::get().log("WARNING", std::string("[") + caller + "] Object " + obj.get_id() + " of type " + std::string(drawing_tool_type_to_str(obj.get_type())) + " does not belong to current tool " + tool->get_name() + ", ignoring");
        return nullptr;
    }
    return tool;
}

std::shared_ptr<DrawingObject> ToolManager::start_drawing(const Vector2f& p, ToolContext& ctx) {
    DrawingToolBase* tool = current_tool_or_warn("ToolManager::start_drawing");
    if(!tool)
        return nullptr;
    return tool->start_drawing(p, ctx);
}

void ToolManager::continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) {
    DrawingToolBase* tool = gesture_tool_or_warn("ToolManager::continue_drawing", obj);
    if(tool)
        tool->continue_drawing(p, obj, ctx);
}

std::shared_ptr<DrawingObject> ToolManager::update_drawing(const Vector2f& p, const std::shared_ptr<DrawingObject>& obj, ToolContext& ctx) {
    if(!obj)
        return nullptr;
    DrawingToolBase* tool = gesture_tool_or_warn("ToolManager::update_drawing", *obj);
    if(!tool)
        return obj;
    return tool->update_drawing(p, obj, ctx);
}

DrawingFinishResult ToolManager::finish_drawing(const Vector2f& p, const std::shared_ptr<DrawingObject>& obj, ToolContext& ctx) {
    if(!obj)
        return {obj, DrawingFinishOutcome::CREATED};
    DrawingToolBase* tool = gesture_tool_or_warn("ToolManager::finish_drawing", *obj);
    if(!tool)
        return {obj, DrawingFinishOutcome::CREATED};
    return {obj, tool->finish_drawing(p, *obj, ctx)};
}

bool ToolManager::requires_drag() const {
    DrawingToolBase* tool = current_tool_or_warn("ToolManager::requires_drag");
    return tool && tool->requires_drag();
}

void ToolManager::render_object(const DrawingObject& obj, ToolContext& ctx) const {
    DrawingToolBase* tool = get_tool(obj.get_type());
    if(!tool) {
        Logger::get().log("WARNING", "[ToolManager::render_object] No tool registered for object " + obj.get_id() + " of type " + std::string(drawing_tool_type_to_str(obj.get_type())));
        return;
    }
    tool->render(obj, ctx);
}

bool ToolManager::hit_test(const Vector2f& p, const DrawingObject& obj, std::optional<float> margin) const {
    DrawingToolBase* tool = get_tool(obj.get_type());
    if(!tool)
        return false;
    return tool->hit_test(p, obj, margin.value_or(tool->get_default_hit_margin()));
}

DrawingBounds ToolManager::calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const {
    DrawingToolBase* tool = get_tool(obj.get_type());
    if(!tool)
        return DrawingBounds{};
    return tool->calculate_bounds(obj, ctx);
}
