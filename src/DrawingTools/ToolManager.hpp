#pragma once
#include "DrawingToolBase.hpp"
#include <map>
#include <optional>
#include <string_view>
#include <vector>

struct DrawingFinishResult {
    std::shared_ptr<DrawingObject> obj;
    DrawingFinishOutcome outcome = DrawingFinishOutcome::CREATED;
};

struct ToolDescriptor {
    DrawingToolType type;
    std::string name;
    std::string icon;
    std::string title;
    bool requiresDrag;
};

class ToolManager {
    public:
        // Replaces any tool already registered under the same type
        void register_tool(std::unique_ptr<DrawingToolBase> tool);
        bool unregister_tool(DrawingToolType type);
        void register_default_tools();
        void clear_all_tools();

        bool set_current_tool(DrawingToolType type);
        bool set_current_tool(std::string_view name);
        DrawingToolBase* get_current_tool() const;
        std::optional<DrawingToolType> get_current_tool_type() const;

        DrawingToolBase* get_tool(DrawingToolType type) const;
        bool has_tool(DrawingToolType type) const;
        size_t get_tool_count() const;
        std::vector<DrawingToolBase*> get_all_tools() const;
        std::vector<DrawingToolType> get_tool_types() const;
        std::vector<ToolDescriptor> get_tools_for_ui() const;

        // Gesture dispatch, served by the current tool
        std::shared_ptr<DrawingObject> start_drawing(const Vector2f& p, ToolContext& ctx);
        void continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx);
        std::shared_ptr<DrawingObject> update_drawing(const Vector2f& p, const std::shared_ptr<DrawingObject>& obj, ToolContext& ctx);
        DrawingFinishResult finish_drawing(const Vector2f& p, const std::shared_ptr<DrawingObject>& obj, ToolContext& ctx);
        bool requires_drag() const;

        // Per object dispatch, served by the tool owning the object's type
        void render_object(const DrawingObject& obj, ToolContext& ctx) const;
        bool hit_test(const Vector2f& p, const DrawingObject& obj, std::optional<float> margin = std::nullopt) const;
        DrawingBounds calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const;

    private:
        DrawingToolBase* current_tool_or_warn(const char* caller) const;
        // Current tool, only when it owns the object's type
        DrawingToolBase* gesture_tool_or_warn(const char* caller, const DrawingObject& obj) const;

        std::map<DrawingToolType, std::unique_ptr<DrawingToolBase>> tools;
        std::optional<DrawingToolType> currentTool;
};
