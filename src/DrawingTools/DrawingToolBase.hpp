#pragma once
#include <include/core/SkCanvas.h>
#include <cstdint>
#include <memory>
#include <string>
#include "../DrawingObjects/DrawingObject.hpp"
#include "../DrawingObjects/DrawingToolType.hpp"
#include "ToolContext.hpp"

#define DEFAULT_HIT_MARGIN 5.0f

enum class DrawingFinishOutcome : uint8_t {
    CREATED = 0,
    CREATED_AND_ENTER_EDIT_MODE
};

class DrawingToolBase {
    public:
        DrawingToolBase(DrawingToolType initType, const std::string& initName, const std::string& initIcon, const std::string& initTitle);

        DrawingToolType get_type() const;
        const std::string& get_name() const;
        const std::string& get_icon() const;
        const std::string& get_title() const;

        virtual bool requires_drag() const = 0;

        // Returns nullptr for tools that don't create anything on press
        virtual std::shared_ptr<DrawingObject> start_drawing(const Vector2f& p, ToolContext& ctx) = 0;
        virtual void continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) = 0;
        std::shared_ptr<DrawingObject> update_drawing(const Vector2f& p, const std::shared_ptr<DrawingObject>& obj, ToolContext& ctx);
        virtual DrawingFinishOutcome finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) = 0;

        virtual void render(const DrawingObject& obj, ToolContext& ctx) const = 0;
        virtual bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const = 0;
        virtual float get_default_hit_margin() const;
        virtual DrawingBounds calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const = 0;

        virtual ~DrawingToolBase(); 

        static std::unique_ptr<DrawingToolBase> allocate_tool_type(DrawingToolType t);
    protected:
        std::shared_ptr<DrawingObject> make_object(const Vector2f& p, ToolContext& ctx) const;

    private:
        DrawingToolType type;
        std::string name;
        std::string icon;
        std::string title;
};
