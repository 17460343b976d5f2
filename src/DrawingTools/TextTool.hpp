#pragma once
#include "DrawingToolBase.hpp"

#define TEXT_PLACEHOLDER "Type something"
#define TEXT_LINE_HEIGHT_RATIO 1.2f

class TextTool : public DrawingToolBase {
    public:
        TextTool();

        bool requires_drag() const override;
        std::shared_ptr<DrawingObject> start_drawing(const Vector2f& p, ToolContext& ctx) override;
        void continue_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) override;
        DrawingFinishOutcome finish_drawing(const Vector2f& p, DrawingObject& obj, ToolContext& ctx) override;

        void render(const DrawingObject& obj, ToolContext& ctx) const override;
        bool hit_test(const Vector2f& p, const DrawingObject& obj, float margin) const override;
        DrawingBounds calculate_bounds(const DrawingObject& obj, ToolContext& ctx) const override;

        // Replaces the text while editing. Bounds follow the new text and the host gets a checkpoint.
        void update_text(DrawingObject& obj, const std::string& newText, ToolContext& ctx);

        static bool is_blank(const std::optional<std::string>& text);
};
