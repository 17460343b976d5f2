#pragma once
#include "../SharedTypes.hpp"
#include "DrawingOptions.hpp"
#include "DrawingToolType.hpp"
#include <optional>
#include <string>
#include <vector>

struct DrawingBounds {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    static DrawingBounds make_ltrb(float left, float top, float right, float bottom);
    float right() const { return x + width; }
    float bottom() const { return y + height; }
    bool contains(const Vector2f& p, float margin = 0.0f) const;
    bool operator==(const DrawingBounds& o) const = default;
};

struct DrawingTransform {
    float rotation = 0.0f;
    float scaleX = 1.0f;
    float scaleY = 1.0f;
    float translateX = 0.0f;
    float translateY = 0.0f;
    bool operator==(const DrawingTransform& o) const = default;
};

class DrawingObject {
    public:
        DrawingObject(const std::string& initID, DrawingToolType initType, const Vector2f& initStartPoint, const DrawingOptions& initOptions);

        const std::string& get_id() const;
        DrawingToolType get_type() const;

        Vector2f startPoint;
        std::optional<Vector2f> endPoint;   // Two anchor shapes
        std::optional<std::vector<Vector2f>> points; // Freehand samples, append only while drawing
        std::optional<std::string> text;
        DrawingOptions options;
        DrawingBounds bounds;
        std::optional<DrawingTransform> transform;
    private:
        std::string id;
        DrawingToolType type;
};
