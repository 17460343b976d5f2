#include "DrawingObject.hpp"

DrawingBounds DrawingBounds::make_ltrb(float left, float top, float right, float bottom) {
    return {left, top, right - left, bottom - top};
}

bool DrawingBounds::contains(const Vector2f& p, float margin) const {
    return p.x() >= x - margin && p.x() <= right() + margin &&
           p.y() >= y - margin && p.y() <= bottom() + margin;
}

DrawingObject::DrawingObject(const std::string& initID, DrawingToolType initType, const Vector2f& initStartPoint, const DrawingOptions& initOptions):
    startPoint(initStartPoint),
    options(initOptions),
    bounds{initStartPoint.x(), initStartPoint.y(), 0.0f, 0.0f},
    id(initID),
    type(initType)
{}

const std::string& DrawingObject::get_id() const {
    return id;
}

DrawingToolType DrawingObject::get_type() const {
    return type;
}
