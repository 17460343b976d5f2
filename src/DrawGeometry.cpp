#include "DrawGeometry.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

float distance_to_line_segment(const Vector2f& p, const Vector2f& a, const Vector2f& b) {
    Vector2f seg = b - a;
    float lenSq = seg.squaredNorm();
    if(lenSq == 0.0f)
        return (p - a).norm();
    float t = std::clamp((p - a).dot(seg) / lenSq, 0.0f, 1.0f);
    Vector2f proj = a + t * seg;
    return (p - proj).norm();
}

std::optional<float> distance_to_polyline(const Vector2f& p, const std::vector<Vector2f>& pts) {
    if(pts.empty())
        return std::nullopt;
    if(pts.size() == 1)
        return (p - pts.front()).norm();
    float minDist = std::numeric_limits<float>::max();
    for(size_t i = 1; i < pts.size(); i++)
        minDist = std::min(minDist, distance_to_line_segment(p, pts[i - 1], pts[i]));
    return minDist;
}

DrawingBounds bounds_of_points(const std::vector<Vector2f>& pts) {
    if(pts.empty())
        return DrawingBounds{};
    Vector2f minP = pts.front();
    Vector2f maxP = pts.front();
    for(const Vector2f& p : pts) {
        minP = minP.cwiseMin(p);
        maxP = maxP.cwiseMax(p);
    }
    return DrawingBounds::make_ltrb(minP.x(), minP.y(), maxP.x(), maxP.y());
}

DrawingBounds normalized_anchor_bounds(const Vector2f& a, const Vector2f& b, float padding) {
    Vector2f minP = a.cwiseMin(b);
    Vector2f maxP = a.cwiseMax(b);
    return DrawingBounds::make_ltrb(minP.x() - padding, minP.y() - padding, maxP.x() + padding, maxP.y() + padding);
}

std::optional<ArrowHead> arrow_head_triangle(const Vector2f& start, const Vector2f& end) {
    Vector2f diff = end - start;
    float length = diff.norm();
    if(length == 0.0f)
        return std::nullopt;

    ArrowHead head;
    head.length = std::min(ARROW_HEAD_MAX_LENGTH, length * ARROW_HEAD_LENGTH_RATIO);
    head.halfWidth = head.length * ARROW_HEAD_WIDTH_RATIO;

    Vector2f dir = diff / length;
    Vector2f perp{dir.y(), -dir.x()};
    Vector2f base = end - head.length * dir;
    head.p[0] = end;
    head.p[1] = base + head.halfWidth * perp;
    head.p[2] = base - head.halfWidth * perp;
    return head;
}

std::vector<Vector2f> star_polygon(const Vector2f& a, const Vector2f& b, unsigned spikes, float innerRatio) {
    std::vector<Vector2f> toRet;
    if(spikes == 0)
        return toRet;

    Vector2f center = (a + b) * 0.5f;
    Vector2f radii = (b - a).cwiseAbs() * 0.5f;
    float outerRadius = std::min(radii.x(), radii.y());
    float innerRadius = outerRadius * innerRatio;

    float step = std::numbers::pi_v<float> / static_cast<float>(spikes);
    float rot = std::numbers::pi_v<float> * 1.5f;
    for(unsigned i = 0; i < spikes; i++) {
        toRet.emplace_back(center + outerRadius * Vector2f{std::cos(rot), std::sin(rot)});
        rot += step;
        toRet.emplace_back(center + innerRadius * Vector2f{std::cos(rot), std::sin(rot)});
        rot += step;
    }
    return toRet;
}

std::array<Vector2f, 3> triangle_polygon(const Vector2f& a, const Vector2f& b) {
    Vector2f minP = a.cwiseMin(b);
    Vector2f maxP = a.cwiseMax(b);
    return {
        Vector2f{minP.x(), maxP.y()},
        Vector2f{(minP.x() + maxP.x()) * 0.5f, minP.y()},
        Vector2f{maxP.x(), maxP.y()}
    };
}
