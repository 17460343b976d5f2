#pragma once
#include "SharedTypes.hpp"
#include "DrawingObjects/DrawingObject.hpp"
#include <array>
#include <optional>
#include <vector>

#define ARROW_HEAD_MAX_LENGTH 20.0f
#define ARROW_HEAD_LENGTH_RATIO (1.0f / 3.0f)
#define ARROW_HEAD_WIDTH_RATIO 0.6f
#define STAR_DEFAULT_SPIKES 5
#define STAR_INNER_RADIUS_RATIO 0.5f

// Distance from p to the closed segment [a, b]. A zero length segment is treated as the point a.
float distance_to_line_segment(const Vector2f& p, const Vector2f& a, const Vector2f& b);

// Smallest distance from p to the polyline through pts. Single point polylines measure to that point.
std::optional<float> distance_to_polyline(const Vector2f& p, const std::vector<Vector2f>& pts);

// Zero rectangle when pts is empty
DrawingBounds bounds_of_points(const std::vector<Vector2f>& pts);

// Normalized rectangle spanning both anchors, grown by padding on every side
DrawingBounds normalized_anchor_bounds(const Vector2f& a, const Vector2f& b, float padding = 0.0f);

struct ArrowHead {
    float length;
    float halfWidth;
    std::array<Vector2f, 3> p; // tip first
};

// No arrowhead for a zero length shaft
std::optional<ArrowHead> arrow_head_triangle(const Vector2f& start, const Vector2f& end);

// Alternating outer/inner vertices centered in the anchors' box, first spike pointing up
std::vector<Vector2f> star_polygon(const Vector2f& a, const Vector2f& b, unsigned spikes = STAR_DEFAULT_SPIKES, float innerRatio = STAR_INNER_RADIUS_RATIO);

// Bottom left, top middle, bottom right of the anchors' box
std::array<Vector2f, 3> triangle_polygon(const Vector2f& a, const Vector2f& b);
