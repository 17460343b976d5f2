#pragma once
#include "SharedTypes.hpp"
#include <include/core/SkColor.h>
#include <include/core/SkPoint.h>

inline SkPoint convert_vec2(const Vector2f& v) {
    return SkPoint::Make(v.x(), v.y());
}

inline SkColor4f convert_vec4(const Vector4f& v) {
    return SkColor4f{v.x(), v.y(), v.z(), v.w()};
}
