#pragma once

#include <lightbox/core/math.hpp>
#include <limits>

namespace lightbox {

struct Ray {
    Ray() = default;

    /// The direction is normalized on construction.
    Ray(const Vec2f &origin, const Vec2f &direction, Float maxLength = std::numeric_limits<Float>::infinity())
    : o(origin), d(normalize(direction)), maxLength(maxLength) {}

    Vec2f o;
    Vec2f d;
    Float maxLength = std::numeric_limits<Float>::infinity();

    Vec2f operator()(Float t) const {
        return o + t * d;
    }

    [[nodiscard]] bool bounded() const {
        return !std::isinf(maxLength);
    }
};

/// Closest hit found so far while walking the absorbers of a scene.
struct Intersection {
    Float t = std::numeric_limits<Float>::infinity();
    int absorber = -1;

    [[nodiscard]] bool valid() const {
        return !std::isinf(t);
    }
};

}
