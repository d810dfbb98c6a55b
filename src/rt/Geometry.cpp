#include <lightbox/rt/Geometry.hpp>

namespace lightbox {

std::optional<Float> intersect(const Ray &ray, const Circle &circle) {
    // d is unit length, so the quadratic reduces to t^2 + 2bt + c = 0
    const Vec2f shift = ray.o - circle.center;
    const Float b = shift.dot(ray.d);
    const Float c = shift.lengthSquared() - circle.radius * circle.radius;
    const Float discriminant = b * b - c;

    const auto accept = [&](Float t) -> std::optional<Float> {
        if (t < 0) return std::nullopt;
        if (ray.bounded() && t >= ray.maxLength) return std::nullopt;
        return t;
    };

    // an origin inside (or on) the circle always has exactly one exit ahead of it
    if (c <= 0) {
        return accept(-b + std::sqrt(std::max(discriminant, Float(0))));
    }

    if (std::abs(discriminant) <= TangentEpsilon * circle.radius * circle.radius) {
        return accept(-b);
    }

    if (discriminant < 0) {
        return std::nullopt;
    }

    const Float root = std::sqrt(discriminant);
    const Float tNear = -b - root;
    const Float tFar = -b + root;

    if (tNear >= 0) {
        return accept(tNear);
    }
    return accept(tFar);
}

std::vector<Float> linspace(Float a, Float b, int n) {
    std::vector<Float> result;
    if (n <= 0) {
        return result;
    }

    result.reserve(n);
    if (n == 1) {
        result.push_back(a);
        return result;
    }

    const Float step = (b - a) / Float(n - 1);
    for (int i = 0; i < n - 1; i++) {
        result.push_back(a + step * Float(i));
    }
    result.push_back(b);
    return result;
}

}
