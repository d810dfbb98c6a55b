#pragma once

#include <lightbox/core/math.hpp>
#include <lightbox/rt/Ray.hpp>

#include <optional>
#include <vector>

namespace lightbox {

struct Circle {
    Vec2f center;
    Float radius = 1;

    [[nodiscard]] bool contains(const Vec2f &p) const {
        return (p - center).lengthSquared() <= radius * radius;
    }
};

/// Discriminants within this fraction of radius^2 of zero count as a tangential hit.
constexpr Float TangentEpsilon = Float(1e-5);

/**
 * Distance along the ray to the first point where it meets the circle boundary.
 * Returns the smallest root t >= 0 of |o + t d - c|^2 = r^2 that also lies strictly
 * before the ray's maximum length. A ray starting inside the circle reports its exit.
 * Near-zero discriminants collapse to a single tangential root.
 */
std::optional<Float> intersect(const Ray &ray, const Circle &circle);

/// n evenly spaced samples from a to b, both included. A single sample yields a.
std::vector<Float> linspace(Float a, Float b, int n);

}
