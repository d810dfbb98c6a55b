#pragma once

#include <lightbox/rt/Objects.hpp>
#include <lightbox/rt/Ray.hpp>

#include <optional>
#include <vector>

namespace lightbox {

class Scene;

struct Segment {
    Vec2f start;
    Vec2f end;

    [[nodiscard]] Float length() const {
        return (end - start).length();
    }
};

struct TracedSegment {
    ObjectId emitter = 0;
    int rayIndex = 0;
    Segment segment;
    /// Absorber that terminated the ray, if it did not run out to the render boundary.
    std::optional<ObjectId> absorber;
};

/// Nearest absorber hit along ray. Ties go to the absorber listed first.
Intersection intersect(const Ray &ray, const std::vector<const SceneObject *> &absorbers);

/// Visible part of ray: up to the nearest hit, otherwise up to renderDistance (or the ray's own length).
Segment clip(const Ray &ray, const Intersection &isect, Float renderDistance);

/// Generates and traces the rays of every emitter in the scene, in creation order.
std::vector<TracedSegment> trace(const Scene &scene, Float renderDistance);

}
