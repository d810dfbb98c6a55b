#include <lightbox/rt/RayGenerator.hpp>
#include <lightbox/rt/Geometry.hpp>

namespace lightbox {

static std::vector<Ray> isotropicRays(const Vec2f &origin, const IsotropicEmitter &emitter) {
    std::vector<Ray> rays;
    if (emitter.rayCount <= 0) return rays;

    rays.reserve(emitter.rayCount);
    for (int k = 0; k < emitter.rayCount; k++) {
        const Float angle = TwoPi * Float(k) / Float(emitter.rayCount);
        rays.emplace_back(origin, direction(angle));
    }
    return rays;
}

static std::vector<Ray> collimatedRays(const Vec2f &origin, const CollimatedEmitter &emitter) {
    std::vector<Ray> rays;
    if (emitter.rayCount <= 0) return rays;

    const Vec2f d = direction(emitter.angle);
    const Vec2f across = perpendicular(d);
    const Float half = emitter.rayCount > 1 ? emitter.beamWidth / 2 : 0;

    rays.reserve(emitter.rayCount);
    for (Float offset: linspace(-half, +half, emitter.rayCount)) {
        rays.emplace_back(origin + offset * across, d);
    }
    return rays;
}

static std::vector<Ray> spotlightRays(const Vec2f &origin, const SpotlightEmitter &emitter) {
    std::vector<Ray> rays;
    if (emitter.rayCount <= 0) return rays;

    if (emitter.rayCount == 1) {
        rays.emplace_back(origin, direction(emitter.angle));
        return rays;
    }

    rays.reserve(emitter.rayCount);
    for (Float angle: linspace(emitter.angle - emitter.halfAngle, emitter.angle + emitter.halfAngle, emitter.rayCount)) {
        rays.emplace_back(origin, direction(angle));
    }
    return rays;
}

std::vector<Ray> generateRays(const SceneObject &object) {
    return std::visit(overloaded{
        [&](const IsotropicEmitter &e) { return isotropicRays(object.position, e); },
        [&](const CollimatedEmitter &e) { return collimatedRays(object.position, e); },
        [&](const SpotlightEmitter &e) { return spotlightRays(object.position, e); },
        [](const CircleAbsorber &) { return std::vector<Ray>(); },
    }, object.params);
}

}
