#include <lightbox/rt/Tracer.hpp>
#include <lightbox/rt/RayGenerator.hpp>
#include <lightbox/rt/Scene.hpp>

namespace lightbox {

Intersection intersect(const Ray &ray, const std::vector<const SceneObject *> &absorbers) {
    Intersection isect;
    for (size_t i = 0; i < absorbers.size(); i++) {
        const auto disc = absorbers[i]->circle();
        if (!disc) continue;

        const auto t = intersect(ray, *disc);
        if (!t || *t >= isect.t) continue;

        isect.t = *t;
        isect.absorber = int(i);
    }
    return isect;
}

Segment clip(const Ray &ray, const Intersection &isect, Float renderDistance) {
    Float t = isect.valid() ? isect.t : std::min(renderDistance, ray.maxLength);
    return {ray.o, ray(t)};
}

std::vector<TracedSegment> trace(const Scene &scene, Float renderDistance) {
    std::vector<const SceneObject *> absorbers;
    for (const auto &object: scene.objects()) {
        if (object.isAbsorber()) {
            absorbers.push_back(&object);
        }
    }

    std::vector<TracedSegment> segments;
    for (const auto &object: scene.objects()) {
        if (!object.isEmitter()) continue;

        const auto rays = generateRays(object);
        for (size_t i = 0; i < rays.size(); i++) {
            const auto isect = intersect(rays[i], absorbers);

            TracedSegment traced;
            traced.emitter = object.id;
            traced.rayIndex = int(i);
            traced.segment = clip(rays[i], isect, renderDistance);
            if (isect.valid()) {
                traced.absorber = absorbers[isect.absorber]->id;
            }
            segments.push_back(traced);
        }
    }
    return segments;
}

}
