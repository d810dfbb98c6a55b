#pragma once

#include <lightbox/rt/Objects.hpp>
#include <lightbox/rt/Ray.hpp>

#include <vector>

namespace lightbox {

/**
 * Sample rays cast by an emitter in its current state.
 * Isotropic emitters fan rays at 2pi k/N starting from angle 0.
 * Collimated emitters cast N parallel rays whose origins are spread evenly across the beam width,
 * perpendicular to the beam direction and centered on the emitter.
 * Spotlights fan rays evenly over [angle - halfAngle, angle + halfAngle]; a single ray points along angle.
 * Absorbers cast nothing.
 */
std::vector<Ray> generateRays(const SceneObject &object);

}
