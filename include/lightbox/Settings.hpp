#pragma once

#include <lightbox/core/math.hpp>

namespace lightbox {

/// Tunables for newly created objects, editing actions and the trace pass.
struct Settings {
    int rayCount = 25;
    Float coneHalfAngle = radians(30);
    Float beamWidth = 100;
    Float direction = 0;

    Float circleRadius = 50;
    Float minRadius = 2;

    Float emitterPickRadius = 12;
    Float rotationStep = radians(15);
    Float resizeFactor = Float(1.1);

    /// Unbounded rays are clipped here. The viewer keeps it at the viewport diagonal.
    Float renderDistance = 2000;
};

}
