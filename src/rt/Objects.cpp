#include <lightbox/rt/Objects.hpp>

#include <string>

namespace lightbox {

InvalidKind::InvalidKind(int kind)
: std::invalid_argument("unrecognized object kind " + std::to_string(kind)), m_kind(kind) {}

const char *kindName(ObjectKind kind) {
    switch (kind) {
    case ObjectKind::Isotropic: return "Isotropic";
    case ObjectKind::Collimated: return "Collimated";
    case ObjectKind::Spotlight: return "Spotlight";
    case ObjectKind::Circle: return "Circle";
    case ObjectKind::PerfectAbsorber: return "PerfectAbsorber";
    }
    return "Unknown";
}

SceneObject makeObject(ObjectKind kind, const Vec2f &position, const Settings &settings) {
    SceneObject object;
    object.position = position;

    switch (kind) {
    case ObjectKind::Isotropic:
        object.params = IsotropicEmitter{settings.rayCount};
        break;
    case ObjectKind::Collimated:
        object.params = CollimatedEmitter{settings.rayCount, wrapAngle(settings.direction), settings.beamWidth};
        break;
    case ObjectKind::Spotlight:
        object.params = SpotlightEmitter{settings.rayCount, wrapAngle(settings.direction), settings.coneHalfAngle};
        break;
    case ObjectKind::Circle:
        object.params = CircleAbsorber{std::max(settings.circleRadius, settings.minRadius), false};
        break;
    case ObjectKind::PerfectAbsorber:
        object.params = CircleAbsorber{std::max(settings.circleRadius, settings.minRadius), true};
        break;
    default:
        throw InvalidKind(static_cast<int>(kind));
    }

    return object;
}

ObjectKind SceneObject::kind() const {
    return std::visit(overloaded{
        [](const IsotropicEmitter &) { return ObjectKind::Isotropic; },
        [](const CollimatedEmitter &) { return ObjectKind::Collimated; },
        [](const SpotlightEmitter &) { return ObjectKind::Spotlight; },
        [](const CircleAbsorber &a) { return a.perfect ? ObjectKind::PerfectAbsorber : ObjectKind::Circle; },
    }, params);
}

bool SceneObject::isEmitter() const {
    return !isAbsorber();
}

bool SceneObject::isAbsorber() const {
    return std::holds_alternative<CircleAbsorber>(params);
}

bool SceneObject::isDirectional() const {
    return angle().has_value();
}

int SceneObject::rayCount() const {
    return std::visit(overloaded{
        [](const IsotropicEmitter &e) { return e.rayCount; },
        [](const CollimatedEmitter &e) { return e.rayCount; },
        [](const SpotlightEmitter &e) { return e.rayCount; },
        [](const CircleAbsorber &) { return 0; },
    }, params);
}

std::optional<Float> SceneObject::angle() const {
    return std::visit(overloaded{
        [](const CollimatedEmitter &e) -> std::optional<Float> { return e.angle; },
        [](const SpotlightEmitter &e) -> std::optional<Float> { return e.angle; },
        [](const auto &) -> std::optional<Float> { return std::nullopt; },
    }, params);
}

std::optional<Circle> SceneObject::circle() const {
    if (auto absorber = std::get_if<CircleAbsorber>(&params)) {
        return Circle{position, absorber->radius};
    }
    return std::nullopt;
}

bool SceneObject::pickTest(const Vec2f &p, Float emitterPickRadius) const {
    if (auto disc = circle()) {
        return disc->contains(p);
    }
    return (p - position).lengthSquared() <= emitterPickRadius * emitterPickRadius;
}

void SceneObject::describe(std::ostream &stream) const {
    stream << kindName(kind()) << "#" << id
           << " pos=(" << position.x() << ", " << position.y() << ")";

    std::visit(overloaded{
        [&](const IsotropicEmitter &e) {
            stream << " rays=" << e.rayCount;
        },
        [&](const CollimatedEmitter &e) {
            stream << " rays=" << e.rayCount
                   << " angle=" << degrees(e.angle) << "deg"
                   << " width=" << e.beamWidth;
        },
        [&](const SpotlightEmitter &e) {
            stream << " rays=" << e.rayCount
                   << " angle=" << degrees(e.angle) << "deg"
                   << " halfAngle=" << degrees(e.halfAngle) << "deg";
        },
        [&](const CircleAbsorber &a) {
            stream << " radius=" << a.radius;
        },
    }, params);
}

}
