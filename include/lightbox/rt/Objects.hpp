#pragma once

#include <lightbox/core/math.hpp>
#include <lightbox/rt/Geometry.hpp>
#include <lightbox/Settings.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <variant>

namespace lightbox {

using ObjectId = uint32_t;

enum class ObjectKind {
    Isotropic,
    Collimated,
    Spotlight,
    Circle,
    PerfectAbsorber,
};

/// Raised when asked to build an object of a kind that does not exist.
class InvalidKind : public std::invalid_argument {
public:
    explicit InvalidKind(int kind);

    [[nodiscard]] int kind() const { return m_kind; }

private:
    int m_kind;
};

struct IsotropicEmitter {
    int rayCount = 0;
};

struct CollimatedEmitter {
    int rayCount = 0;
    Float angle = 0;
    Float beamWidth = 0;
};

struct SpotlightEmitter {
    int rayCount = 0;
    Float angle = 0;
    Float halfAngle = 0;
};

struct CircleAbsorber {
    Float radius = 1;
    bool perfect = false;
};

using ObjectParams = std::variant<IsotropicEmitter, CollimatedEmitter, SpotlightEmitter, CircleAbsorber>;

struct SceneObject {
    ObjectId id = 0;
    /// Monotonic insertion stamp, used for draw order and pick tie-breaks.
    uint64_t order = 0;
    Vec2f position;
    ObjectParams params;

    /// Kind implied by params; a perfect CircleAbsorber is a PerfectAbsorber.
    [[nodiscard]] ObjectKind kind() const;

    [[nodiscard]] bool isEmitter() const;
    [[nodiscard]] bool isAbsorber() const;
    [[nodiscard]] bool isDirectional() const;

    /// Number of rays this object casts per frame (0 for absorbers).
    [[nodiscard]] int rayCount() const;

    /// Direction angle of directional emitters, or nothing.
    [[nodiscard]] std::optional<Float> angle() const;

    /// Occluding disc of absorbers, or nothing.
    [[nodiscard]] std::optional<Circle> circle() const;

    /// Whether p falls inside this object's pick region.
    [[nodiscard]] bool pickTest(const Vec2f &p, Float emitterPickRadius) const;

    void describe(std::ostream &stream) const;
};

const char *kindName(ObjectKind kind);

/// Builds an object of the requested kind at position with parameters from settings.
SceneObject makeObject(ObjectKind kind, const Vec2f &position, const Settings &settings);

/// Overload helper for std::visit.
template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}
