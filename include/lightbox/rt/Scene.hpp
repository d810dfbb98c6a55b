#pragma once

#include <lightbox/rt/Objects.hpp>
#include <lightbox/Settings.hpp>

#include <optional>
#include <ostream>
#include <vector>

namespace lightbox {

/**
 * Owns every emitter and absorber, kept in creation order.
 * Ids are handed out monotonically and never reused. Operations that target a missing
 * id or an empty spot are no-ops, since they are driven by cursor input that may miss.
 */
class Scene {
public:
    /// Inserts an object of the given kind at position and returns its id. Throws InvalidKind.
    ObjectId add(ObjectKind kind, const Vec2f &position, const Settings &settings);

    /// Inserts a fully specified object; its id and order are reassigned.
    /// Throws std::invalid_argument for an absorber whose radius is not positive.
    ObjectId add(SceneObject object);

    void move(ObjectId id, const Vec2f &position);

    /// Turns a directional emitter by delta radians. Other objects are left untouched.
    void rotate(ObjectId id, Float delta);

    /// Scales an absorber's radius by factor, never going below minRadius.
    void resize(ObjectId id, Float factor, Float minRadius);

    void setRayCount(ObjectId id, int rayCount);

    bool remove(ObjectId id);

    /// Most recently created object whose pick region contains position.
    [[nodiscard]] std::optional<ObjectId> pick(const Vec2f &position, Float emitterPickRadius) const;

    std::optional<ObjectId> removeAt(const Vec2f &position, Float emitterPickRadius);

    void clear();

    [[nodiscard]] const SceneObject *find(ObjectId id) const;

    [[nodiscard]] const std::vector<SceneObject> &objects() const { return m_objects; }

    [[nodiscard]] size_t size() const { return m_objects.size(); }

    [[nodiscard]] bool empty() const { return m_objects.empty(); }

    void describe(std::ostream &stream) const;

private:
    SceneObject *findMutable(ObjectId id);

    std::vector<SceneObject> m_objects;
    ObjectId m_nextId{1};
    uint64_t m_nextOrder{0};
};

}
