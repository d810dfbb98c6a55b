#include <lightbox/rt/Scene.hpp>

#include <algorithm>
#include <stdexcept>

namespace lightbox {

ObjectId Scene::add(ObjectKind kind, const Vec2f &position, const Settings &settings) {
    return add(makeObject(kind, position, settings));
}

ObjectId Scene::add(SceneObject object) {
    if (auto absorber = std::get_if<CircleAbsorber>(&object.params); absorber && !(absorber->radius > 0)) {
        throw std::invalid_argument("absorber radius must be positive");
    }

    object.id = m_nextId++;
    object.order = m_nextOrder++;
    m_objects.push_back(object);
    return object.id;
}

void Scene::move(ObjectId id, const Vec2f &position) {
    if (auto object = findMutable(id)) {
        object->position = position;
    }
}

void Scene::rotate(ObjectId id, Float delta) {
    auto object = findMutable(id);
    if (!object) return;

    std::visit(overloaded{
        [&](CollimatedEmitter &e) { e.angle = wrapAngle(e.angle + delta); },
        [&](SpotlightEmitter &e) { e.angle = wrapAngle(e.angle + delta); },
        [](auto &) {},
    }, object->params);
}

void Scene::resize(ObjectId id, Float factor, Float minRadius) {
    auto object = findMutable(id);
    if (!object || factor <= 0) return;

    if (auto absorber = std::get_if<CircleAbsorber>(&object->params)) {
        absorber->radius = std::max(absorber->radius * factor, minRadius);
    }
}

void Scene::setRayCount(ObjectId id, int rayCount) {
    auto object = findMutable(id);
    if (!object) return;

    rayCount = std::max(rayCount, 0);
    std::visit(overloaded{
        [&](IsotropicEmitter &e) { e.rayCount = rayCount; },
        [&](CollimatedEmitter &e) { e.rayCount = rayCount; },
        [&](SpotlightEmitter &e) { e.rayCount = rayCount; },
        [](CircleAbsorber &) {},
    }, object->params);
}

bool Scene::remove(ObjectId id) {
    auto it = std::find_if(m_objects.begin(), m_objects.end(), [&](const SceneObject &object) {
        return object.id == id;
    });
    if (it == m_objects.end()) {
        return false;
    }
    m_objects.erase(it);
    return true;
}

std::optional<ObjectId> Scene::pick(const Vec2f &position, Float emitterPickRadius) const {
    // objects are stored in creation order, so the last match is the newest one
    for (auto it = m_objects.rbegin(); it != m_objects.rend(); ++it) {
        if (it->pickTest(position, emitterPickRadius)) {
            return it->id;
        }
    }
    return std::nullopt;
}

std::optional<ObjectId> Scene::removeAt(const Vec2f &position, Float emitterPickRadius) {
    const auto id = pick(position, emitterPickRadius);
    if (id) {
        remove(*id);
    }
    return id;
}

void Scene::clear() {
    m_objects.clear();
}

const SceneObject *Scene::find(ObjectId id) const {
    for (const auto &object: m_objects) {
        if (object.id == id) return &object;
    }
    return nullptr;
}

SceneObject *Scene::findMutable(ObjectId id) {
    return const_cast<SceneObject *>(static_cast<const Scene &>(*this).find(id));
}

void Scene::describe(std::ostream &stream) const {
    stream << "scene[" << m_objects.size() << " objects]" << std::endl;
    for (size_t i = 0; i < m_objects.size(); i++) {
        stream << "  " << i << ": ";
        m_objects[i].describe(stream);
        stream << std::endl;
    }
}

}
