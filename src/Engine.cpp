#include <lightbox/Engine.hpp>

namespace lightbox {

const char *actionName(Action action) {
    switch (action) {
    case Action::CreateCircle: return "CreateCircle";
    case Action::CreateIsotropic: return "CreateIsotropic";
    case Action::CreateCollimated: return "CreateCollimated";
    case Action::CreateSpotlight: return "CreateSpotlight";
    case Action::CreateAbsorber: return "CreateAbsorber";
    case Action::DeleteAtCursor: return "DeleteAtCursor";
    case Action::RotateCW: return "RotateCW";
    case Action::RotateCCW: return "RotateCCW";
    case Action::GrowAtCursor: return "GrowAtCursor";
    case Action::ShrinkAtCursor: return "ShrinkAtCursor";
    }
    return "Unknown";
}

std::optional<ObjectId> Engine::create(ObjectKind kind, const Vec2f &cursor) {
    return m_scene.add(kind, cursor, m_settings);
}

std::optional<ObjectId> Engine::handleAction(Action action, const Vec2f &cursor) {
    switch (action) {
    case Action::CreateCircle: return create(ObjectKind::Circle, cursor);
    case Action::CreateIsotropic: return create(ObjectKind::Isotropic, cursor);
    case Action::CreateCollimated: return create(ObjectKind::Collimated, cursor);
    case Action::CreateSpotlight: return create(ObjectKind::Spotlight, cursor);
    case Action::CreateAbsorber: return create(ObjectKind::PerfectAbsorber, cursor);
    case Action::DeleteAtCursor:
        return m_scene.removeAt(cursor, m_settings.emitterPickRadius);
    case Action::RotateCW:
    case Action::RotateCCW:
    case Action::GrowAtCursor:
    case Action::ShrinkAtCursor:
        break;
    }

    const auto target = pick(cursor);
    if (!target) return std::nullopt;

    const SceneObject *object = m_scene.find(*target);
    switch (action) {
    case Action::RotateCW:
    case Action::RotateCCW: {
        if (!object->isDirectional()) return std::nullopt;
        const Float step = action == Action::RotateCW ? m_settings.rotationStep : -m_settings.rotationStep;
        m_scene.rotate(*target, step);
        return target;
    }
    case Action::GrowAtCursor:
    case Action::ShrinkAtCursor: {
        if (!object->isAbsorber() || m_settings.resizeFactor <= 0) return std::nullopt;
        const Float factor = action == Action::GrowAtCursor ? m_settings.resizeFactor : 1 / m_settings.resizeFactor;
        m_scene.resize(*target, factor, m_settings.minRadius);
        return target;
    }
    case Action::CreateCircle:
    case Action::CreateIsotropic:
    case Action::CreateCollimated:
    case Action::CreateSpotlight:
    case Action::CreateAbsorber:
    case Action::DeleteAtCursor:
        break;
    }
    return std::nullopt;
}

std::vector<TracedSegment> Engine::traceFrame() const {
    return trace(m_scene, m_settings.renderDistance);
}

std::vector<SceneObject> Engine::debugDump() const {
    return m_scene.objects();
}

const char *Engine::describeAt(const Vec2f &cursor) const {
    const auto id = pick(cursor);
    if (!id) return "None";
    return kindName(m_scene.find(*id)->kind());
}

void Engine::describe(std::ostream &stream) const {
    m_scene.describe(stream);
}

std::optional<ObjectId> Engine::pick(const Vec2f &cursor) const {
    return m_scene.pick(cursor, m_settings.emitterPickRadius);
}

}
