#pragma once

#include <lightbox/Settings.hpp>
#include <lightbox/rt/Scene.hpp>
#include <lightbox/rt/Tracer.hpp>

#include <optional>
#include <ostream>
#include <vector>

namespace lightbox {

enum class Action {
    CreateCircle,
    CreateIsotropic,
    CreateCollimated,
    CreateSpotlight,
    CreateAbsorber,
    DeleteAtCursor,
    RotateCW,
    RotateCCW,
    GrowAtCursor,
    ShrinkAtCursor,
};

const char *actionName(Action action);

/**
 * Entry point for the presentation layer.
 * Input is applied through handleAction as it arrives; traceFrame then retraces every emitter
 * against the scene as it stands. Nothing is cached between frames.
 */
class Engine {
public:
    Engine() = default;
    explicit Engine(const Settings &settings) : m_settings(settings) {}

    /**
     * Applies one editing action at the cursor.
     * Returns the id of the object created, removed, rotated or resized, or nothing if the
     * action had no target (e.g. nothing under the cursor, or rotating an absorber).
     */
    std::optional<ObjectId> handleAction(Action action, const Vec2f &cursor);

    [[nodiscard]] std::vector<TracedSegment> traceFrame() const;

    /// Copy of every object in creation order.
    [[nodiscard]] std::vector<SceneObject> debugDump() const;

    /// Kind name of the object under the cursor, or "None".
    [[nodiscard]] const char *describeAt(const Vec2f &cursor) const;

    void describe(std::ostream &stream) const;

    [[nodiscard]] std::optional<ObjectId> pick(const Vec2f &cursor) const;

    void setRenderDistance(Float distance) { m_settings.renderDistance = distance; }

    [[nodiscard]] Scene &scene() { return m_scene; }
    [[nodiscard]] const Scene &scene() const { return m_scene; }

    [[nodiscard]] Settings &settings() { return m_settings; }
    [[nodiscard]] const Settings &settings() const { return m_settings; }

private:
    std::optional<ObjectId> create(ObjectKind kind, const Vec2f &cursor);

    Scene m_scene;
    Settings m_settings;
};

}
