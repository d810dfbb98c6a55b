#include "Sandbox.hpp"

#include <imgui.h>

#include <iostream>

using namespace lightbox;

void app() {
    static Sandbox app;
    app.draw();
}

static const ImColor EmitterColor = ImColor(1.f, 0.5f, 0.f);
static const ImColor AbsorberColor = ImColor(0.85f, 0.85f, 0.85f);
static const ImColor PerfectAbsorberColor = ImColor(0.35f, 0.35f, 0.40f);
static const ImColor SelectionColor = ImColor(0.f, 1.f, 1.f);

static void makeShadowScene(Engine &engine) {
    auto &scene = engine.scene();
    scene.clear();
    scene.add(ObjectKind::Isotropic, {200, 300}, engine.settings());
    scene.add(ObjectKind::Circle, {450, 300}, engine.settings());
}

static void makeEclipseScene(Engine &engine) {
    auto &scene = engine.scene();
    const auto &settings = engine.settings();
    scene.clear();

    SceneObject spot = makeObject(ObjectKind::Spotlight, {100, 300}, settings);
    std::get<SpotlightEmitter>(spot.params).rayCount = 64;
    scene.add(spot);

    scene.add(ObjectKind::PerfectAbsorber, {400, 300}, settings);
    const ObjectId moon = scene.add(ObjectKind::Circle, {550, 220}, settings);
    scene.resize(moon, 0.4f, settings.minRadius);
}

static void makeBeamScene(Engine &engine) {
    auto &scene = engine.scene();
    const auto &settings = engine.settings();
    scene.clear();

    scene.add(ObjectKind::Collimated, {120, 300}, settings);
    for (int i = 0; i < 3; i++) {
        const ObjectId id = scene.add(ObjectKind::Circle, {Float(320 + 140 * i), Float(250 + 40 * i)}, settings);
        scene.resize(id, 0.5f, settings.minRadius);
    }
}

Sandbox::Sandbox() {
    makeShadowScene(engine);
}

void Sandbox::apply(Action action, const Vec2f &cursor) {
    const auto target = engine.handleAction(action, cursor);
    if (!target) return;

    if (action == Action::DeleteAtCursor) {
        if (selected == target) selected.reset();
        if (dragged == target) dragged.reset();
    } else {
        selected = target;
    }
}

void Sandbox::handleViewportInput(const Vec2f &cursor) {
    struct Binding {
        ImGuiKey key;
        Action action;
        bool repeat;
    };

    static const Binding bindings[] = {
        {ImGuiKey_C, Action::CreateCircle, false},
        {ImGuiKey_I, Action::CreateIsotropic, false},
        {ImGuiKey_L, Action::CreateCollimated, false},
        {ImGuiKey_S, Action::CreateSpotlight, false},
        {ImGuiKey_A, Action::CreateAbsorber, false},
        {ImGuiKey_D, Action::DeleteAtCursor, false},
        {ImGuiKey_Delete, Action::DeleteAtCursor, false},
        {ImGuiKey_E, Action::RotateCW, true},
        {ImGuiKey_Q, Action::RotateCCW, true},
        {ImGuiKey_Equal, Action::GrowAtCursor, true},
        {ImGuiKey_KeypadAdd, Action::GrowAtCursor, true},
        {ImGuiKey_Minus, Action::ShrinkAtCursor, true},
        {ImGuiKey_KeypadSubtract, Action::ShrinkAtCursor, true},
    };

    for (const auto &binding: bindings) {
        if (ImGui::IsKeyPressed(binding.key, binding.repeat)) {
            apply(binding.action, cursor);
        }
    }

    if (ImGui::IsKeyPressed(ImGuiKey_P, false)) {
        engine.describe(std::cout);
    }

    if (ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        dragged = engine.pick(cursor);
        selected = dragged;
        if (dragged) {
            dragOffset = engine.scene().find(*dragged)->position - cursor;
        }
    }
}

void Sandbox::drawViewport() {
    if (!ImGui::Begin("Viewport")) {
        ImGui::End();
        return;
    }

    const ImVec2 canvasSize = ImGui::GetContentRegionAvail();
    const ImVec2 shift = ImGui::GetCursorScreenPos();

    // keep unbounded rays just long enough to leave the canvas
    engine.setRenderDistance(Vec2f{canvasSize.x, canvasSize.y}.length());

    ImGui::InvisibleButton("canvas", ImVec2(std::max(canvasSize.x, 1.f), std::max(canvasSize.y, 1.f)));
    const bool hovered = ImGui::IsItemHovered();

    const ImVec2 mouse = ImGui::GetMousePos();
    const Vec2f cursor{mouse.x - shift.x, mouse.y - shift.y};

    // input is applied before the frame is traced
    if (hovered) {
        handleViewportInput(cursor);
    }
    if (dragged) {
        if (ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
            engine.scene().move(*dragged, cursor + dragOffset);
        } else {
            dragged.reset();
        }
    }

    const auto transform = [&](const Vec2f &p) {
        return ImVec2(p.x() + shift.x, p.y() + shift.y);
    };

    auto &drawList = *ImGui::GetWindowDrawList();
    drawList.PushClipRect(shift, ImVec2(shift.x + canvasSize.x, shift.y + canvasSize.y), true);

    const auto segments = engine.traceFrame();
    if (showRays) {
        const ImColor rayColor{1.f, 0.85f, 0.4f, rayOpacity};
        for (const auto &traced: segments) {
            drawList.AddLine(transform(traced.segment.start), transform(traced.segment.end), rayColor, 1.5f);
        }
    }

    for (const auto &object: engine.scene().objects()) {
        const ImVec2 center = transform(object.position);
        if (auto disc = object.circle()) {
            const bool perfect = std::get<CircleAbsorber>(object.params).perfect;
            drawList.AddCircleFilled(center, disc->radius, perfect ? PerfectAbsorberColor : AbsorberColor, 64);
        } else {
            drawList.AddCircleFilled(center, engine.settings().emitterPickRadius, EmitterColor);
            if (auto angle = object.angle()) {
                const Vec2f tip = object.position + 2 * engine.settings().emitterPickRadius * direction(*angle);
                drawList.AddLine(center, transform(tip), EmitterColor, 3);
            }
        }

        if (selected && *selected == object.id) {
            const Float radius = object.circle() ? object.circle()->radius : engine.settings().emitterPickRadius;
            drawList.AddCircle(center, radius + 3, SelectionColor, 64, 2);
        }
    }

    if (showHits) {
        for (const auto &traced: segments) {
            if (traced.absorber) {
                drawList.AddCircleFilled(transform(traced.segment.end), 2.5f, ImColor(1.f, 0.f, 0.f));
            }
        }
    }

    drawList.PopClipRect();

    if (hovered) {
        ImGui::SetTooltip("(%.0f, %.0f) %s", cursor.x(), cursor.y(), engine.describeAt(cursor));
    }

    ImGui::End();
}

void Sandbox::drawSceneWindow() {
    if (ImGui::Begin("Scene")) {
        ImGui::SeparatorText("Help");
        ImGui::TextWrapped(
            "2-D light transport sandbox:\n"
            "Hover the viewport and press C (circle), A (perfect absorber), I (isotropic emitter), "
            "L (collimated emitter) or S (spotlight) to place objects at the cursor. "
            "D deletes, E/Q rotate directional emitters, +/- resize absorbers, P prints the scene. "
            "Drag objects with the left mouse button."
        );

        ImGui::SeparatorText("Display");
        ImGui::Checkbox("Show Rays", &showRays);
        ImGui::SameLine();
        ImGui::Checkbox("Show Hits", &showHits);
        ImGui::DragFloat("Ray Opacity", &rayOpacity, 0.01f, 0, 1);

        ImGui::SeparatorText("Objects");
        const auto objects = engine.debugDump();
        ImGui::Text("%zu objects", objects.size());

        for (const auto &object: objects) {
            ImGui::PushID(int(object.id));
            const bool isSelected = selected && *selected == object.id;
            if (ImGui::Selectable(lightbox::kindName(object.kind()), isSelected)) {
                selected = object.id;
            }
            ImGui::SameLine(160);
            ImGui::Text("#%u (%.0f, %.0f)", object.id, object.position.x(), object.position.y());
            ImGui::PopID();
        }

        if (selected) {
            if (const SceneObject *object = engine.scene().find(*selected)) {
                ImGui::SeparatorText("Selection");

                Vec2f position = object->position;
                if (ImGui::DragFloat2("Position", &position[0], 1.f)) {
                    engine.scene().move(object->id, position);
                }

                if (object->isEmitter()) {
                    int rayCount = object->rayCount();
                    if (ImGui::SliderInt("#Rays", &rayCount, 0, 512)) {
                        engine.scene().setRayCount(object->id, rayCount);
                    }
                }

                if (auto angle = object->angle()) {
                    float deg = degrees(*angle);
                    if (ImGui::DragFloat("Angle", &deg, 0.5f, -720, 720, "%.1f deg")) {
                        engine.scene().rotate(object->id, radians(deg) - *angle);
                    }
                }

                if (auto disc = object->circle()) {
                    float radius = disc->radius;
                    if (ImGui::DragFloat("Radius", &radius, 0.5f, engine.settings().minRadius, 1000)) {
                        engine.scene().resize(object->id, radius / disc->radius, engine.settings().minRadius);
                    }
                }

                if (ImGui::Button("Delete")) {
                    engine.scene().remove(*selected);
                    selected.reset();
                }
            } else {
                selected.reset();
            }
        }
    }
    ImGui::End();
}

void Sandbox::drawSettingsWindow() {
    if (ImGui::Begin("Settings")) {
        auto &settings = engine.settings();

        ImGui::SeparatorText("New Emitters");
        ImGui::SliderInt("#Rays", &settings.rayCount, 0, 512);

        float halfAngle = degrees(settings.coneHalfAngle);
        if (ImGui::DragFloat("Cone Half-Angle", &halfAngle, 0.5f, 0, 180, "%.1f deg")) {
            settings.coneHalfAngle = radians(halfAngle);
        }

        float angle = degrees(settings.direction);
        if (ImGui::DragFloat("Direction", &angle, 0.5f, 0, 360, "%.1f deg")) {
            settings.direction = radians(angle);
        }

        ImGui::DragFloat("Beam Width", &settings.beamWidth, 0.5f, 0, 1000);

        ImGui::SeparatorText("New Absorbers");
        ImGui::DragFloat("Radius", &settings.circleRadius, 0.5f, settings.minRadius, 1000);

        ImGui::SeparatorText("Editing");
        float step = degrees(settings.rotationStep);
        if (ImGui::DragFloat("Rotation Step", &step, 0.1f, 0.1f, 180, "%.1f deg")) {
            settings.rotationStep = radians(step);
        }
        ImGui::DragFloat("Resize Factor", &settings.resizeFactor, 0.01f, 1.01f, 4);
        ImGui::DragFloat("Pick Radius", &settings.emitterPickRadius, 0.1f, 1, 100);

        ImGui::SeparatorText("Tracing");
        ImGui::Text("render distance = %.0f", settings.renderDistance);
    }
    ImGui::End();
}

void Sandbox::draw() {
    if (ImGui::BeginMainMenuBar()) {
        if (ImGui::BeginMenu("Scenes")) {
            if (ImGui::MenuItem("New scene")) {
                engine.scene().clear();
                selected.reset();
                dragged.reset();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Shadow")) makeShadowScene(engine);
            if (ImGui::MenuItem("Eclipse")) makeEclipseScene(engine);
            if (ImGui::MenuItem("Beam")) makeBeamScene(engine);
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("Debug")) {
            if (ImGui::MenuItem("Print scene", "P")) engine.describe(std::cout);
            ImGui::MenuItem("ImGui demo", nullptr, &showImguiDemo);
            ImGui::EndMenu();
        }

        ImGui::EndMainMenuBar();
    }

    if (showImguiDemo) ImGui::ShowDemoWindow(&showImguiDemo);

    drawViewport();
    drawSceneWindow();
    drawSettingsWindow();
}
