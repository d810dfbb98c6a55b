#pragma once

#include <lightbox/Engine.hpp>

#include <optional>

struct Sandbox {
    Sandbox();
    void draw();

private:
    lightbox::Engine engine;

    /// Object being dragged with the left mouse button.
    std::optional<lightbox::ObjectId> dragged;
    lightbox::Vec2f dragOffset;

    std::optional<lightbox::ObjectId> selected;

    bool showRays = true;
    bool showHits = true;
    bool showImguiDemo = false;
    float rayOpacity = 0.6f;

    void drawViewport();
    void drawSceneWindow();
    void drawSettingsWindow();

    void handleViewportInput(const lightbox::Vec2f &cursor);
    void apply(lightbox::Action action, const lightbox::Vec2f &cursor);
};
