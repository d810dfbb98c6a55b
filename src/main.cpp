// lightbox viewer: SDL2 window with an OpenGL 3 context, Dear ImGui for everything drawn on top.
// The scene itself lives in lightbox::Engine; this file only owns the window and the frame loop.

#include <imgui.h>
#include <backends/imgui_impl_sdl2.h>
#include <backends/imgui_impl_opengl3.h>
#include <stdio.h>
#include <SDL.h>
#include <SDL_opengl.h>

void app();

namespace {

struct Viewer {
    SDL_Window *window = nullptr;
    SDL_GLContext context = nullptr;
    const char *glslVersion = nullptr;
    bool quit = false;
};

void requestContext(Viewer &viewer) {
#if defined(__APPLE__)
    viewer.glslVersion = "#version 150";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_FORWARD_COMPATIBLE_FLAG);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 2);
#else
    viewer.glslVersion = "#version 130";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
#endif
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
}

bool openViewer(Viewer &viewer) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        fprintf(stderr, "lightbox: SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    requestContext(viewer);

    const auto flags = SDL_WindowFlags(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    viewer.window = SDL_CreateWindow("lightbox", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 800, flags);
    if (!viewer.window) {
        fprintf(stderr, "lightbox: could not create window: %s\n", SDL_GetError());
        return false;
    }

    viewer.context = SDL_GL_CreateContext(viewer.window);
    if (!viewer.context) {
        fprintf(stderr, "lightbox: could not create OpenGL context: %s\n", SDL_GetError());
        return false;
    }
    SDL_GL_MakeCurrent(viewer.window, viewer.context);
    // one trace pass per displayed frame
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO &io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
    io.IniFilename = "lightbox.ini";
    ImGui::StyleColorsDark();

    ImGui_ImplSDL2_InitForOpenGL(viewer.window, viewer.context);
    ImGui_ImplOpenGL3_Init(viewer.glslVersion);
    return true;
}

void closeViewer(Viewer &viewer) {
    if (ImGui::GetCurrentContext()) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
    }

    if (viewer.context) SDL_GL_DeleteContext(viewer.context);
    if (viewer.window) SDL_DestroyWindow(viewer.window);
    SDL_Quit();
}

void pollEvents(Viewer &viewer) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        ImGui_ImplSDL2_ProcessEvent(&event);

        const bool closed = event.type == SDL_WINDOWEVENT &&
            event.window.event == SDL_WINDOWEVENT_CLOSE &&
            event.window.windowID == SDL_GetWindowID(viewer.window);
        if (event.type == SDL_QUIT || closed) {
            viewer.quit = true;
        }
    }
}

void frame(Viewer &viewer) {
    pollEvents(viewer);

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
    ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());

    app();

    ImGui::Render();
    const ImVec2 size = ImGui::GetIO().DisplaySize;
    glViewport(0, 0, int(size.x), int(size.y));
    glClearColor(0.05f, 0.05f, 0.07f, 1.f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    SDL_GL_SwapWindow(viewer.window);
}

}

int main(int, char **) {
    Viewer viewer;
    if (!openViewer(viewer)) {
        closeViewer(viewer);
        return 1;
    }

    while (!viewer.quit) {
        frame(viewer);
    }

    closeViewer(viewer);
    return 0;
}
