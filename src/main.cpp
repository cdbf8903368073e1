#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "config_error.hpp"
#include "scene_config.hpp"
#include "ui_panels.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    const char* config_path = argc > 1 ? argv[1] : "gradient_dither.toml";
    const SceneConfigResult loaded = load_scene_config_from_file(config_path);
    if (loaded.loaded_file)
        fprintf(stderr, "[config] loaded '%s'\n", config_path);
    for (const std::string& warning : loaded.warnings)
        fprintf(stderr, "[config] %s\n", warning.c_str());

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(
        "Gradient Dither",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1280, 720,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
    );
    if (!window) {
        fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        fprintf(stderr, "SDL_GL_CreateContext error: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    // Owns GL textures; must go before the context is destroyed.
    auto app = std::make_unique<AppState>();
    app->scene = loaded.config.scene;
    std::snprintf(app->mask_input, sizeof(app->mask_input), "%s", app->scene.mask_path.c_str());
    app->exp_fps      = loaded.config.sequence.fps;
    app->exp_duration = static_cast<float>(loaded.config.sequence.duration);

    bool running = true;
    while (running) {
        // Animation needs a frame per vsync; when paused, block until an
        // event arrives or 50 ms elapse.
        SDL_Event event;
        if (!app->scene.playing && SDL_WaitEventTimeout(&event, 50)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        int win_w, win_h;
        SDL_GetWindowSize(window, &win_w, &win_h);
        const float fw       = static_cast<float>(win_w);
        const float fh       = static_cast<float>(win_h);
        const float menu_h   = ImGui::GetFrameHeight();
        const float render_x = PANEL_WIDTH;
        const float render_y = menu_h;
        const float render_w = fw - PANEL_WIDTH;
        const float render_h = fh - menu_h - STATUS_HEIGHT;

        if (app->scene.playing) {
            advance_rotation(app->scene);
            app->dirty = true;
        }

        // Frame render
        if (app->dirty) {
            try {
                app->renderer.render(app->scene, app->scene.rotation, app->pbuf);
                app->main_render_ms = app->renderer.last_render_ms;
                app->render_tex.ensure(app->pbuf.width, app->pbuf.height);
                app->render_tex.upload(app->pbuf);
                app->render_error.clear();
            } catch (const ConfigError& ex) {
                app->render_error = ex.what();
            }
            app->dirty = false;
        }

        // -------------------------------------------------------------------
        // Menu bar
        // -------------------------------------------------------------------
        if (ImGui::BeginMainMenuBar()) {
            if (ImGui::BeginMenu("File")) {
                if (ImGui::MenuItem("Export", "Ctrl+S")) {
                    app->show_export = true;
                    app->exp_done    = false;
                    app->exp_msg.clear();
                }
                ImGui::Separator();
                if (ImGui::MenuItem("Exit")) running = false;
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("View")) {
                if (ImGui::MenuItem("Play", "Space", app->scene.playing))
                    app->scene.playing = !app->scene.playing;
                if (ImGui::MenuItem("Reset Rotation")) {
                    app->scene.rotation = 0.0;
                    app->dirty = true;
                }
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Help")) {
                if (ImGui::MenuItem("About", "F1")) app->show_about = true;
                ImGui::EndMenu();
            }
            ImGui::EndMainMenuBar();
        }

        // -------------------------------------------------------------------
        // Global keyboard shortcuts
        // -------------------------------------------------------------------
        if (ImGui::IsKeyPressed(ImGuiKey_S) && io.KeyCtrl) {
            app->show_export = true;
            app->exp_done    = false;
            app->exp_msg.clear();
        }
        if (ImGui::IsKeyPressed(ImGuiKey_F1))
            app->show_about = true;
        if (!io.WantTextInput && ImGui::IsKeyPressed(ImGuiKey_Space, false))
            app->scene.playing = !app->scene.playing;

        draw_side_panel(*app, io, menu_h, fh);

        // -------------------------------------------------------------------
        // Render area: frame scaled to fit, centered
        // -------------------------------------------------------------------
        ImGui::SetNextWindowPos(ImVec2(render_x, render_y));
        ImGui::SetNextWindowSize(ImVec2(render_w, render_h));
        ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
        ImGui::Begin("##render", nullptr,
            ImGuiWindowFlags_NoTitleBar            |
            ImGuiWindowFlags_NoResize              |
            ImGuiWindowFlags_NoMove                |
            ImGuiWindowFlags_NoBringToFrontOnFocus |
            ImGuiWindowFlags_NoScrollbar);
        ImGui::PopStyleVar();

        if (app->render_tex.id && render_w > 0.0f && render_h > 0.0f) {
            const float tw    = static_cast<float>(app->render_tex.w);
            const float th    = static_cast<float>(app->render_tex.h);
            const float scale = std::min(render_w / tw, render_h / th);
            const ImVec2 size(tw * scale, th * scale);
            ImGui::SetCursorPos(ImVec2((render_w - size.x) * 0.5f, (render_h - size.y) * 0.5f));
            ImGui::Image(app->render_tex.imgui_id(), size);
        }

        ImGui::End();  // ##render

        draw_status_bar(*app, fw, fh);
        draw_export_dialog(*app);
        draw_about_dialog(*app);

        // -------------------------------------------------------------------
        // Render
        // -------------------------------------------------------------------
        ImGui::Render();
        glViewport(0, 0, win_w, win_h);
        glClearColor(0.08f, 0.08f, 0.08f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    app.reset();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
