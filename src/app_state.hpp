#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "scene_state.hpp"
#include "renderer.hpp"
#include "cpu_renderer.hpp"

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// GL texture helper
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

    void ensure(int nw, int nh) {
        if (nw == w && nh == h && id != 0) return;
        if (id) glDeleteTextures(1, &id);
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, nw, nh, 0,
                     GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
        w = nw; h = nh;
    }

    void upload(const PixelBuffer& buf) {
        glBindTexture(GL_TEXTURE_2D, id);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGBA, GL_UNSIGNED_BYTE, buf.pixels.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// ---------------------------------------------------------------------------
// All mutable application state
// ---------------------------------------------------------------------------
struct AppState {
    SceneState  scene;
    CpuRenderer renderer;
    PixelBuffer pbuf;
    bool        dirty          = true;
    double      main_render_ms = 0.0;
    std::string render_error;          // last ConfigError from the renderer

    // Dialog flags
    bool        show_about     = false;
    bool        show_export    = false;

    // Export dialog state
    int         exp_res      = 1;      // 0=720p, 1=1080p, 2=custom
    int         exp_custom_w = 3840;
    int         exp_custom_h = 2160;
    int         exp_fmt      = 0;      // 0=PNG, 1=JXL, 2=PNG sequence
    int         exp_fps      = 60;
    float       exp_duration = 3.0f;
    bool        exp_done     = false;
    std::string exp_msg;
    std::string exp_saved_name;

    // Mask file input
    char        mask_input[512] = {};

    GlTex render_tex;
};
