#pragma once

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "engine.hpp"
#include "pixel_buffer.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GL texture holding the engine framebuffer. The framebuffer may be larger
// or smaller than the render region (dpr, render scale), so it is sampled
// with linear filtering.
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

    void upload(const PixelBuffer& buf) {
        if (buf.empty()) return;
        if (buf.width != w || buf.height != h || id == 0) {
            if (id) glDeleteTextures(1, &id);
            glGenTextures(1, &id);
            glBindTexture(GL_TEXTURE_2D, id);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
            glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, buf.width, buf.height, 0,
                         GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
            w = buf.width;
            h = buf.height;
        }
        glBindTexture(GL_TEXTURE_2D, id);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGBA, GL_UNSIGNED_BYTE, buf.pixels.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// Interactive thread-scaling benchmark, one render step per GUI frame.
struct BenchState {
    std::unique_ptr<Engine> engine;
    bool   running  = false;
    bool   done     = false;
    int    phase    = 0;     // 0 = AVX, 1 = scalar
    int    ti       = 0;     // thread index, 0-based
    int    rep      = 0;
    double sum      = 0.0;
    std::vector<float> avx;
    std::vector<float> scalar;
};

// ---------------------------------------------------------------------------
// All mutable GUI state. Fractal state lives in the Engine.
// ---------------------------------------------------------------------------
struct AppState {
    explicit AppState(Engine& e) : engine(e) {}

    Engine&     engine;
    SDL_Window* window     = nullptr;
    bool        running    = true;
    bool        fullscreen = false;

    // Render region in window units, updated every frame
    float render_x = 0.0f;
    float render_y = 0.0f;
    float render_w = 0.0f;
    float render_h = 0.0f;

    // Set when the user picked a fractal whose initialization failed;
    // the render region shows its message until another kind is chosen.
    int failed_kind = -1;

    // Dialog flags
    bool show_about     = false;
    bool show_benchmark = false;
    bool show_export    = false;
    bool show_save      = false;
    bool show_load      = false;

    // Export dialog state
    int         exp_scale    = 0;      // 0=1x, 1=2x, 2=4x, 3=custom
    int         exp_custom_w = 3840;
    int         exp_custom_h = 2160;
    int         exp_fmt      = 0;      // ImageFormat
    bool        exp_done     = false;
    std::string exp_msg;
    std::string exp_saved_name;

    // Session dialog state
    char        session_path[512] = "fractal_session.json";
    bool        session_done = false;
    std::string session_msg;

    // Thread count selector (0 = Auto)
    int thread_sel = 0;

    // Pointer captured by a press inside the render region
    bool pointer_captured = false;

    // Active touch points in window units
    std::map<SDL_FingerID, Vec2> fingers;

    BenchState bench;
    GlTex      render_tex;
};
