#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "buffers.hpp"
#include "export.hpp"
#include "render_job.hpp"

#include <chrono>
#include <future>
#include <mutex>
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
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGBA, GL_UNSIGNED_BYTE, buf.pixels.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// Written by job callbacks on the render thread, read by the UI thread.
struct JobEvents {
    std::mutex  mtx;
    std::string error;          // last on_error message
    bool        completed = false;
};

// ---------------------------------------------------------------------------
// All mutable application state
// ---------------------------------------------------------------------------
struct AppState {
    JobEvents           events;
    uint32_t            wake_event     = 0;      // SDL user event type

    RenderJobController ctl;
    PixelBuffer         pbuf;
    bool                dirty          = true;   // parameters changed, re-render
    bool                auto_render    = true;   // re-render on navigation
    int                 preset_sel     = 0;
    uint32_t            shown_batches  = 0;      // batches in the uploaded preview
    std::chrono::steady_clock::time_point last_preview;

    // Dialog flags
    bool        show_about     = false;
    bool        show_export    = false;

    // Export dialog state
    int         exp_scale    = 0;      // 0=1x, 1=2x, 2=4x
    int         exp_fmt      = 0;      // 0=PNG, 1=JXL, 2=SVG
    float       exp_quality  = 0.95f;
    bool        exp_running  = false;
    bool        exp_done     = false;
    std::string exp_msg;
    std::string exp_saved_name;
    std::future<ExportResult> exp_future;
    int         last_irw     = 0;
    int         last_irh     = 0;

    // Thread count selector (0 = Auto)
    int thread_sel = 0;

    // GL textures
    GlTex render_tex;
};

// Start a render of the pending parameters at the current pane size.
void start_render(AppState& app);
