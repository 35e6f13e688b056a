#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "cli_benchmark.hpp"
#include "ui_panels.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

// Minimum time between two preview uploads while a job is running.
static const auto PREVIEW_INTERVAL = std::chrono::milliseconds(200);

static void wake_ui(uint32_t type)
{
    if (type == static_cast<uint32_t>(-1)) return;
    SDL_Event ev;
    SDL_zero(ev);
    ev.type = type;
    SDL_PushEvent(&ev);
}

void start_render(AppState& app)
{
    {
        std::lock_guard<std::mutex> lock(app.events.mtx);
        app.events.error.clear();
        app.events.completed = false;
    }
    app.shown_batches = 0;

    const uint32_t wake = app.wake_event;
    JobEvents*     ev   = &app.events;

    RenderCallbacks cb;
    cb.on_progress = [wake](double, float) { wake_ui(wake); };
    cb.on_complete = [wake, ev](std::shared_ptr<const AccumulationBuffer>) {
        {
            std::lock_guard<std::mutex> lock(ev->mtx);
            ev->completed = true;
        }
        wake_ui(wake);
    };
    cb.on_error = [wake, ev](const RenderError& e) {
        fprintf(stderr, "Render failed: %s: %s\n", error_kind_name(e.kind), e.message.c_str());
        {
            std::lock_guard<std::mutex> lock(ev->mtx);
            ev->error = e.message;
        }
        wake_ui(wake);
    };

    JobHandle handle;
    const RenderError err = app.ctl.render(cb, handle);
    if (err) {
        fprintf(stderr, "Render rejected: %s\n", err.message.c_str());
        std::lock_guard<std::mutex> lock(app.events.mtx);
        app.events.error = err.message;
    }
}

// Re-colour the running job's buffer and push it to the GPU.
static void refresh_preview(AppState& app, bool force)
{
    const auto now = std::chrono::steady_clock::now();
    const RenderJob job = app.ctl.job();
    if (job.id == 0 || job.batches_committed == app.shown_batches) return;
    if (!force && now - app.last_preview < PREVIEW_INTERVAL) return;

    if (!app.ctl.preview(app.pbuf)) return;
    app.render_tex.ensure(app.pbuf.width, app.pbuf.height);
    app.render_tex.upload(app.pbuf);
    app.shown_batches = static_cast<uint32_t>(job.batches_committed);
    app.last_preview  = now;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    // --benchmark [max_threads]: run the headless sampling benchmark and exit
    if (argc >= 2 && std::strcmp(argv[1], "--benchmark") == 0) {
        const int max_t = (argc >= 3) ? std::atoi(argv[2]) : 0;
        return run_cli_benchmark(max_t);
    }

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);

    SDL_Window* window = SDL_CreateWindow(
        "Buddha Xplorer",
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

    // -----------------------------------------------------------------------
    // App state (destroyed before the GL context goes away)
    // -----------------------------------------------------------------------
    auto state = std::make_unique<AppState>();
    AppState& app = *state;
    app.wake_event = SDL_RegisterEvents(1);
    if (app.wake_event == static_cast<uint32_t>(-1))
        fprintf(stderr, "SDL_RegisterEvents failed, preview refreshes on timeout only\n");

    auto update_title = [&]() {
        const RenderParameters p = app.ctl.parameters();
        char tbuf[128];
        std::snprintf(tbuf, sizeof(tbuf), "Buddha Xplorer  |  %s  [zoom: %.2fx]",
                      color_scheme_name(p.color_scheme), p.zoom);
        SDL_SetWindowTitle(window, tbuf);
    };
    update_title();

    bool running = true;
    while (running) {
        // Block until an SDL event arrives or 50 ms elapses. Job callbacks
        // post wake_event so progress still reaches the screen promptly.
        SDL_Event event;
        if (SDL_WaitEventTimeout(&event, 50)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }
        // Drain any additional events that queued up.
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
        const int   irw      = static_cast<int>(render_w);
        const int   irh      = static_cast<int>(render_h);

        // Pane resize: the accumulation buffer follows the render area
        if (irw > 0 && irh > 0 && (irw != app.last_irw || irh != app.last_irh)) {
            if (!app.ctl.set_resolution(irw, irh))
                app.dirty = true;
            app.last_irw = irw;
            app.last_irh = irh;
        }

        if (app.dirty && app.auto_render && irw > 0 && irh > 0) {
            start_render(app);
            update_title();
            app.dirty = false;
        }

        bool job_finished = false;
        {
            std::lock_guard<std::mutex> lock(app.events.mtx);
            job_finished = app.events.completed;
            app.events.completed = false;
        }
        refresh_preview(app, job_finished);

        // -------------------------------------------------------------------
        // Menu bar
        // -------------------------------------------------------------------
        if (ImGui::BeginMainMenuBar()) {
            if (ImGui::BeginMenu("File")) {
                if (ImGui::MenuItem("Render", "F5")) start_render(app);
                if (ImGui::MenuItem("Cancel", "Esc")) app.ctl.cancel();
                ImGui::Separator();
                if (ImGui::MenuItem("Export Image", "Ctrl+S")) {
                    app.show_export = true;
                    app.exp_done    = false;
                    app.exp_msg.clear();
                }
                ImGui::Separator();
                if (ImGui::MenuItem("Exit")) running = false;
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("View")) {
                if (ImGui::MenuItem("Reset View", "R")) {
                    app.ctl.reset_view();
                    app.dirty = true;
                }
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Help")) {
                if (ImGui::MenuItem("About", "F1")) app.show_about = true;
                ImGui::EndMenu();
            }
            ImGui::EndMainMenuBar();
        }

        // -------------------------------------------------------------------
        // Global keyboard shortcuts
        // -------------------------------------------------------------------
        if (ImGui::IsKeyPressed(ImGuiKey_S) && io.KeyCtrl) {
            app.show_export = true;
            app.exp_done    = false;
            app.exp_msg.clear();
        }
        if (ImGui::IsKeyPressed(ImGuiKey_F1))
            app.show_about = true;
        if (!io.WantTextInput) {
            if (ImGui::IsKeyPressed(ImGuiKey_R)) {
                app.ctl.reset_view();
                app.dirty = true;
            }
            if (ImGui::IsKeyPressed(ImGuiKey_F5))
                start_render(app);
            if (ImGui::IsKeyPressed(ImGuiKey_Escape) && !ImGui::IsPopupOpen("", ImGuiPopupFlags_AnyPopupId))
                app.ctl.cancel();
            if (ImGui::IsKeyPressed(ImGuiKey_Equal) ||
                ImGui::IsKeyPressed(ImGuiKey_KeypadAdd)) {
                if (!app.ctl.zoom_in(1.5)) app.dirty = true;
            }
            if (ImGui::IsKeyPressed(ImGuiKey_Minus) ||
                ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract)) {
                if (!app.ctl.zoom_out(1.5)) app.dirty = true;
            }
        }

        draw_side_panel(app, io, menu_h, fh);

        // -------------------------------------------------------------------
        // Render area
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

        if (app.render_tex.id)
            ImGui::Image(app.render_tex.imgui_id(),
                         ImVec2(static_cast<float>(app.render_tex.w),
                                static_cast<float>(app.render_tex.h)));

        const bool render_hovered = ImGui::IsWindowHovered();

        // Mouse wheel: zoom about the view center
        if (render_hovered && io.MouseWheel != 0.0f) {
            const RenderError err = (io.MouseWheel > 0.0f) ? app.ctl.zoom_in(1.25)
                                                           : app.ctl.zoom_out(1.25);
            if (!err) app.dirty = true;
        }

        // Left click: recenter on the clicked point
        if (render_hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            app.ctl.pan_to(io.MousePos.x - render_x, io.MousePos.y - render_y);
            app.dirty = true;
        }

        ImGui::End();  // ##render

        // -------------------------------------------------------------------
        // Status bar
        // -------------------------------------------------------------------
        ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
        ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
        ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
        ImGui::Begin("##status", nullptr,
            ImGuiWindowFlags_NoTitleBar            |
            ImGuiWindowFlags_NoResize              |
            ImGuiWindowFlags_NoMove                |
            ImGuiWindowFlags_NoBringToFrontOnFocus |
            ImGuiWindowFlags_NoScrollbar);
        ImGui::PopStyleVar();
        {
            const RenderJob job = app.ctl.job();
            const RenderParameters& p = job.id ? job.parameters : app.ctl.parameters();
            ImGui::Text("x: %.8f   y: %.8f   zoom: %.4fx   iter: %u   %s %.1f%%   %llu samples  [%dt]",
                        p.center_x, p.center_y, p.zoom, p.iterations,
                        job.id ? job_status_name(job.status) : "idle",
                        job.progress * 100.0,
                        static_cast<unsigned long long>(job.processed_samples),
                        app.ctl.thread_count());
        }
        ImGui::End();

        draw_export_dialog(app);
        draw_about_dialog(app);

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

    app.ctl.cancel();
    app.ctl.cancel_export();
    app.ctl.wait();
    if (app.exp_future.valid())
        app.exp_future.wait();
    state.reset();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
