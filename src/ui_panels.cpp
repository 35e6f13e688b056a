#include "ui_panels.hpp"
#include "app_state.hpp"
#include "export.hpp"
#include "render_params.hpp"
#include "imgui.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include <thread>

static const float PANEL_WIDTH = 280.0f;

// ---------------------------------------------------------------------------
// Side panel: preset, iterations, samples, scheme, view, render, metrics
// ---------------------------------------------------------------------------
void draw_side_panel(AppState& app, const ImGuiIO& io, float menu_h, float fh)
{
    static const float STATUS_HEIGHT = 24.0f;

    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar           |
        ImGuiWindowFlags_NoScrollWithMouse);

    RenderParameters p = app.ctl.parameters();
    bool changed = false;

    // --- Preset ---
    ImGui::TextDisabled("PRESET");
    ImGui::Separator();
    {
        const auto& list = app.ctl.get_presets();
        const int   n    = static_cast<int>(list.size());
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::BeginCombo("##preset", list[app.preset_sel].name)) {
            for (int i = 0; i < n; ++i) {
                if (ImGui::Selectable(list[i].name, i == app.preset_sel)) {
                    app.preset_sel = i;
                    if (!app.ctl.load_preset(list[i].name))
                        app.dirty = true;
                    p = app.ctl.parameters();
                }
            }
            ImGui::EndCombo();
        }
    }

    // --- Iteration count ---
    ImGui::Spacing();
    ImGui::TextDisabled("ITERATIONS");
    ImGui::Separator();
    {
        int iter = static_cast<int>(p.iterations);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##iter", &iter, 16, 20000, "%d",
                             ImGuiSliderFlags_Logarithmic)) {
            p.iterations = static_cast<uint32_t>(std::max(1, iter));
            changed = true;
        }
    }

    // --- Sample count ---
    ImGui::Spacing();
    ImGui::TextDisabled("SAMPLES");
    ImGui::Separator();
    {
        static const ImU64 s_min = 10000, s_max = 100000000;
        ImU64 samples = static_cast<ImU64>(p.samples);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderScalar("##samples", ImGuiDataType_U64, &samples,
                                &s_min, &s_max, "%llu", ImGuiSliderFlags_Logarithmic)) {
            p.samples = std::max<uint64_t>(1, samples);
            changed = true;
        }
    }

    // --- Color scheme ---
    ImGui::Spacing();
    ImGui::TextDisabled("COLOR SCHEME");
    ImGui::Separator();
    {
        int s = static_cast<int>(p.color_scheme);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##scheme", &s, g_color_scheme_names, COLOR_SCHEME_COUNT)) {
            p.color_scheme = static_cast<ColorScheme>(s);
            changed = true;
        }
        if (ImGui::IsItemHovered() && io.MouseWheel != 0.0f) {
            s = (s + (io.MouseWheel < 0.0f ? 1 : -1) + COLOR_SCHEME_COUNT) % COLOR_SCHEME_COUNT;
            p.color_scheme = static_cast<ColorScheme>(s);
            changed = true;
        }
    }

    if (changed && !app.ctl.set_parameters(p))
        app.dirty = true;

    // --- View ---
    ImGui::Spacing();
    ImGui::TextDisabled("VIEW");
    ImGui::Separator();
    {
        const RenderParameters cur = app.ctl.parameters();
        ImGui::Text("center: %.6f", cur.center_x);
        ImGui::Text("        %.6f", cur.center_y);
        ImGui::Text("zoom:   %.3fx", cur.zoom);
        if (ImGui::Button("Zoom in", ImVec2(84.0f, 0.0f))) {
            if (!app.ctl.zoom_in(2.0)) app.dirty = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Zoom out", ImVec2(84.0f, 0.0f))) {
            if (!app.ctl.zoom_out(2.0)) app.dirty = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Reset", ImVec2(-1.0f, 0.0f))) {
            app.ctl.reset_view();
            app.dirty = true;
        }
        ImGui::Checkbox("Re-render on change", &app.auto_render);
    }

    // --- Threads ---
    ImGui::Spacing();
    ImGui::TextDisabled("THREADS");
    ImGui::Separator();
    {
        const int hw = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
        char label[32];
        if (app.thread_sel == 0) std::snprintf(label, sizeof(label), "Auto (%d)", hw);
        else                     std::snprintf(label, sizeof(label), "%d", app.thread_sel);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::BeginCombo("##threads", label)) {
            for (int i = 0; i <= hw; ++i) {
                char item[32];
                if (i == 0) std::snprintf(item, sizeof(item), "Auto (%d)", hw);
                else        std::snprintf(item, sizeof(item), "%d", i);
                if (ImGui::Selectable(item, i == app.thread_sel)) {
                    app.thread_sel = i;
                    app.ctl.set_thread_count(i);
                }
            }
            ImGui::EndCombo();
        }
    }

    // --- Render / progress ---
    ImGui::Spacing();
    ImGui::TextDisabled("RENDER");
    ImGui::Separator();
    const RenderJob job = app.ctl.job();
    {
        const bool running = job.status == JobStatus::Running || job.status == JobStatus::Pending;
        if (!running || job.id == 0) {
            if (ImGui::Button("Render", ImVec2(-1.0f, 0.0f)))
                start_render(app);
        } else {
            if (ImGui::Button("Cancel", ImVec2(-1.0f, 0.0f)))
                app.ctl.cancel();
        }

        char prog[64];
        std::snprintf(prog, sizeof(prog), "%s  %.1f%%",
                      job.id ? job_status_name(job.status) : "idle",
                      job.progress * 100.0);
        ImGui::ProgressBar(static_cast<float>(job.progress), ImVec2(-1.0f, 0.0f), prog);
        ImGui::Text("max density: %.0f", job.max_density);

        std::lock_guard<std::mutex> lock(app.events.mtx);
        if (job.status == JobStatus::Failed && !app.events.error.empty())
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", app.events.error.c_str());
    }

    // --- Metrics ---
    if (auto m = app.ctl.performance_metrics()) {
        ImGui::Spacing();
        ImGui::TextDisabled("PERFORMANCE");
        ImGui::Separator();
        ImGui::Text("time:     %.2f s", m->elapsed_seconds);
        ImGui::Text("rate:     %.0f samples/s", m->samples_per_second);
        ImGui::Text("samples:  %llu", static_cast<unsigned long long>(m->total_samples));
        ImGui::Text("memory:   %.1f MB",
                    static_cast<double>(m->memory_bytes) / (1024.0 * 1024.0));
    }

    ImGui::End();  // ##panel
}

// ---------------------------------------------------------------------------
// Export dialog
// ---------------------------------------------------------------------------
void draw_export_dialog(AppState& app)
{
    if (app.show_export) {
        ImGui::OpenPopup("Export Image##dlg");
        app.show_export = false;
    }
    if (ImGui::BeginPopupModal("Export Image##dlg", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        // Format selector
        ImGui::TextDisabled("FORMAT");
        ImGui::Separator();
        ImGui::RadioButton("PNG", &app.exp_fmt, 0);
        ImGui::SameLine();
        if (jxl_available()) {
            ImGui::RadioButton("JPEG XL", &app.exp_fmt, 1);
        } else {
            ImGui::TextDisabled("JXL (not available)");
            if (app.exp_fmt == 1) app.exp_fmt = 0;
        }
        ImGui::SameLine();
        ImGui::RadioButton("SVG (approximate)", &app.exp_fmt, 2);

        ImGui::Spacing();
        ImGui::TextDisabled("QUALITY");
        ImGui::Separator();
        ImGui::SetNextItemWidth(240.0f);
        ImGui::SliderFloat("##quality", &app.exp_quality, 0.0f, 1.0f, "%.2f");

        // Resolution selector (raster only; re-renders at the larger size)
        if (app.exp_fmt != 2) {
            ImGui::Spacing();
            ImGui::TextDisabled("RESOLUTION");
            ImGui::Separator();
            char buf1[64], buf2[64], buf4[64];
            std::snprintf(buf1, sizeof(buf1), "1x   %d x %d", app.last_irw,     app.last_irh    );
            std::snprintf(buf2, sizeof(buf2), "2x   %d x %d  (re-render)", app.last_irw * 2, app.last_irh * 2);
            std::snprintf(buf4, sizeof(buf4), "4x   %d x %d  (re-render)", app.last_irw * 4, app.last_irh * 4);
            ImGui::RadioButton(buf1, &app.exp_scale, 0);
            ImGui::RadioButton(buf2, &app.exp_scale, 1);
            ImGui::RadioButton(buf4, &app.exp_scale, 2);
        }

        // Filename preview
        ImGui::Spacing();
        ImGui::TextDisabled("OUTPUT");
        ImGui::Separator();
        {
            static const char* exts[] = { "png", "jxl", "svg" };
            std::time_t t = std::time(nullptr);
            std::tm* tm = std::localtime(&t);
            char ts[32];
            std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", tm);
            const RenderParameters p = app.ctl.parameters();
            std::string filename = std::string("buddhabrot_") + color_scheme_name(p.color_scheme)
                                 + "_" + ts + "." + exts[app.exp_fmt];
            ImGui::Text("%s", app.exp_running ? app.exp_saved_name.c_str() : filename.c_str());

            // Collect a finished background export
            if (app.exp_running && app.exp_future.valid() &&
                app.exp_future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                const ExportResult res = app.exp_future.get();
                if (res.error)
                    app.exp_msg = res.error.message;
                else
                    app.exp_msg = write_file(app.exp_saved_name.c_str(), res.bytes);
                if (!app.exp_msg.empty())
                    fprintf(stderr, "Export failed: %s\n", app.exp_msg.c_str());
                app.exp_running = false;
                app.exp_done    = true;
            }

            if (app.exp_running) {
                ImGui::Spacing();
                ImGui::TextDisabled("Exporting...");
                ImGui::SameLine();
                if (ImGui::Button("Cancel", ImVec2(80.0f, 0.0f)))
                    app.ctl.cancel_export();
            } else if (!app.exp_done) {
                ImGui::Spacing();
                const bool ready = app.ctl.status() == JobStatus::Complete;
                if (!ready) ImGui::BeginDisabled();
                if (ImGui::Button("Export", ImVec2(120.0f, 0.0f))) {
                    // Freeze filename at the moment Export is clicked
                    app.exp_saved_name = filename;
                    ExportOptions opt;
                    opt.format  = app.exp_fmt == 2 ? ExportFormat::Vector : ExportFormat::Raster;
                    opt.codec   = app.exp_fmt == 1 ? RasterCodec::Jxl : RasterCodec::Png;
                    opt.quality = app.exp_quality;
                    opt.scale   = 1 << app.exp_scale;
                    app.exp_future  = app.ctl.export_image_async(opt);
                    app.exp_running = true;
                }
                if (!ready) {
                    ImGui::EndDisabled();
                    ImGui::SameLine();
                    ImGui::TextDisabled("render not complete");
                }
                ImGui::SameLine();
                if (ImGui::Button("Cancel", ImVec2(80.0f, 0.0f)))
                    ImGui::CloseCurrentPopup();
            } else {
                ImGui::Spacing();
                if (app.exp_msg.empty()) {
                    ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.3f, 1.0f),
                                       "Saved: %s", app.exp_saved_name.c_str());
                } else {
                    ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f),
                                       "Error: %s", app.exp_msg.c_str());
                }
                ImGui::Spacing();
                if (ImGui::Button("Close", ImVec2(80.0f, 0.0f))) {
                    app.exp_done = false;
                    ImGui::CloseCurrentPopup();
                }
            }
        }
        ImGui::EndPopup();
    }
}

// ---------------------------------------------------------------------------
// About dialog
// ---------------------------------------------------------------------------
void draw_about_dialog(AppState& app)
{
    if (app.show_about) {
        ImGui::OpenPopup("About##dlg");
        app.show_about = false;
    }
    if (ImGui::BeginPopupModal("About##dlg", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Buddha Xplorer  v1.0");
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::Text("Progressive Buddhabrot renderer.");
        ImGui::Text("Escaping orbits of z^2 + c, accumulated into a density map.");
        ImGui::Spacing();
        ImGui::TextDisabled("Multithreaded batch sampling with live preview");
        ImGui::TextDisabled("5 color schemes, gamma-corrected density");
        ImGui::TextDisabled("PNG, JPEG XL and SVG export");
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::TextDisabled("Built with Dear ImGui, SDL2, libpng, libjxl");
        ImGui::Spacing();
        ImGui::SetCursorPosX(
            (ImGui::GetContentRegionAvail().x - 120.0f) * 0.5f
            + ImGui::GetCursorPosX());
        if (ImGui::Button("Close", ImVec2(120.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}
