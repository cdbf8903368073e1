#include "ui_panels.hpp"
#include "app_state.hpp"
#include "config_error.hpp"
#include "export.hpp"
#include "imgui.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <string>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

static std::string timestamp()
{
    std::time_t t = std::time(nullptr);
    std::tm* tm = std::localtime(&t);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", tm);
    return ts;
}

// lowercase, spaces -> underscore
static std::string file_stem(const char* name)
{
    std::string out;
    for (const char* p = name; *p; ++p)
        out += (*p == ' ' || *p == '-') ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(*p)));
    return out;
}

static bool edit_hex_color(const char* id, std::string& hex)
{
    const Rgb c = hex_to_rgb(hex);
    float col[3] = { c.r / 255.0f, c.g / 255.0f, c.b / 255.0f };
    if (!ImGui::ColorEdit3(id, col, ImGuiColorEditFlags_NoInputs))
        return false;
    Rgb edited;
    edited.r = static_cast<uint8_t>(round_half_up(std::max(0.0f, std::min(col[0], 1.0f)) * 255.0));
    edited.g = static_cast<uint8_t>(round_half_up(std::max(0.0f, std::min(col[1], 1.0f)) * 255.0));
    edited.b = static_cast<uint8_t>(round_half_up(std::max(0.0f, std::min(col[2], 1.0f)) * 255.0));
    hex = rgb_to_hex(edited);
    return true;
}

// ---------------------------------------------------------------------------
// Side panel: gradient, colors, animation, dither, compositing
// ---------------------------------------------------------------------------
void draw_side_panel(AppState& app, const ImGuiIO& io, float menu_h, float fh)
{
    SceneState& sc = app.scene;

    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus);

    // --- Gradient type ---
    ImGui::TextDisabled("GRADIENT");
    ImGui::Separator();
    {
        static const char* names[GRADIENT_TYPE_COUNT] = {
            gradient_type_name(GradientType::Radial),
            gradient_type_name(GradientType::Linear),
            gradient_type_name(GradientType::Conic),
        };
        int g = static_cast<int>(sc.gradient);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##gradient", &g, names, GRADIENT_TYPE_COUNT)) {
            sc.gradient = static_cast<GradientType>(g);
            app.dirty = true;
        }
        if (ImGui::IsItemHovered() && io.MouseWheel != 0.0f) {
            g = (g + (io.MouseWheel < 0.0f ? 1 : -1) + GRADIENT_TYPE_COUNT) % GRADIENT_TYPE_COUNT;
            sc.gradient = static_cast<GradientType>(g);
            app.dirty = true;
        }
    }

    // --- Palette + color stops ---
    ImGui::Spacing();
    ImGui::TextDisabled("COLORS");
    ImGui::Separator();
    {
        int p = sc.palette;
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##palette", &p, g_palette_names, PALETTE_COUNT)) {
            apply_palette_keep_count(sc, p);
            app.dirty = true;
        }

        for (size_t i = 0; i < sc.colors.size(); ++i) {
            char id[16];
            std::snprintf(id, sizeof(id), "##stop%zu", i);
            if (i % 4 != 0) ImGui::SameLine();
            if (edit_hex_color(id, sc.colors[i]))
                app.dirty = true;
        }

        const int n = static_cast<int>(sc.colors.size());
        ImGui::BeginDisabled(n >= PALETTE_MAX_COLORS);
        if (ImGui::Button("+ Color")) {
            sc.colors.push_back(palette_colors(sc.palette, n + 1).back());
            app.dirty = true;
        }
        ImGui::EndDisabled();
        ImGui::SameLine();
        ImGui::BeginDisabled(n <= 3);
        if (ImGui::Button("- Color")) {
            sc.colors.pop_back();
            app.dirty = true;
        }
        ImGui::EndDisabled();
    }

    // --- Animation ---
    ImGui::Spacing();
    ImGui::TextDisabled("ANIMATION");
    ImGui::Separator();
    {
        ImGui::Checkbox("Playing  (Space)", &sc.playing);
        float speed = static_cast<float>(sc.speed);
        ImGui::Text("Speed");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderFloat("##speed", &speed, 0.0f, 5.0f, "%.2f"))
            sc.speed = speed;
        if (ImGui::Button("Reset rotation", ImVec2(-1.0f, 0.0f))) {
            sc.rotation = 0.0;
            app.dirty = true;
        }
    }

    // --- Dither ---
    ImGui::Spacing();
    ImGui::TextDisabled("DITHER");
    ImGui::Separator();
    {
        static const char* names[DITHER_ALGORITHM_COUNT + 1] = {
            dither_algorithm_name(DitherAlgorithm::Bayer),
            dither_algorithm_name(DitherAlgorithm::FloydSteinberg),
            dither_algorithm_name(DitherAlgorithm::Atkinson),
            dither_algorithm_name(DitherAlgorithm::Random),
            dither_algorithm_name(DitherAlgorithm::None),
        };
        DitherSettings& d = sc.dither;
        int a = static_cast<int>(d.algorithm);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##algorithm", &a, names, DITHER_ALGORITHM_COUNT + 1)) {
            d.algorithm = static_cast<DitherAlgorithm>(a);
            app.dirty = true;
        }

        float strength = static_cast<float>(d.strength);
        ImGui::Text("Strength");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderFloat("##strength", &strength, 0.0f, 1.0f, "%.2f")) {
            d.strength = strength;
            app.dirty = true;
        }

        const char* size_label = "Size";
        if (d.algorithm == DitherAlgorithm::Bayer)               size_label = "Tile size";
        else if (d.algorithm == DitherAlgorithm::FloydSteinberg ||
                 d.algorithm == DitherAlgorithm::Atkinson)       size_label = "Pixel scale";
        else if (d.algorithm == DitherAlgorithm::Random)         size_label = "Grain";
        ImGui::Text("%s", size_label);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##dsize", &d.size, 1, 16))
            app.dirty = true;
        if (d.algorithm == DitherAlgorithm::Bayer)
            ImGui::TextDisabled("Bayer %dx%d", snap_bayer_size(d.size), snap_bayer_size(d.size));

        ImGui::Text("Color levels");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##levels", &d.color_levels, 2, 32))
            app.dirty = true;
    }

    // --- Background + mask ---
    ImGui::Spacing();
    ImGui::TextDisabled("COMPOSITE");
    ImGui::Separator();
    {
        ImGui::Text("Background");
        ImGui::SameLine();
        if (edit_hex_color("##bg", sc.background))
            app.dirty = true;

        ImGui::Text("Mask (PNG)");
        ImGui::SetNextItemWidth(-1.0f);
        const bool entered = ImGui::InputText("##mask", app.mask_input, sizeof(app.mask_input),
                                              ImGuiInputTextFlags_EnterReturnsTrue);
        if (ImGui::Button("Apply", ImVec2(80.0f, 0.0f)) || entered) {
            sc.mask_path = app.mask_input;
            app.dirty = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Clear", ImVec2(80.0f, 0.0f))) {
            app.mask_input[0] = '\0';
            sc.mask_path.clear();
            app.dirty = true;
        }
        if (!app.renderer.mask_error.empty())
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", app.renderer.mask_error.c_str());
    }

    // --- Canvas ---
    ImGui::Spacing();
    ImGui::TextDisabled("CANVAS");
    ImGui::Separator();
    {
        ImGui::SetNextItemWidth(80.0f);
        if (ImGui::InputInt("##cw", &sc.width, 0)) {
            sc.width = std::max(16, std::min(sc.width, 7680));
            app.dirty = true;
        }
        ImGui::SameLine(); ImGui::TextUnformatted("x");
        ImGui::SameLine();
        ImGui::SetNextItemWidth(80.0f);
        if (ImGui::InputInt("##ch", &sc.height, 0)) {
            sc.height = std::max(16, std::min(sc.height, 4320));
            app.dirty = true;
        }
        ImGui::Text("Density");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##density", &sc.density, 1, 4))
            app.dirty = true;
    }

    ImGui::End();  // ##panel
}

// ---------------------------------------------------------------------------
// Status bar
// ---------------------------------------------------------------------------
void draw_status_bar(AppState& app, float fw, float fh)
{
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
    if (!app.render_error.empty()) {
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", app.render_error.c_str());
    } else {
        ImGui::Text("%d x %d   %s / %s   rotation: %.3f   %.1f ms  [%s]",
                    app.pbuf.width, app.pbuf.height,
                    gradient_type_name(app.scene.gradient),
                    dither_algorithm_name(app.scene.dither.algorithm),
                    normalize_rotation(app.scene.rotation),
                    app.main_render_ms,
                    app.scene.playing ? "playing" : "paused");
    }
    ImGui::End();
}

// ---------------------------------------------------------------------------
// Export dialog
// ---------------------------------------------------------------------------
static std::string export_still(AppState& app, int tw, int th, bool jxl)
{
    SequenceExport opts;
    opts.width  = tw;
    opts.height = th;
    const SceneState still = sequence_frame_scene(app.scene, opts, 0);

    CpuRenderer renderer;
    PixelBuffer xbuf;
    renderer.render(still, still.rotation, xbuf);
    if (jxl) {
#ifdef HAVE_JXL
        return export_jxl(app.exp_saved_name.c_str(), xbuf);
#endif
    }
    return export_png(app.exp_saved_name.c_str(), xbuf);
}

void draw_export_dialog(AppState& app)
{
    if (app.show_export) {
        ImGui::OpenPopup("Export##dlg");
        app.show_export = false;
    }
    if (ImGui::BeginPopupModal("Export##dlg", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        // Format selector
        ImGui::TextDisabled("FORMAT");
        ImGui::Separator();
        ImGui::RadioButton("PNG", &app.exp_fmt, 0);
        ImGui::SameLine();
        if (jxl_available()) {
            ImGui::RadioButton("JPEG XL (lossless)", &app.exp_fmt, 1);
        } else {
            ImGui::TextDisabled("JXL (not available)");
            if (app.exp_fmt == 1) app.exp_fmt = 0;
        }
        ImGui::SameLine();
        ImGui::RadioButton("PNG sequence", &app.exp_fmt, 2);

        // Resolution selector
        ImGui::Spacing();
        ImGui::TextDisabled("RESOLUTION");
        ImGui::Separator();
        ImGui::RadioButton("720p   1280 x 720", &app.exp_res, 0);
        ImGui::RadioButton("1080p  1920 x 1080", &app.exp_res, 1);
        ImGui::RadioButton("Custom", &app.exp_res, 2);
        if (app.exp_res == 2) {
            ImGui::SameLine();
            ImGui::SetNextItemWidth(80.0f);
            ImGui::InputInt("##xw", &app.exp_custom_w, 0);
            app.exp_custom_w = std::max(16, std::min(app.exp_custom_w, 7680));
            ImGui::SameLine(); ImGui::TextUnformatted("x");
            ImGui::SameLine();
            ImGui::SetNextItemWidth(80.0f);
            ImGui::InputInt("##xh", &app.exp_custom_h, 0);
            app.exp_custom_h = std::max(16, std::min(app.exp_custom_h, 4320));
        }

        int tw = app.exp_custom_w, th = app.exp_custom_h;
        if (app.exp_res == 0)      resolution_preset("720p", tw, th);
        else if (app.exp_res == 1) resolution_preset("1080p", tw, th);

        // Sequence timing
        const bool sequence = app.exp_fmt == 2;
        SequenceExport opts;
        if (sequence) {
            ImGui::Spacing();
            ImGui::TextDisabled("ANIMATION");
            ImGui::Separator();
            ImGui::SetNextItemWidth(160.0f);
            ImGui::SliderInt("fps", &app.exp_fps, 24, 60);
            ImGui::SetNextItemWidth(160.0f);
            ImGui::SliderFloat("seconds", &app.exp_duration, 1.0f, 10.0f, "%.1f");
            opts.width    = tw;
            opts.height   = th;
            opts.fps      = app.exp_fps;
            opts.duration = app.exp_duration;
            ImGui::TextDisabled("%d frames", sequence_frame_count(opts));
        }

        // Filename preview
        ImGui::Spacing();
        ImGui::TextDisabled("OUTPUT");
        ImGui::Separator();
        {
            std::string name = file_stem(gradient_type_name(app.scene.gradient)) + "_"
                             + file_stem(dither_algorithm_name(app.scene.dither.algorithm)) + "_"
                             + timestamp();
            if (sequence)
                name += "/";
            else
                name += (app.exp_fmt == 1) ? ".jxl" : ".png";
            ImGui::Text("%s", name.c_str());

            if (!app.exp_done) {
                ImGui::Spacing();
                if (ImGui::Button("Export", ImVec2(120.0f, 0.0f))) {
                    // Freeze filename at the moment Export is clicked
                    app.exp_saved_name = name;
                    try {
                        if (sequence) {
                            app.exp_saved_name.pop_back();
                            opts.directory = app.exp_saved_name;
                            app.exp_msg = export_png_sequence(app.scene, opts);
                        } else {
                            app.exp_msg = export_still(app, tw, th, app.exp_fmt == 1);
                        }
                    } catch (const ConfigError& ex) {
                        app.exp_msg = ex.what();
                    }
                    app.exp_done = true;
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
                if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
                    ImGui::CloseCurrentPopup();
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
        ImGui::Text("Gradient Dither  v1.0");
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::Text("Animated gradients, masked and quantized.");
        ImGui::Text("Radial  |  Linear  |  Conic");
        ImGui::Spacing();
        ImGui::TextDisabled("Bayer, Floyd-Steinberg, Atkinson and random dithering");
        ImGui::TextDisabled("%d color presets, up to %d stops", PALETTE_COUNT, PALETTE_MAX_COLORS);
        ImGui::TextDisabled("PNG and JPEG XL stills, PNG frame sequences");
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::TextDisabled("Space: play/pause   Ctrl+S: export   F1: about");
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
