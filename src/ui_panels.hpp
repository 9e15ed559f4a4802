#pragma once

struct AppState;
struct ImGuiIO;

void draw_menu_bar(AppState& app);
void draw_side_panel(AppState& app, const ImGuiIO& io, float menu_h, float fh);
void draw_render_region(AppState& app, const ImGuiIO& io);
void draw_status_bar(AppState& app, float fw, float fh);

void draw_export_dialog(AppState& app);
void draw_session_dialogs(AppState& app);
void draw_benchmark_dialog(AppState& app);
void draw_about_dialog(AppState& app);

// Keyboard: held navigation keys go to the input controller, plus the
// global shortcuts (Ctrl+S export, F11 fullscreen, F1 about).
void handle_keyboard(AppState& app, const ImGuiIO& io);

void toggle_fullscreen(AppState& app);
