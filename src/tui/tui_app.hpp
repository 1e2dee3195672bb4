#pragma once

#include "../animation/metric_animation_scheduler.hpp"
#include "../config.hpp"
#include "../data_store.hpp"
#include "../panels/dashboard_panel.hpp"
#include "../panels/history_panel.hpp"
#include "../render/ascii_plotter.hpp"
#include "../viewmodels/app_view_model.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <ncurses.h>

namespace quotadash {

class TuiApp {
public:
    // Non-owning: the data store must outlive the TuiApp instance
    TuiApp(DataStore* data_store, const Config& config);
    ~TuiApp();

    TuiApp(const TuiApp&) = delete;
    TuiApp& operator=(const TuiApp&) = delete;

    void run();

private:
    // Rendering
    void render();
    void render_tab_bar();
    void render_content();
    void render_status_bar();
    void render_help_overlay();
    static void draw_row(WINDOW* win, int y, const GlyphRow& row);

    // Input handling
    void handle_input(int ch);
    void handle_help_input(int ch);
    void scroll_by(int delta);

    // Data and animation
    void poll_snapshot();
    void tick();

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();

    // Non-owned reference to data layer
    DataStore* data_store_ = nullptr;
    const Config& config_;

    std::shared_ptr<DataSnapshot> current_data_;
    AppViewModel view_model_;

    MetricAnimationScheduler scheduler_;
    AsciiPlotter plotter_;
    DashboardPanel dashboard_panel_;
    HistoryPanel history_panel_;

    // Animation frames since start; drives shimmer and spinners
    uint64_t frame_ = 0;
    bool loading_pending_ = false;

    // ncurses windows
    WINDOW* tab_win_ = nullptr;
    WINDOW* content_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    std::atomic<bool> running_{false};
    std::atomic<bool> data_updated_{false};
    bool show_help_ = false;

    int scroll_offset_ = 0;
    int content_rows_ = 0;
    int visible_rows_ = 0;

    // Layout constants
    static constexpr int kTabBarHeight = 1;
    static constexpr int kStatusBarHeight = 1;
};

} // namespace quotadash
