#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <format>
#include <iterator>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <thread>

namespace quotadash {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(DataStore* data_store, const Config& config)
    : data_store_(data_store)
    , config_(config)
    , dashboard_panel_()
    , history_panel_(plotter_)
{
    if (!data_store_) {
        throw std::invalid_argument("TuiApp requires a data store");
    }
}

TuiApp::~TuiApp() {
    // The store may outlive us; drop the callback that captures `this`
    data_store_->set_on_data_updated(nullptr);
    cleanup_windows();
}

void TuiApp::run() {
    // Initialize ncurses
    if (!initscr()) {
        throw std::runtime_error("failed to initialize the terminal");
    }
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking input

    init_colors();

    printf("\033]0;quotadash\007");
    fflush(stdout);

    signal(SIGWINCH, handle_resize);

    create_windows();

    data_store_->set_on_data_updated([this]() { data_updated_ = true; });
    data_store_->start();
    poll_snapshot();
    spdlog::info("tui: started ({} colors)", has_colors() ? COLORS : 0);

    running_ = true;
    auto last_tick = std::chrono::steady_clock::now();
    bool dirty = true;

    while (running_) {
        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
            dirty = true;
        }

        if (int ch = getch(); ch != ERR) {
            handle_input(ch);
            dirty = true;
        }

        if (data_updated_.exchange(false)) {
            poll_snapshot();
            dirty = true;
        }

        const auto now = std::chrono::steady_clock::now();

        if (now - last_tick >= MetricAnimationScheduler::kTickInterval) {
            tick();
            last_tick = now;
            dirty = true;
        }

        if (dirty) {
            render();
            dirty = false;
        }

        // Small sleep to reduce CPU usage
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    data_store_->stop();
    cleanup_windows();
    endwin();

    // Reset terminal title
    printf("\033]0;\007");
    fflush(stdout);
    spdlog::info("tui: stopped");
}

void TuiApp::poll_snapshot() {
    auto new_data = data_store_->get_snapshot();
    if (!new_data || (current_data_ && new_data->generation == current_data_->generation &&
                      new_data->initial_loading == current_data_->initial_loading)) {
        return;
    }

    current_data_ = new_data;
    view_model_.update_from_snapshot(current_data_);

    const auto sync = dashboard_panel_.sync_targets(view_model_.dashboard.accounts, scheduler_,
                                                    std::chrono::system_clock::now());
    loading_pending_ = sync.pending || view_model_.dashboard.initial_loading;
    spdlog::debug("tui: applied snapshot {} (animating={}, pending={})", current_data_->generation,
                  sync.animating, sync.pending);
}

void TuiApp::tick() {
    // Frames only advance while something on screen moves
    if (scheduler_.is_animating() || loading_pending_) {
        ++frame_;
    }
    scheduler_.advance();
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int content_height = std::max(1, max_y - kTabBarHeight - kStatusBarHeight);

    tab_win_ = newwin(kTabBarHeight, max_x, 0, 0);
    content_win_ = newwin(content_height, max_x, kTabBarHeight, 0);
    status_win_ = newwin(kStatusBarHeight, max_x, kTabBarHeight + content_height, 0);
    visible_rows_ = content_height;

    keypad(tab_win_, TRUE);
    keypad(content_win_, TRUE);
    keypad(status_win_, TRUE);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
    scroll_by(0);
}

void TuiApp::cleanup_windows() {
    if (tab_win_) {
        delwin(tab_win_);
        tab_win_ = nullptr;
    }
    if (content_win_) {
        delwin(content_win_);
        content_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

void TuiApp::render() {
    werase(tab_win_);
    werase(content_win_);
    werase(status_win_);

    render_tab_bar();
    render_content();
    render_status_bar();

    wnoutrefresh(tab_win_);
    wnoutrefresh(content_win_);
    wnoutrefresh(status_win_);

    if (show_help_) {
        render_help_overlay();
    }

    doupdate();
}

void TuiApp::draw_row(WINDOW* win, int y, const GlyphRow& row) {
    const int max_x = getmaxx(win);
    int x = 0;
    for (const auto& cell : row) {
        if (x >= max_x) break;
        if (cell.glyph != " ") {
            const attr_t attrs = COLOR_PAIR(color_pair_for(cell.color)) | (cell.bold ? A_BOLD : A_NORMAL);
            wattron(win, attrs);
            mvwaddstr(win, y, x, cell.glyph.c_str());
            wattroff(win, attrs);
        }
        ++x;
    }
}

void TuiApp::render_tab_bar() {
    int x = 1;
    const auto draw_tab = [&](const char* label, ActiveTab tab) {
        const int pair = view_model_.active_tab == tab ? COLOR_PAIR_TAB_ACTIVE : COLOR_PAIR_TAB_INACTIVE;
        wattron(tab_win_, COLOR_PAIR(pair) | A_BOLD);
        mvwprintw(tab_win_, 0, x, " %s ", label);
        wattroff(tab_win_, COLOR_PAIR(pair) | A_BOLD);
        x += static_cast<int>(std::char_traits<char>::length(label)) + 3;
    };

    draw_tab("1 Dashboard", ActiveTab::Dashboard);
    draw_tab("2 History", ActiveTab::History);
}

void TuiApp::render_content() {
    const int width = config_.width > 0 ? config_.width : getmaxx(content_win_);
    const auto now = std::chrono::system_clock::now();

    TextBlock block;
    if (view_model_.active_tab == ActiveTab::Dashboard) {
        block = dashboard_panel_.render(view_model_.dashboard, scheduler_, frame_, width, now);
    } else {
        block = history_panel_.render(view_model_.history.history, width, view_model_.history.loading);
    }

    content_rows_ = static_cast<int>(block.size());
    scroll_by(0);

    for (int y = 0; y < visible_rows_; ++y) {
        const int index = scroll_offset_ + y;
        if (index >= content_rows_) break;
        draw_row(content_win_, y, block[index]);
    }
}

void TuiApp::render_status_bar() {
    const int max_x = getmaxx(status_win_);

    wattron(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    mvwhline(status_win_, 0, 0, ' ', max_x);

    std::string left;
    if (!current_data_ || current_data_->initial_loading) {
        left = " Loading...";
    } else {
        const auto age = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - current_data_->timestamp);
        left = std::format(" {} accounts | updated {}s ago | every {}s{}",
                           current_data_->accounts.size(), age.count(),
                           std::chrono::duration_cast<std::chrono::seconds>(data_store_->get_refresh_interval()).count(),
                           data_store_->is_paused() ? " (paused)" : "");
    }
    mvwaddnstr(status_win_, 0, 0, left.c_str(), max_x);

    const std::string right = "r:Refresh p:Pause ?:Help q:Quit ";
    const int right_x = max_x - static_cast<int>(right.size());
    if (right_x > static_cast<int>(left.size()) + 1) {
        mvwaddstr(status_win_, 0, right_x, right.c_str());
    }
    wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));

    // Most recent provider error, between the two
    const auto errors = data_store_->get_recent_errors();
    if (!errors.empty()) {
        const std::string message = " ! " + errors.back().message + " ";
        const int x = static_cast<int>(left.size()) + 1;
        const int room = right_x - x - 1;
        if (room > 4) {
            wattron(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
            mvwaddnstr(status_win_, 0, x, message.c_str(), room);
            wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        }
    }
}

void TuiApp::render_help_overlay() {
    static constexpr const char* kHelpLines[][2] = {
        {"1 / 2 / Tab", "Switch tab"},
        {"j / k", "Select account"},
        {"g / G", "First / last account"},
        {"PgUp / PgDn", "Scroll"},
        {"r", "Refresh now"},
        {"p", "Pause / resume polling"},
        {"?", "Toggle help"},
        {"q", "Quit"},
    };
    constexpr int kLineCount = static_cast<int>(std::size(kHelpLines));

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);
    const int height = kLineCount + 4;
    const int width = 40;
    if (max_y < height || max_x < width) return;

    WINDOW* help = newwin(height, width, (max_y - height) / 2, (max_x - width) / 2);
    wbkgd(help, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(help, 0, 0);
    wattron(help, A_BOLD);
    mvwaddstr(help, 0, 2, " Keys ");
    wattroff(help, A_BOLD);

    for (int i = 0; i < kLineCount; ++i) {
        wattron(help, COLOR_PAIR(COLOR_PAIR_HELP_KEY) | A_BOLD);
        mvwaddstr(help, i + 2, 2, kHelpLines[i][0]);
        wattroff(help, COLOR_PAIR(COLOR_PAIR_HELP_KEY) | A_BOLD);
        mvwaddstr(help, i + 2, 16, kHelpLines[i][1]);
    }

    wnoutrefresh(help);
    delwin(help);
}

} // namespace quotadash
