#include "tui_app.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace quotadash {

void TuiApp::handle_input(int ch) {
    // Help overlay takes priority
    if (show_help_) {
        handle_help_input(ch);
        return;
    }

    switch (ch) {
        case 'q':
        case 'Q':
            running_ = false;
            return;

        case '?':
        case KEY_F(1):
            show_help_ = true;
            return;

        case '1':
            view_model_.active_tab = ActiveTab::Dashboard;
            scroll_offset_ = 0;
            return;

        case '2':
            view_model_.active_tab = ActiveTab::History;
            scroll_offset_ = 0;
            return;

        case '\t':
        case KEY_BTAB:
            view_model_.toggle_tab();
            scroll_offset_ = 0;
            return;

        case 'r':
        case KEY_F(5):
            spdlog::info("tui: manual refresh");
            data_store_->refresh_now();
            return;

        case 'p':
            if (data_store_->is_paused()) {
                data_store_->resume();
            } else {
                data_store_->pause();
            }
            return;

        case KEY_PPAGE:
            scroll_by(-visible_rows_);
            return;

        case KEY_NPAGE:
            scroll_by(visible_rows_);
            return;
    }

    if (view_model_.active_tab != ActiveTab::Dashboard) {
        // History has no selection; j/k scroll instead
        if (ch == 'j' || ch == KEY_DOWN) scroll_by(1);
        if (ch == 'k' || ch == KEY_UP) scroll_by(-1);
        return;
    }

    switch (ch) {
        case 'j':
        case KEY_DOWN:
            view_model_.dashboard.select_next();
            break;
        case 'k':
        case KEY_UP:
            view_model_.dashboard.select_previous();
            break;
        case 'g':
        case KEY_HOME:
            view_model_.dashboard.select_first();
            scroll_offset_ = 0;
            break;
        case 'G':
        case KEY_END:
            view_model_.dashboard.select_last();
            scroll_by(content_rows_);
            break;
    }
}

void TuiApp::handle_help_input(int ch) {
    if (ch == '?' || ch == 'q' || ch == 27 || ch == KEY_F(1) || ch == '\n') {
        show_help_ = false;
    }
}

void TuiApp::scroll_by(int delta) {
    const int max_offset = std::max(0, content_rows_ - visible_rows_);
    scroll_offset_ = std::clamp(scroll_offset_ + delta, 0, max_offset);
}

} // namespace quotadash
