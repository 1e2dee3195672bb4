#include "config.hpp"
#include "data_store.hpp"
#include "logging.hpp"
#include "panels/dashboard_panel.hpp"
#include "panels/history_panel.hpp"
#include "render/ascii_plotter.hpp"
#include "stub/demo_quota_provider.hpp"
#include "tui/tui_app.hpp"
#include <clocale>
#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

constexpr int kDefaultWidth = 100;

// Upper bound on settle ticks; convergence from 0 to 100 takes far fewer
constexpr int kMaxSettleTicks = 1000;

int terminal_width() {
    winsize size{};
    if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0) {
        return size.ws_col;
    }
    return kDefaultWidth;
}

// One frame with every animation settled, printed as ANSI text
int run_snapshot(quotadash::DataStore& data_store, const quotadash::Config& config) {
    if (!data_store.collect_now()) {
        std::cerr << "Error: failed to fetch quota data" << std::endl;
        return 1;
    }

    const auto snapshot = data_store.get_snapshot();
    const auto now = std::chrono::system_clock::now();
    const int width = config.width > 0 ? config.width : terminal_width();

    quotadash::DashboardViewModel view_model;
    view_model.accounts = snapshot->accounts;
    view_model.projections = snapshot->projections;
    view_model.initial_loading = snapshot->initial_loading;

    quotadash::DashboardPanel dashboard;
    quotadash::MetricAnimationScheduler scheduler;
    dashboard.sync_targets(view_model.accounts, scheduler, now);
    int ticks = 0;
    while (ticks < kMaxSettleTicks && scheduler.advance()) {
        ++ticks;
    }
    spdlog::debug("snapshot: animations settled after {} ticks", ticks);

    std::cout << quotadash::to_ansi(dashboard.render(view_model, scheduler, 0, width, now)) << '\n';

    if (config.show_history) {
        quotadash::AsciiPlotter plotter;
        quotadash::HistoryPanel history(plotter);
        std::cout << '\n' << quotadash::to_ansi(history.render(snapshot->history, width)) << '\n';
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Box drawing and block glyphs need a UTF-8 locale
    setlocale(LC_ALL, "");

    quotadash::Config config;
    try {
        config = quotadash::load_config(argc, argv);
    } catch (const quotadash::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << quotadash::usage_text(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << quotadash::usage_text(argv[0]);
        return 0;
    }

    try {
        quotadash::init_logging(config);

        quotadash::DemoOptions options;
        options.accounts = config.demo_accounts;
        options.seed = config.seed;
        // Snapshot mode prints a single frame, so skip the loading state
        options.loading_fetches = config.snapshot_mode ? 0 : 1;
        quotadash::DemoQuotaProvider provider(options);

        quotadash::DataStore data_store(provider);
        data_store.set_refresh_interval(config.refresh_interval);

        if (config.snapshot_mode) {
            return run_snapshot(data_store, config);
        }

        // TuiApp does not own the data store - it is managed here
        quotadash::TuiApp app(&data_store, config);
        app.run();
        return 0;
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        if (!config.snapshot_mode) endwin();
        spdlog::error("fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
