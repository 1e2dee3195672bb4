#pragma once

#include "../data_store.hpp"
#include "dashboard_view_model.hpp"
#include "history_view_model.hpp"
#include <memory>

namespace quotadash {

enum class ActiveTab {
    Dashboard,
    History
};

// Root ViewModel containing all child ViewModels
struct AppViewModel {
    DashboardViewModel dashboard;
    HistoryViewModel history;
    ActiveTab active_tab = ActiveTab::Dashboard;

    // Generation of the snapshot last applied; 0 before the first fetch
    uint64_t generation = 0;

    void update_from_snapshot(const std::shared_ptr<DataSnapshot>& snapshot) {
        if (!snapshot) return;

        generation = snapshot->generation;

        dashboard.accounts = snapshot->accounts;
        dashboard.projections = snapshot->projections;
        dashboard.initial_loading = snapshot->initial_loading;
        dashboard.clamp_selection();

        history.history = snapshot->history;
        history.loading = snapshot->initial_loading;
    }

    void toggle_tab() {
        active_tab = active_tab == ActiveTab::Dashboard ? ActiveTab::History : ActiveTab::Dashboard;
    }
};

} // namespace quotadash
