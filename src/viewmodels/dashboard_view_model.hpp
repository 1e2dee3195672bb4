#pragma once

#include "../quota_info.hpp"
#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace quotadash {

struct DashboardViewModel {
    std::vector<AccountQuota> accounts;
    std::map<std::string, ProjectionResult> projections;

    // No fetch has completed yet
    bool initial_loading = true;

    int selected_index = 0;

    [[nodiscard]] const ProjectionResult* projection_for(const std::string& key) const {
        const auto it = projections.find(key);
        return it != projections.end() ? &it->second : nullptr;
    }

    void clamp_selection() {
        const int last = static_cast<int>(accounts.size()) - 1;
        selected_index = std::clamp(selected_index, 0, std::max(last, 0));
    }

    void select_next() {
        ++selected_index;
        clamp_selection();
    }

    void select_previous() {
        --selected_index;
        clamp_selection();
    }

    void select_first() { selected_index = 0; }

    void select_last() {
        selected_index = static_cast<int>(accounts.size()) - 1;
        clamp_selection();
    }
};

} // namespace quotadash
