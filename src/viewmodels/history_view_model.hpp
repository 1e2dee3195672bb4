#pragma once

#include "../usage_history.hpp"

namespace quotadash {

struct HistoryViewModel {
    UsageHistory history;
    bool loading = true;
};

} // namespace quotadash
