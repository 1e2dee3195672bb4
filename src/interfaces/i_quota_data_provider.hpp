#pragma once

#include "../quota_info.hpp"
#include "../usage_history.hpp"
#include <map>
#include <string>
#include <vector>

namespace quotadash {

// Everything one refresh cycle delivers
struct ProviderSnapshot {
    std::vector<AccountQuota> accounts;
    std::map<std::string, ProjectionResult> projections;  // keyed by metric_key()
    UsageHistory history;
};

class IQuotaDataProvider {
public:
    virtual ~IQuotaDataProvider() = default;

    // Throws std::runtime_error when the refresh fails
    virtual ProviderSnapshot fetch() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace quotadash
