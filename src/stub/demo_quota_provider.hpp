#pragma once

#include "../interfaces/i_quota_data_provider.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace quotadash {

struct DemoOptions {
    int accounts = 3;
    uint32_t seed = 42;

    // Fetches that report every account as still loading
    int loading_fetches = 1;

    // Simulated seconds per wall-clock second
    double time_scale = 20.0;

    // Injected for tests; system_clock::now when empty
    std::function<std::chrono::system_clock::time_point()> clock;
};

// Synthetic quota source used when no real backend is configured. Every
// account drains each model quota at its own rate and refills at the reset
// boundary of its tier (5h for PRO, daily otherwise).
class DemoQuotaProvider : public IQuotaDataProvider {
public:
    static constexpr int kMaxAccounts = 12;
    static constexpr int64_t kQuotaLimit = 1000;
    static constexpr size_t kRecentSamples = 60;

    explicit DemoQuotaProvider(DemoOptions options = {});

    ProviderSnapshot fetch() override;
    [[nodiscard]] std::string name() const override { return "demo"; }

    [[nodiscard]] int fetch_count() const { return fetch_count_; }

private:
    struct DemoQuota {
        ModelFamily family = ModelFamily::Claude;
        double drain_rate = 0.0;      // percent per simulated hour
        double phase_seconds = 0.0;   // offset into the reset cycle at start
    };

    struct DemoAccount {
        std::string email;
        std::string tier;
        std::string error;
        std::vector<DemoQuota> quotas;
    };

    [[nodiscard]] std::chrono::system_clock::time_point now() const;
    [[nodiscard]] double simulated_seconds(std::chrono::system_clock::time_point now) const;
    [[nodiscard]] AccountQuota build_account(const DemoAccount& account, double sim_seconds,
                                             std::chrono::system_clock::time_point now) const;
    void add_projections(const DemoAccount& account, const AccountQuota& quota,
                         std::chrono::system_clock::time_point now,
                         std::map<std::string, ProjectionResult>& projections) const;
    void generate_history();

    DemoOptions options_;
    std::mt19937 rng_;
    std::chrono::system_clock::time_point origin_;
    std::vector<DemoAccount> accounts_;
    UsageHistory history_;
    int fetch_count_ = 0;
};

} // namespace quotadash
