#pragma once

#include "errors.hpp"
#include "interfaces/i_quota_data_provider.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace quotadash {

// Snapshot of provider data - returned to UI
struct DataSnapshot {
    std::vector<AccountQuota> accounts;
    std::map<std::string, ProjectionResult> projections;
    UsageHistory history;

    // True until the first successful fetch
    bool initial_loading = true;

    // Incremented on every successful fetch
    uint64_t generation = 0;

    std::chrono::system_clock::time_point fetched_at;
    std::chrono::steady_clock::time_point timestamp;
};

class DataStore {
public:
    explicit DataStore(IQuotaDataProvider& provider);
    ~DataStore();

    DataStore(const DataStore&) = delete;
    DataStore& operator=(const DataStore&) = delete;

    // Start/stop the background collection thread
    void start();
    void stop();

    void set_refresh_interval(std::chrono::milliseconds interval);
    [[nodiscard]] std::chrono::milliseconds get_refresh_interval() const;

    // Get a snapshot of current data (thread-safe)
    [[nodiscard]] std::shared_ptr<DataSnapshot> get_snapshot() const;

    // Wake the collection thread for an immediate fetch
    void refresh_now();

    // Fetch synchronously on the calling thread; returns false when the fetch failed
    bool collect_now();

    void pause();
    void resume();
    [[nodiscard]] bool is_paused() const;

    // Register callback for when new data is available
    void set_on_data_updated(std::function<void()> callback);

    // Fetch failures from the last minute, oldest first
    [[nodiscard]] std::vector<ProviderError> get_recent_errors() const;

private:
    static constexpr size_t kMaxErrors = 20;
    static constexpr std::chrono::seconds kErrorWindow{60};

    void collection_thread_func();
    bool collect_data();
    void add_error(const std::string& message);

    IQuotaDataProvider& provider_;

    // Background thread
    std::thread collection_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> refresh_requested_{false};
    std::atomic<std::chrono::milliseconds::rep> refresh_interval_ms_{30000};
    std::condition_variable cv_;
    std::mutex cv_mutex_;

    // Serializes provider access between the thread and collect_now()
    std::mutex fetch_mutex_;

    mutable std::mutex data_mutex_;
    std::shared_ptr<DataSnapshot> current_snapshot_;
    std::function<void()> on_data_updated_;

    mutable std::mutex errors_mutex_;
    std::vector<ProviderError> recent_errors_;
};

} // namespace quotadash
