#include "data_store.hpp"
#include <algorithm>
#include <exception>
#include <iterator>
#include <spdlog/spdlog.h>

namespace quotadash {

DataStore::DataStore(IQuotaDataProvider& provider) : provider_(provider) {
    current_snapshot_ = std::make_shared<DataSnapshot>();
    current_snapshot_->timestamp = std::chrono::steady_clock::now();
}

DataStore::~DataStore() {
    stop();
}

void DataStore::start() {
    if (running_) return;

    spdlog::info("data store: polling {} every {}ms", provider_.name(), refresh_interval_ms_.load());
    running_ = true;
    collection_thread_ = std::thread(&DataStore::collection_thread_func, this);
}

void DataStore::stop() {
    if (!running_) return;

    {
        std::lock_guard lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (collection_thread_.joinable()) {
        collection_thread_.join();
    }
    spdlog::debug("data store: stopped");
}

void DataStore::set_refresh_interval(const std::chrono::milliseconds interval) {
    refresh_interval_ms_ = std::max<std::chrono::milliseconds::rep>(interval.count(), 1);
    cv_.notify_all();
}

std::chrono::milliseconds DataStore::get_refresh_interval() const {
    return std::chrono::milliseconds(refresh_interval_ms_.load());
}

std::shared_ptr<DataSnapshot> DataStore::get_snapshot() const {
    std::lock_guard lock(data_mutex_);
    return current_snapshot_;
}

void DataStore::refresh_now() {
    {
        std::lock_guard lock(cv_mutex_);
        refresh_requested_ = true;
    }
    cv_.notify_all();
}

bool DataStore::collect_now() {
    return collect_data();
}

void DataStore::pause() {
    paused_ = true;
}

void DataStore::resume() {
    paused_ = false;
    cv_.notify_all();
}

bool DataStore::is_paused() const {
    return paused_;
}

void DataStore::set_on_data_updated(std::function<void()> callback) {
    std::lock_guard lock(data_mutex_);
    on_data_updated_ = std::move(callback);
}

void DataStore::collection_thread_func() {
    collect_data();

    while (running_) {
        bool forced = false;
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, get_refresh_interval(), [this] {
                return !running_ || refresh_requested_;
            });
            forced = refresh_requested_.exchange(false);
        }

        // A manual refresh goes through even while paused
        if (running_ && (forced || !paused_)) {
            collect_data();
        }
    }
}

bool DataStore::collect_data() {
    std::lock_guard fetch_lock(fetch_mutex_);

    ProviderSnapshot fetched;
    try {
        fetched = provider_.fetch();
    } catch (const std::exception& e) {
        spdlog::warn("data store: fetch from {} failed: {}", provider_.name(), e.what());
        add_error(e.what());
        return false;
    }

    auto new_snapshot = std::make_shared<DataSnapshot>();
    new_snapshot->accounts = std::move(fetched.accounts);
    new_snapshot->projections = std::move(fetched.projections);
    new_snapshot->history = std::move(fetched.history);
    new_snapshot->initial_loading = false;
    new_snapshot->fetched_at = std::chrono::system_clock::now();
    new_snapshot->timestamp = std::chrono::steady_clock::now();

    std::function<void()> callback;
    {
        std::lock_guard lock(data_mutex_);
        new_snapshot->generation = current_snapshot_->generation + 1;
        current_snapshot_ = new_snapshot;
        callback = on_data_updated_;
    }
    spdlog::debug("data store: snapshot {} with {} accounts", new_snapshot->generation,
                  new_snapshot->accounts.size());

    // Notify callback outside of lock
    if (callback) {
        callback();
    }
    return true;
}

void DataStore::add_error(const std::string& message) {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::system_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<ProviderError> DataStore::get_recent_errors() const {
    std::lock_guard lock(errors_mutex_);
    const auto cutoff = std::chrono::system_clock::now() - kErrorWindow;
    std::vector<ProviderError> result;
    std::ranges::copy_if(recent_errors_, std::back_inserter(result),
                         [cutoff](const ProviderError& err) { return err.timestamp >= cutoff; });
    return result;
}

} // namespace quotadash
