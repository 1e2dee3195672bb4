#pragma once

#include <chrono>
#include <string>

namespace quotadash {

// Failed fetch surfaced from the data provider to the status bar
struct ProviderError {
    std::chrono::system_clock::time_point timestamp;
    std::string message;
};

} // namespace quotadash
