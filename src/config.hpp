#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace quotadash {

// Bad command line; main prints usage and exits with 2
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    std::chrono::milliseconds refresh_interval{30000};
    int demo_accounts = 3;
    uint32_t seed = 42;
    std::string log_file = "quotadash.log";
    std::string log_level = "info";

    bool snapshot_mode = false;
    bool show_history = false;
    bool show_help = false;
    int width = 0;  // 0: use the terminal width

    // Rejected environment values, logged once logging is up
    std::vector<std::string> warnings;
};

using EnvLookup = std::function<const char*(const char*)>;

// Environment first, then flags. Throws ConfigError on unknown flags or bad flag values.
Config load_config(int argc, const char* const argv[], const EnvLookup& env = {});

// "500ms", "30s", "1m" or bare seconds; nullopt when malformed or not positive
std::optional<std::chrono::milliseconds> parse_interval(std::string_view text);

std::string usage_text(std::string_view program);

} // namespace quotadash
