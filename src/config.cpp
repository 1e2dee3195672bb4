#include "config.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <limits>

namespace quotadash {

namespace {

constexpr int kMinAccounts = 1;
constexpr int kMaxAccounts = 12;
constexpr int kMinWidth = 20;

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

int parse_flag_int(std::string_view flag, std::string_view value) {
    const auto parsed = parse_number<int>(value);
    if (!parsed) {
        throw ConfigError(std::format("{} expects a number, got '{}'", flag, value));
    }
    return *parsed;
}

void apply_environment(Config& config, const EnvLookup& env) {
    if (const char* value = env("QUOTADASH_REFRESH_INTERVAL")) {
        if (auto interval = parse_interval(value)) {
            config.refresh_interval = *interval;
        } else {
            config.warnings.push_back(std::format("ignoring QUOTADASH_REFRESH_INTERVAL='{}'", value));
        }
    }
    if (const char* value = env("QUOTADASH_DEMO_ACCOUNTS")) {
        if (auto accounts = parse_number<int>(value)) {
            config.demo_accounts = std::clamp(*accounts, kMinAccounts, kMaxAccounts);
        } else {
            config.warnings.push_back(std::format("ignoring QUOTADASH_DEMO_ACCOUNTS='{}'", value));
        }
    }
    if (const char* value = env("QUOTADASH_SEED")) {
        if (auto seed = parse_number<uint32_t>(value)) {
            config.seed = *seed;
        } else {
            config.warnings.push_back(std::format("ignoring QUOTADASH_SEED='{}'", value));
        }
    }
    if (const char* value = env("QUOTADASH_LOG_FILE"); value && *value) {
        config.log_file = value;
    }
    if (const char* value = env("QUOTADASH_LOG_LEVEL"); value && *value) {
        config.log_level = value;
    }
}

} // namespace

std::optional<std::chrono::milliseconds> parse_interval(std::string_view text) {
    int64_t multiplier = 1000;
    if (text.ends_with("ms")) {
        multiplier = 1;
        text.remove_suffix(2);
    } else if (text.ends_with('s')) {
        text.remove_suffix(1);
    } else if (text.ends_with('m')) {
        multiplier = 60 * 1000;
        text.remove_suffix(1);
    }

    const auto value = parse_number<int64_t>(text);
    if (!value || *value <= 0) return std::nullopt;
    if (*value > std::numeric_limits<int64_t>::max() / multiplier) return std::nullopt;
    return std::chrono::milliseconds(*value * multiplier);
}

Config load_config(const int argc, const char* const argv[], const EnvLookup& env) {
    Config config;
    apply_environment(config, env ? env : EnvLookup([](const char* name) { return std::getenv(name); }));

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        // Flags taking a value accept "--flag N" and "--flag=N"
        auto take_value = [&](std::string_view flag) -> std::optional<std::string_view> {
            if (arg == flag) {
                if (i + 1 >= argc) throw ConfigError(std::format("{} requires a value", flag));
                return std::string_view(argv[++i]);
            }
            if (arg.starts_with(flag) && arg.size() > flag.size() && arg[flag.size()] == '=') {
                return arg.substr(flag.size() + 1);
            }
            return std::nullopt;
        };

        if (arg == "--snapshot") {
            config.snapshot_mode = true;
        } else if (arg == "--history") {
            config.show_history = true;
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (auto width = take_value("--width")) {
            config.width = std::max(parse_flag_int("--width", *width), kMinWidth);
        } else if (auto accounts = take_value("--accounts")) {
            config.demo_accounts = std::clamp(parse_flag_int("--accounts", *accounts), kMinAccounts, kMaxAccounts);
        } else {
            throw ConfigError(std::format("unknown option '{}'", arg));
        }
    }
    return config;
}

std::string usage_text(std::string_view program) {
    return std::format(
        "Usage: {} [options]\n"
        "\n"
        "Options:\n"
        "  --snapshot      Print one dashboard frame to stdout and exit\n"
        "  --history       Include the history cards (snapshot mode)\n"
        "  --width N       Render width in columns (default: terminal width)\n"
        "  --accounts N    Number of demo accounts, 1-12 (default: 3)\n"
        "  -h, --help      Show this help\n"
        "\n"
        "Environment:\n"
        "  QUOTADASH_REFRESH_INTERVAL   Poll interval: 500ms, 30s, 1m or seconds (default: 30s)\n"
        "  QUOTADASH_DEMO_ACCOUNTS      Number of demo accounts (default: 3)\n"
        "  QUOTADASH_SEED               Demo data seed (default: 42)\n"
        "  QUOTADASH_LOG_FILE           Log file in TUI mode (default: quotadash.log)\n"
        "  QUOTADASH_LOG_LEVEL          trace, debug, info, warn, error, critical, off (default: info)\n",
        program);
}

} // namespace quotadash
