#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    int parsed = 0;
    if (!util::parse_int(val, parsed)) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
    return parsed;
}

Config Config::from_env() {
    Config cfg;

    cfg.coingecko_base = get_env("COINGECKO_BASE", "https://api.coingecko.com/api/v3");
    cfg.vs_currency = util::to_lower(get_env("VS_CURRENCY", "usd"));
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 10000);

    cfg.watch_interval_seconds = get_env_int("WATCH_INTERVAL_SECONDS", 30);

    std::string color = util::to_lower(get_env("COLOR", "auto"));
    if (color == "always") {
        cfg.color_mode = ColorMode::Always;
    } else if (color == "never") {
        cfg.color_mode = ColorMode::Never;
    } else {
        cfg.color_mode = ColorMode::Auto;
    }
    if (std::getenv("NO_COLOR")) {
        cfg.color_mode = ColorMode::Never;
    }

    cfg.log_level = log_level_from_env();

    return cfg;
}

std::string Config::log_level_from_env() {
    return util::to_lower(get_env("LOG_LEVEL", "warn"));
}

void Config::validate() const {
    if (coingecko_base.empty()) {
        throw InvalidInput("COINGECKO_BASE must not be empty");
    }
    if (vs_currency.empty()) {
        throw InvalidInput("VS_CURRENCY must not be empty");
    }
    if (request_timeout_ms <= 0) {
        throw InvalidInput("REQUEST_TIMEOUT_MS must be positive");
    }
    if (watch_interval_seconds <= 0) {
        throw InvalidInput("WATCH_INTERVAL_SECONDS must be positive");
    }

    spdlog::debug("Configuration validated");
    spdlog::debug("  CoinGecko base: {}", coingecko_base);
    spdlog::debug("  Quote currency: {}, timeout: {}ms", vs_currency, request_timeout_ms);
}

bool Config::use_color(bool is_tty) const {
    switch (color_mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never: return false;
        case ColorMode::Auto: break;
    }
    return is_tty;
}
