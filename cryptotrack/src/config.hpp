#pragma once

#include <string>
#include <cstdlib>

enum class ColorMode {
    Auto,
    Always,
    Never
};

struct Config {
    // CoinGecko
    std::string coingecko_base;
    std::string vs_currency;
    int request_timeout_ms;

    // Watch mode
    int watch_interval_seconds;

    // Terminal
    ColorMode color_mode;

    // Service
    std::string log_level;

    static Config from_env();
    static std::string log_level_from_env();
    void validate() const;

    bool use_color(bool is_tty) const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
