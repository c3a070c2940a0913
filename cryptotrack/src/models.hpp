#pragma once

#include <string>
#include <optional>
#include <cstdint>

struct AssetQuote {
    std::string id;
    double price = 0.0;
    double change_24h = 0.0;
    std::optional<int64_t> last_updated;  // unix seconds
    std::optional<double> market_cap;
    std::optional<double> volume_24h;
};

struct MarketEntry {
    std::string id;
    std::string symbol;
    std::string name;
    double current_price = 0.0;
    double change_24h = 0.0;
    double market_cap = 0.0;
    double volume_24h = 0.0;
};

struct SearchResult {
    std::string id;
    std::string name;
    std::string symbol;
};
