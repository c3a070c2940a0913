#pragma once

#include "models.hpp"
#include <string>
#include <vector>
#include <cstddef>

class PriceClient {
public:
    virtual ~PriceClient() = default;

    // Throws NetworkError, or NotFound when the asset id is unknown.
    virtual AssetQuote fetch_quote(const std::string& asset_id) = 0;

    // Entries in API order (descending market cap). Throws NetworkError,
    // or InvalidInput for a limit outside [1, max_page_size].
    virtual std::vector<MarketEntry> fetch_top_markets(int limit) = 0;

    // At most max_search_results matches, upstream order. Throws NetworkError.
    virtual std::vector<SearchResult> search(const std::string& query) = 0;

    static constexpr int max_page_size = 250;
    static constexpr size_t max_search_results = 10;
};
