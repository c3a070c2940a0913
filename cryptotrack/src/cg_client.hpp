#pragma once

#include "price_client.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

class CoinGeckoClient : public PriceClient {
public:
    CoinGeckoClient(const std::string& base_url,
                    const std::string& vs_currency,
                    std::shared_ptr<HttpClient> http);

    AssetQuote fetch_quote(const std::string& asset_id) override;
    std::vector<MarketEntry> fetch_top_markets(int limit) override;
    std::vector<SearchResult> search(const std::string& query) override;

    static AssetQuote parse_quote(const nlohmann::json& body,
                                  const std::string& asset_id,
                                  const std::string& vs_currency);
    static std::vector<MarketEntry> parse_markets(const nlohmann::json& body);
    static std::vector<SearchResult> parse_search(const nlohmann::json& body);

private:
    std::string base_url_;
    std::string vs_currency_;
    std::shared_ptr<HttpClient> http_;

    nlohmann::json make_request(const std::string& endpoint);
};
