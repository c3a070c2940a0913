#include "cg_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <optional>

namespace {

std::optional<double> number_field(const nlohmann::json& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::string string_field(const nlohmann::json& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

CoinGeckoClient::CoinGeckoClient(const std::string& base_url,
                                 const std::string& vs_currency,
                                 std::shared_ptr<HttpClient> http)
    : base_url_(base_url)
    , vs_currency_(util::to_lower(vs_currency))
    , http_(std::move(http))
{
    if (!http_) {
        throw std::invalid_argument("CoinGeckoClient requires an HTTP client");
    }
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

nlohmann::json CoinGeckoClient::make_request(const std::string& endpoint) {
    auto response = http_->get(base_url_ + endpoint);

    if (!response.ok()) {
        spdlog::debug("CoinGecko returned HTTP {} for {}", response.status, endpoint);
        throw NetworkError("HTTP error: " + std::to_string(response.status));
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("Failed to parse CoinGecko response: {}", e.what());
        throw NetworkError("malformed response from CoinGecko");
    }
}

AssetQuote CoinGeckoClient::fetch_quote(const std::string& asset_id) {
    std::string id = util::to_lower(util::trim(asset_id));
    if (id.empty()) {
        throw InvalidInput("asset id must not be empty");
    }

    std::string endpoint = "/simple/price?ids=" + util::url_encode(id)
        + "&vs_currencies=" + util::url_encode(vs_currency_)
        + "&include_24hr_change=true&include_last_updated_at=true"
        + "&include_market_cap=true&include_24hr_vol=true";

    return parse_quote(make_request(endpoint), id, vs_currency_);
}

std::vector<MarketEntry> CoinGeckoClient::fetch_top_markets(int limit) {
    if (limit < 1 || limit > max_page_size) {
        throw InvalidInput("count must be between 1 and " + std::to_string(max_page_size));
    }

    std::string endpoint = "/coins/markets?vs_currency=" + util::url_encode(vs_currency_)
        + "&order=market_cap_desc&per_page=" + std::to_string(limit)
        + "&page=1&sparkline=false";

    return parse_markets(make_request(endpoint));
}

std::vector<SearchResult> CoinGeckoClient::search(const std::string& query) {
    std::string q = util::trim(query);
    if (q.empty()) {
        throw InvalidInput("search query must not be empty");
    }

    return parse_search(make_request("/search?query=" + util::url_encode(q)));
}

AssetQuote CoinGeckoClient::parse_quote(const nlohmann::json& body,
                                        const std::string& asset_id,
                                        const std::string& vs_currency) {
    if (!body.is_object()) {
        throw NetworkError("unexpected price payload");
    }

    // Unknown ids come back as an empty object with HTTP 200.
    auto it = body.find(asset_id);
    if (it == body.end() || !it->is_object()) {
        throw NotFound("no price data for '" + asset_id + "'");
    }
    const auto& data = *it;

    auto price = number_field(data, vs_currency);
    if (!price) {
        throw NotFound("no " + vs_currency + " price for '" + asset_id + "'");
    }

    AssetQuote quote;
    quote.id = asset_id;
    quote.price = *price;
    quote.change_24h = number_field(data, vs_currency + "_24h_change").value_or(0.0);
    quote.market_cap = number_field(data, vs_currency + "_market_cap");
    quote.volume_24h = number_field(data, vs_currency + "_24h_vol");

    if (auto ts = number_field(data, "last_updated_at")) {
        quote.last_updated = static_cast<int64_t>(*ts);
    }

    return quote;
}

std::vector<MarketEntry> CoinGeckoClient::parse_markets(const nlohmann::json& body) {
    if (!body.is_array()) {
        throw NetworkError("unexpected markets payload");
    }

    std::vector<MarketEntry> entries;
    entries.reserve(body.size());

    for (const auto& item : body) {
        if (!item.is_object()) {
            throw NetworkError("unexpected market record");
        }

        MarketEntry entry;
        entry.id = string_field(item, "id");
        entry.symbol = string_field(item, "symbol");
        entry.name = string_field(item, "name");
        entry.current_price = number_field(item, "current_price").value_or(0.0);
        entry.change_24h = number_field(item, "price_change_percentage_24h").value_or(0.0);
        entry.market_cap = number_field(item, "market_cap").value_or(0.0);
        entry.volume_24h = number_field(item, "total_volume").value_or(0.0);
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::vector<SearchResult> CoinGeckoClient::parse_search(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw NetworkError("unexpected search payload");
    }

    std::vector<SearchResult> results;

    auto coins = body.find("coins");
    if (coins == body.end() || !coins->is_array()) {
        return results;
    }

    for (const auto& coin : *coins) {
        if (results.size() >= max_search_results) break;
        if (!coin.is_object()) continue;

        SearchResult r;
        r.id = string_field(coin, "id");
        r.name = string_field(coin, "name");
        r.symbol = string_field(coin, "symbol");
        results.push_back(std::move(r));
    }

    return results;
}
