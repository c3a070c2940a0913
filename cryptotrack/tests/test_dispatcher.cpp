#include <catch2/catch_test_macros.hpp>
#include "../src/command_dispatcher.hpp"
#include "../src/cg_client.hpp"
#include "../src/util.hpp"
#include "stubs.hpp"
#include <memory>
#include <sstream>

namespace {

const char* THREE_MARKETS = R"([
    {"id":"bitcoin","symbol":"btc","name":"Bitcoin","current_price":64000.0,
     "price_change_percentage_24h":1.2,"market_cap":1260000000000,"total_volume":30000000000},
    {"id":"ethereum","symbol":"eth","name":"Ethereum","current_price":3100.25,
     "price_change_percentage_24h":-2.5,"market_cap":372000000000,"total_volume":15000000000},
    {"id":"wrapped-steth","symbol":"wsteth","name":"Wrapped Liquid Staked Ether 2.0","current_price":0.75,
     "price_change_percentage_24h":0,"market_cap":0,"total_volume":0}
])";

std::vector<std::string> non_empty_lines(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& line : util::split(text, '\n')) {
        if (!util::trim(line).empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

struct Harness {
    std::shared_ptr<StubHttpClient> http = std::make_shared<StubHttpClient>();
    CoinGeckoClient client{"https://api.example.test/api/v3", "usd", http};
    std::ostringstream out;
    Renderer renderer{out, false};
    CancelToken cancel;
    FakeClock clock{&cancel, 2};
    CommandDispatcher dispatcher{client, renderer, clock, cancel, 30};
};

} // namespace

TEST_CASE("Command parsing", "[parser]") {
    SECTION("Valid commands") {
        auto top = CommandParser::parse("top 20");
        REQUIRE(top.is_valid());
        REQUIRE(top.type == CommandType::Top);
        REQUIRE(*top.count == 20);

        auto top_default = CommandParser::parse("TOP");
        REQUIRE(top_default.is_valid());
        REQUIRE(*top_default.count == CommandParser::DEFAULT_TOP_COUNT);

        auto price = CommandParser::parse("  price Bitcoin ");
        REQUIRE(price.is_valid());
        REQUIRE(price.type == CommandType::Price);
        REQUIRE(price.args[0] == "bitcoin");

        auto search = CommandParser::parse("search shiba inu");
        REQUIRE(search.is_valid());
        REQUIRE(search.args[0] == "shiba inu");

        auto watch = CommandParser::parse("watch solana 15");
        REQUIRE(watch.is_valid());
        REQUIRE(watch.type == CommandType::Watch);
        REQUIRE(watch.args[0] == "solana");
        REQUIRE(*watch.interval == 15);
    }

    SECTION("Quit aliases are case-insensitive") {
        REQUIRE(CommandParser::parse("quit").type == CommandType::Quit);
        REQUIRE(CommandParser::parse("EXIT").type == CommandType::Quit);
        REQUIRE(CommandParser::parse("Q").type == CommandType::Quit);
    }

    SECTION("Invalid commands") {
        REQUIRE_FALSE(CommandParser::parse("hello").is_valid());
        REQUIRE_FALSE(CommandParser::parse("top abc").is_valid());
        REQUIRE_FALSE(CommandParser::parse("top -5").is_valid());
        REQUIRE_FALSE(CommandParser::parse("top 0").is_valid());
        REQUIRE_FALSE(CommandParser::parse("price").is_valid());
        REQUIRE_FALSE(CommandParser::parse("search").is_valid());
        REQUIRE_FALSE(CommandParser::parse("watch").is_valid());
        REQUIRE_FALSE(CommandParser::parse("watch bitcoin soon").is_valid());
        REQUIRE_FALSE(CommandParser::parse("watch bitcoin 0").is_valid());
    }
}

TEST_CASE("Top table end to end", "[dispatcher]") {
    Harness h;
    h.http->push(200, THREE_MARKETS);

    h.dispatcher.dispatch(CommandParser::parse("top 3"));

    auto lines = non_empty_lines(h.out.str());
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0].rfind("Symbol   Name", 0) == 0);
    REQUIRE(lines[1].rfind("BTC      Bitcoin", 0) == 0);
    REQUIRE(lines[2].rfind("ETH      Ethereum", 0) == 0);
    REQUIRE(lines[3].rfind("WSTETH   Wrapped Liquid Sta.. $0.75000000", 0) == 0);
    REQUIRE(lines[1].find("$64,000.00") != std::string::npos);
    REQUIRE(lines[2].find("-2.50%") != std::string::npos);
    REQUIRE(lines[3].find("N/A") != std::string::npos);
    REQUIRE(h.http->urls.at(0).find("per_page=3") != std::string::npos);
}

TEST_CASE("Dispatcher reports errors and keeps going", "[dispatcher]") {
    Harness h;

    SECTION("Unknown asset prints not found") {
        h.http->push(200, "{}");
        REQUIRE(h.dispatcher.dispatch(CommandParser::parse("price notacoin")));
        REQUIRE(h.out.str().find("Cryptocurrency not found.") != std::string::npos);
    }

    SECTION("Network failure prints an error") {
        h.http->push(500, "oops");
        REQUIRE(h.dispatcher.dispatch(CommandParser::parse("top 5")));
        REQUIRE(h.out.str().find("Error: HTTP error: 500") != std::string::npos);
    }

    SECTION("Invalid count never reaches the network") {
        REQUIRE(h.dispatcher.dispatch(CommandParser::make_top(-1)));
        REQUIRE(h.http->urls.empty());
        REQUIRE(h.out.str().find("Error: count must be between 1 and 250") != std::string::npos);
    }

    SECTION("Empty search result") {
        h.http->push(200, R"({"coins":[]})");
        h.dispatcher.dispatch(CommandParser::parse("search nothing"));
        REQUIRE(h.out.str().find("No results found.") != std::string::npos);
    }

    SECTION("Quit stops dispatch") {
        REQUIRE_FALSE(h.dispatcher.dispatch(CommandParser::parse("q")));
    }
}

TEST_CASE("Single quote view", "[dispatcher]") {
    Harness h;
    h.http->push(200, R"({"solana":{"usd":145.678912,"usd_24h_change":-0.42,
        "usd_market_cap":67000000000.4,"usd_24h_vol":0}})");

    h.dispatcher.dispatch(CommandParser::parse("price solana"));

    auto text = h.out.str();
    REQUIRE(text.find("SOLANA") != std::string::npos);
    REQUIRE(text.find("Price: $145.6789") != std::string::npos);
    REQUIRE(text.find("24h Change: -0.42%") != std::string::npos);
    REQUIRE(text.find("Market Cap: $67,000,000,000") != std::string::npos);
    REQUIRE(text.find("Volume (24h): N/A") != std::string::npos);
}

TEST_CASE("Interactive session", "[dispatcher]") {
    Harness h;
    h.http->push(200, R"({"coins":[{"id":"bitcoin","name":"Bitcoin","symbol":"btc"},
        {"id":"bitcoin-cash","name":"Bitcoin Cash","symbol":"bch"}]})");

    SECTION("Bad input re-prompts and quit ends the loop") {
        std::istringstream in("\nfoo\ntop abc\nsearch bit\nQuit\ntop 3\n");
        h.dispatcher.run_interactive(in);

        auto text = h.out.str();
        REQUIRE(text.find("CryptoTrack - Interactive Mode") != std::string::npos);
        REQUIRE(text.find("Unknown command: foo") != std::string::npos);
        REQUIRE(text.find("Usage: top [count]") != std::string::npos);
        REQUIRE(text.find("1. Bitcoin (BTC) - ID: bitcoin") != std::string::npos);
        REQUIRE(text.find("2. Bitcoin Cash (BCH) - ID: bitcoin-cash") != std::string::npos);
        // Nothing after quit is executed.
        REQUIRE(h.http->urls.size() == 1);
        REQUIRE(count_occurrences(text, "crypto> ") == 5);
    }

    SECTION("End of input ends the loop") {
        std::istringstream in("help\n");
        h.dispatcher.run_interactive(in);
        REQUIRE(count_occurrences(h.out.str(), "Commands: top [number]") == 2);
    }

    SECTION("Interrupting a watch returns to the prompt") {
        h.http->push(200, R"({"bitcoin":{"usd":50000}})");
        std::istringstream in("watch bitcoin 5\nprice bitcoin\nquit\n");
        h.dispatcher.run_interactive(in);

        auto text = h.out.str();
        REQUIRE(count_occurrences(text, "Stopped watching.") == 1);
        REQUIRE(text.find("Price: $50,000.00") != std::string::npos);
        REQUIRE_FALSE(h.cancel.is_cancelled());
    }
}

TEST_CASE("Non-interactive search output", "[dispatcher]") {
    Harness h;
    h.http->push(200, R"({"coins":[{"id":"ethereum","name":"Ethereum","symbol":"eth"}]})");

    h.dispatcher.dispatch(CommandParser::make_search("eth"));

    auto text = h.out.str();
    REQUIRE(text.find("Search results for 'eth':") != std::string::npos);
    REQUIRE(text.find("- Ethereum (ETH) - ID: ethereum") != std::string::npos);
}
