#include <catch2/catch_test_macros.hpp>
#include "../src/refresh_loop.hpp"
#include "stubs.hpp"
#include <sstream>
#include <thread>

namespace {

// Records the loop state seen from inside each fetch.
class ObservingClient : public StubPriceClient {
public:
    using StubPriceClient::StubPriceClient;

    AssetQuote fetch_quote(const std::string& asset_id) override {
        if (loop) states.push_back(loop->state());
        if (cancel_on_call > 0 && quote_calls + 1 == cancel_on_call && token) {
            token->cancel();
        }
        return StubPriceClient::fetch_quote(asset_id);
    }

    const RefreshLoop* loop = nullptr;
    std::vector<WatchState> states;
    CancelToken* token = nullptr;
    int cancel_on_call = 0;
};

} // namespace

TEST_CASE("Watch loop keeps running through failures", "[refresh_loop]") {
    CancelToken cancel;
    FakeClock clock(&cancel, 5);
    ObservingClient client(StubPriceClient::Mode::NetworkFailure, &clock);
    std::ostringstream out;
    Renderer renderer(out, false);

    RefreshLoop loop(client, renderer, clock, cancel);
    client.loop = &loop;
    REQUIRE(loop.state() == WatchState::Idle);

    loop.start("bitcoin", 30);

    SECTION("Only cancellation ends the session") {
        REQUIRE(loop.state() == WatchState::Stopped);
        REQUIRE(client.states.size() == 5);
        for (auto s : client.states) {
            REQUIRE(s == WatchState::Running);
        }
    }

    SECTION("Every failed cycle is followed by a full interval sleep") {
        REQUIRE(client.quote_calls == 5);
        REQUIRE(clock.sleeps == 5);
        REQUIRE(client.call_times.size() == 5);
        for (size_t i = 0; i < client.call_times.size(); i++) {
            REQUIRE(client.call_times[i] == std::chrono::seconds(30 * static_cast<int>(i)));
        }
        REQUIRE(loop.session().failed_cycles == 5);
    }

    SECTION("Nothing is rendered for failed cycles") {
        auto text = out.str();
        REQUIRE(text.find('\r') == std::string::npos);
        REQUIRE(count_occurrences(text, "Stopped watching.") == 1);
    }
}

TEST_CASE("Watch loop skips not-found cycles", "[refresh_loop]") {
    CancelToken cancel;
    FakeClock clock(&cancel, 3);
    StubPriceClient client(StubPriceClient::Mode::NotFoundFailure, &clock);
    std::ostringstream out;
    Renderer renderer(out, false);

    RefreshLoop loop(client, renderer, clock, cancel);
    loop.start("notacoin", 10);

    REQUIRE(loop.state() == WatchState::Stopped);
    REQUIRE(client.quote_calls == 3);
    REQUIRE(out.str().find('\r') == std::string::npos);
}

TEST_CASE("Cancellation during sleep", "[refresh_loop]") {
    CancelToken cancel;
    FakeClock clock(&cancel, 3);
    StubPriceClient client(StubPriceClient::Mode::Succeed, &clock);
    std::ostringstream out;
    Renderer renderer(out, false);

    RefreshLoop loop(client, renderer, clock, cancel);
    loop.start("ethereum", 20);

    auto text = out.str();

    REQUIRE(loop.state() == WatchState::Stopped);
    REQUIRE_FALSE(loop.session().is_running);
    // Stopped inside the third interval, no further fetch afterwards.
    REQUIRE(client.quote_calls == 3);
    REQUIRE(clock.elapsed < std::chrono::seconds(3 * 20));
    REQUIRE(count_occurrences(text, "\r[") == 3);
    REQUIRE(count_occurrences(text, "ETHEREUM: $43,250.50 (+1.50%)") == 3);
    REQUIRE(count_occurrences(text, "Stopped watching.") == 1);
    REQUIRE(text.find("Watching ETHEREUM - Press Ctrl+C to stop") != std::string::npos);
    REQUIRE(text.find("Update interval: 20 seconds") != std::string::npos);
}

TEST_CASE("Cancellation during a request abandons the cycle", "[refresh_loop]") {
    CancelToken cancel;
    FakeClock clock;
    ObservingClient client(StubPriceClient::Mode::Succeed, &clock);
    client.token = &cancel;
    client.cancel_on_call = 2;
    std::ostringstream out;
    Renderer renderer(out, false);

    RefreshLoop loop(client, renderer, clock, cancel);
    loop.start("bitcoin", 5);

    REQUIRE(loop.state() == WatchState::Stopped);
    REQUIRE(client.quote_calls == 2);
    REQUIRE(clock.sleeps == 1);
    REQUIRE(count_occurrences(out.str(), "\r[") == 1);
    REQUIRE(count_occurrences(out.str(), "Stopped watching.") == 1);
}

TEST_CASE("Watch session lifecycle", "[refresh_loop]") {
    CancelToken cancel;
    FakeClock clock(&cancel, 1);
    StubPriceClient client;
    std::ostringstream out;
    Renderer renderer(out, false);

    SECTION("Non-positive interval is normalized to one second") {
        RefreshLoop loop(client, renderer, clock, cancel);
        loop.start("bitcoin", 0);
        REQUIRE(loop.session().interval_seconds == 1);
        REQUIRE(RefreshLoop::normalize_interval(-5) == 1);
        REQUIRE(RefreshLoop::normalize_interval(15) == 15);
    }

    SECTION("A session is entered only once") {
        RefreshLoop loop(client, renderer, clock, cancel);
        loop.start("bitcoin", 1);
        REQUIRE_THROWS_AS(loop.start("bitcoin", 1), std::logic_error);
        REQUIRE(loop.state() == WatchState::Stopped);
    }

    SECTION("Already cancelled token stops without fetching") {
        cancel.cancel();
        RefreshLoop loop(client, renderer, clock, cancel);
        loop.start("bitcoin", 1);
        REQUIRE(loop.state() == WatchState::Stopped);
        REQUIRE(client.quote_calls == 0);
        REQUIRE(count_occurrences(out.str(), "Stopped watching.") == 1);
    }
}

TEST_CASE("System clock wakes up on cancel", "[clock]") {
    SystemClock clock(std::chrono::milliseconds(10));
    CancelToken cancel;

    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });

    auto begin = std::chrono::steady_clock::now();
    clock.sleep_for(std::chrono::seconds(30), cancel);
    auto waited = std::chrono::steady_clock::now() - begin;
    canceller.join();

    REQUIRE(cancel.is_cancelled());
    REQUIRE(waited < std::chrono::seconds(5));
}
