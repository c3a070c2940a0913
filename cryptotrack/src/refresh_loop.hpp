#pragma once

#include "price_client.hpp"
#include "renderer.hpp"
#include "clock.hpp"
#include "cancel_token.hpp"
#include <string>

enum class WatchState {
    Idle,
    Running,
    Stopped
};

struct WatchSession {
    std::string asset_id;
    int interval_seconds = 0;
    bool is_running = false;
    int cycles = 0;
    int failed_cycles = 0;
};

// Drives watch mode: fetch, render in place, sleep, repeat until the cancel
// token is set. Failed fetches are logged and skipped; there is no retry
// limit and no backoff.
class RefreshLoop {
public:
    RefreshLoop(PriceClient& client,
                Renderer& renderer,
                Clock& clock,
                const CancelToken& cancel);

    // Blocks until cancelled. May only be called once per instance.
    void start(const std::string& asset_id, int interval_seconds);

    WatchState state() const { return state_; }
    const WatchSession& session() const { return session_; }

    static int normalize_interval(int interval_seconds);

private:
    PriceClient& client_;
    Renderer& renderer_;
    Clock& clock_;
    const CancelToken& cancel_;

    WatchState state_ = WatchState::Idle;
    WatchSession session_;

    void run_cycle();
};
