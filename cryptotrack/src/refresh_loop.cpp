#include "refresh_loop.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

RefreshLoop::RefreshLoop(PriceClient& client,
                         Renderer& renderer,
                         Clock& clock,
                         const CancelToken& cancel)
    : client_(client)
    , renderer_(renderer)
    , clock_(clock)
    , cancel_(cancel)
{}

int RefreshLoop::normalize_interval(int interval_seconds) {
    return interval_seconds < 1 ? 1 : interval_seconds;
}

void RefreshLoop::start(const std::string& asset_id, int interval_seconds) {
    if (state_ != WatchState::Idle) {
        throw std::logic_error("watch session already started");
    }

    int interval = normalize_interval(interval_seconds);
    if (interval != interval_seconds) {
        spdlog::warn("Watch interval {} is not positive, using {}s", interval_seconds, interval);
    }

    session_.asset_id = asset_id;
    session_.interval_seconds = interval;
    session_.is_running = true;
    state_ = WatchState::Running;

    spdlog::info("Watching {} every {}s", asset_id, interval);
    renderer_.render_watch_header(asset_id, interval);

    while (!cancel_.is_cancelled()) {
        run_cycle();
        if (cancel_.is_cancelled()) break;
        clock_.sleep_for(std::chrono::seconds(interval), cancel_);
    }

    session_.is_running = false;
    state_ = WatchState::Stopped;
    renderer_.render_watch_stopped();
    spdlog::info("Watch session for {} stopped after {} cycles ({} failed)",
                 asset_id, session_.cycles, session_.failed_cycles);
}

void RefreshLoop::run_cycle() {
    session_.cycles++;

    try {
        auto quote = client_.fetch_quote(session_.asset_id);
        // A cancel that lands mid-request abandons the cycle.
        if (cancel_.is_cancelled()) return;
        renderer_.render_watch_line(session_.asset_id, clock_.now(), quote);
    } catch (const NotFound& e) {
        session_.failed_cycles++;
        spdlog::warn("Watch cycle skipped: {}", e.what());
    } catch (const NetworkError& e) {
        session_.failed_cycles++;
        if (!cancel_.is_cancelled()) {
            spdlog::warn("Watch cycle skipped: {}", e.what());
        }
    }
}
