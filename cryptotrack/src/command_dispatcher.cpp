#include "command_dispatcher.hpp"
#include "refresh_loop.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

CommandDispatcher::CommandDispatcher(PriceClient& client,
                                     Renderer& renderer,
                                     Clock& clock,
                                     CancelToken& cancel,
                                     int default_interval_seconds)
    : client_(client)
    , renderer_(renderer)
    , clock_(clock)
    , cancel_(cancel)
    , default_interval_seconds_(default_interval_seconds)
{}

bool CommandDispatcher::dispatch(const ParsedCommand& command, bool interactive) {
    if (!command.is_valid()) {
        renderer_.render_error(*command.error);
        return true;
    }

    try {
        switch (command.type) {
            case CommandType::Quit:
                return false;
            case CommandType::Help:
                print_help();
                break;
            case CommandType::Top:
                run_top(command.count.value_or(CommandParser::DEFAULT_TOP_COUNT));
                break;
            case CommandType::Price:
                run_price(command.args.at(0));
                break;
            case CommandType::Search:
                run_search(command.args.at(0), interactive);
                break;
            case CommandType::Watch:
                run_watch(command.args.at(0), command.interval.value_or(default_interval_seconds_));
                break;
        }
    } catch (const NotFound& e) {
        spdlog::debug("{}: {}", command.cmd, e.what());
        renderer_.render_line("Cryptocurrency not found.");
    } catch (const CryptoTrackError& e) {
        spdlog::debug("{} failed: {}", command.cmd, e.what());
        renderer_.render_error(e.what());
    }

    return true;
}

void CommandDispatcher::run_top(int count) {
    auto entries = client_.fetch_top_markets(count);
    if (entries.empty()) {
        renderer_.render_line("No market data returned.");
        return;
    }
    renderer_.render_line();
    renderer_.render_table(entries);
}

void CommandDispatcher::run_price(const std::string& asset_id) {
    renderer_.render_quote(client_.fetch_quote(asset_id));
}

void CommandDispatcher::run_search(const std::string& query, bool numbered) {
    auto results = client_.search(query);
    if (results.empty()) {
        renderer_.render_line("No results found.");
        return;
    }
    if (numbered) {
        renderer_.render_line();
    }
    renderer_.render_line("Search results for '" + query + "':");
    renderer_.render_search_results(results, numbered);
}

void CommandDispatcher::run_watch(const std::string& asset_id, int interval_seconds) {
    if (auto error = CommandParser::validate_interval(interval_seconds)) {
        throw InvalidInput(*error);
    }

    // Each watch gets a fresh session; an interrupt ends it and is then
    // consumed so an interactive caller keeps prompting.
    cancel_.reset();
    RefreshLoop loop(client_, renderer_, clock_, cancel_);
    loop.start(asset_id, interval_seconds);
    cancel_.reset();
}

void CommandDispatcher::print_help() {
    renderer_.render_line("Commands: top [number], search [query], watch [crypto] [seconds], "
                          "price [crypto], help, quit");
}

void CommandDispatcher::run_interactive(std::istream& in) {
    renderer_.render_line("CryptoTrack - Interactive Mode");
    print_help();

    std::string line;
    while (true) {
        renderer_.render_prompt("\ncrypto> ");

        if (!std::getline(in, line) || cancel_.is_cancelled()) {
            renderer_.render_line();
            break;
        }

        if (util::trim(line).empty()) {
            continue;
        }

        if (!dispatch(CommandParser::parse(line), true)) {
            break;
        }

        // Interrupt outside watch mode ends the session.
        if (cancel_.is_cancelled()) {
            renderer_.render_line();
            break;
        }
    }

    spdlog::debug("Interactive session ended");
}
