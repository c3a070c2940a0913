#pragma once

#include "parser.hpp"
#include "price_client.hpp"
#include "renderer.hpp"
#include "clock.hpp"
#include "cancel_token.hpp"
#include <istream>
#include <string>

class CommandDispatcher {
public:
    CommandDispatcher(PriceClient& client,
                      Renderer& renderer,
                      Clock& clock,
                      CancelToken& cancel,
                      int default_interval_seconds = 30);

    // Executes one command. Returns false when the command asks to quit.
    // Errors are reported through the renderer, never thrown.
    bool dispatch(const ParsedCommand& command, bool interactive = false);

    // Read-eval loop; returns on quit, end of input or interrupt.
    void run_interactive(std::istream& in);

    void run_top(int count);
    void run_price(const std::string& asset_id);
    void run_search(const std::string& query, bool numbered);
    void run_watch(const std::string& asset_id, int interval_seconds);

    void print_help();

private:
    PriceClient& client_;
    Renderer& renderer_;
    Clock& clock_;
    CancelToken& cancel_;
    int default_interval_seconds_;
};
