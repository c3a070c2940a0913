#include "config.hpp"
#include "cli.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "cg_client.hpp"
#include "formatter.hpp"
#include "renderer.hpp"
#include "clock.hpp"
#include "cancel_token.hpp"
#include "command_dispatcher.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <unistd.h>
#include <cstring>
#include <iostream>

CancelToken interrupt_token;

void signal_handler(int) {
    interrupt_token.cancel();
}

// No SA_RESTART: a blocked read on stdin returns so the prompt loop can exit.
void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int main(int argc, char* argv[]) {
    try {
        // Before from_env(), whose warnings must already land on stderr.
        setup_logging(Config::log_level_from_env());
        auto config = Config::from_env();

        CliOptions opts;
        std::optional<ParsedCommand> command;
        try {
            opts = parse_cli(argc, argv);
            command = command_from_cli(opts);
        } catch (const InvalidInput& e) {
            std::cout << "Error: " << e.what() << "\n\n" << usage_text();
            return 0;
        }

        if (opts.help) {
            std::cout << usage_text();
            return 0;
        }

        if (opts.currency) {
            config.vs_currency = util::to_lower(*opts.currency);
        }
        if (opts.no_color) {
            config.color_mode = ColorMode::Never;
        }
        config.validate();

        install_signal_handlers();

        auto http = std::make_shared<CurlHttpClient>(config.request_timeout_ms, &interrupt_token);
        CoinGeckoClient client(config.coingecko_base, config.vs_currency, http);
        Renderer renderer(std::cout,
                          config.use_color(isatty(STDOUT_FILENO) == 1),
                          Formatter::currency_symbol(config.vs_currency));
        SystemClock clock;
        CommandDispatcher dispatcher(client, renderer, clock, interrupt_token,
                                     config.watch_interval_seconds);

        if (opts.interactive) {
            dispatcher.run_interactive(std::cin);
        } else if (command) {
            dispatcher.dispatch(*command);
        } else {
            dispatcher.dispatch(CommandParser::make_top(CommandParser::DEFAULT_TOP_COUNT));
            std::cout << examples_text();
        }

        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
