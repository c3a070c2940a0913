#include "cli.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

int CliOptions::mode_count() const {
    return (top ? 1 : 0) + (price ? 1 : 0) + (search ? 1 : 0)
         + (watch ? 1 : 0) + (interactive ? 1 : 0);
}

CliOptions parse_cli(int argc, char** argv) {
    CliOptions cfg;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_string = [&](std::optional<std::string>& value) {
            if (i + 1 >= argc) {
                throw InvalidInput("option " + arg + " requires a value");
            }
            value = argv[++i];
        };
        auto next_int = [&](std::optional<int>& value) {
            std::optional<std::string> raw;
            next_string(raw);
            int parsed = 0;
            if (!util::parse_int(*raw, parsed)) {
                throw InvalidInput("option " + arg + " expects an integer, got '" + *raw + "'");
            }
            value = parsed;
        };

        if (arg == "--top" || arg == "-t") {
            next_int(cfg.top);
        } else if (arg == "--price" || arg == "-p") {
            next_string(cfg.price);
        } else if (arg == "--search" || arg == "-s") {
            next_string(cfg.search);
        } else if (arg == "--watch" || arg == "-w") {
            next_string(cfg.watch);
        } else if (arg == "--interval" || arg == "-i") {
            next_int(cfg.interval);
        } else if (arg == "--currency" || arg == "-c") {
            next_string(cfg.currency);
        } else if (arg == "--interactive") {
            cfg.interactive = true;
        } else if (arg == "--no-color") {
            cfg.no_color = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.help = true;
        } else {
            throw InvalidInput("unknown option: " + arg);
        }
    }
    return cfg;
}

std::optional<ParsedCommand> command_from_cli(const CliOptions& opts) {
    if (opts.mode_count() > 1) {
        throw InvalidInput("--top, --price, --search, --watch and --interactive are mutually exclusive");
    }
    if (opts.interval && !opts.watch) {
        spdlog::warn("--interval only applies to --watch, ignoring");
    }

    if (opts.top) return CommandParser::make_top(*opts.top);
    if (opts.price) return CommandParser::make_price(*opts.price);
    if (opts.search) return CommandParser::make_search(*opts.search);
    if (opts.watch) return CommandParser::make_watch(*opts.watch, opts.interval);
    return std::nullopt;
}

std::string usage_text() {
    return "CryptoTrack - Live Cryptocurrency Rates CLI\n"
           "\n"
           "Usage: cryptotrack [options]\n"
           "  -t, --top N             Show top N cryptocurrencies by market cap\n"
           "  -p, --price ID          Get price of a cryptocurrency (use coin ID)\n"
           "  -s, --search QUERY      Search for cryptocurrencies\n"
           "  -w, --watch ID          Watch a cryptocurrency with live updates\n"
           "  -i, --interval SECONDS  Update interval for --watch (default: 30)\n"
           "      --interactive       Run in interactive mode\n"
           "  -c, --currency CODE     Quote currency (default: usd)\n"
           "      --no-color          Disable colored output\n"
           "  -h, --help              Show this help\n";
}

std::string examples_text() {
    return "\nUsage examples:\n"
           "  cryptotrack --top 20\n"
           "  cryptotrack --price bitcoin\n"
           "  cryptotrack --search ethereum\n"
           "  cryptotrack --watch bitcoin\n"
           "  cryptotrack --interactive\n";
}
