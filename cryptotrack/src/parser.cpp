#include "parser.hpp"
#include "price_client.hpp"
#include "util.hpp"

bool CommandParser::is_quit(const std::string& cmd) {
    return cmd == "quit" || cmd == "exit" || cmd == "q";
}

std::optional<std::string> CommandParser::validate_count(int count) {
    if (count < 1 || count > PriceClient::max_page_size) {
        return "count must be between 1 and " + std::to_string(PriceClient::max_page_size);
    }
    return std::nullopt;
}

std::optional<std::string> CommandParser::validate_interval(int interval) {
    if (interval < 1) {
        return "interval must be a positive number of seconds";
    }
    return std::nullopt;
}

ParsedCommand CommandParser::make_top(int count) {
    ParsedCommand result;
    result.type = CommandType::Top;
    result.cmd = "top";
    result.count = count;
    result.error = validate_count(count);
    return result;
}

ParsedCommand CommandParser::make_price(const std::string& asset_id) {
    ParsedCommand result;
    result.type = CommandType::Price;
    result.cmd = "price";
    std::string id = util::to_lower(util::trim(asset_id));
    if (id.empty()) {
        result.error = "Usage: price <id>";
    } else {
        result.args.push_back(id);
    }
    return result;
}

ParsedCommand CommandParser::make_search(const std::string& query) {
    ParsedCommand result;
    result.type = CommandType::Search;
    result.cmd = "search";
    std::string q = util::trim(query);
    if (q.empty()) {
        result.error = "Usage: search <query>";
    } else {
        result.args.push_back(q);
    }
    return result;
}

ParsedCommand CommandParser::make_watch(const std::string& asset_id, std::optional<int> interval) {
    ParsedCommand result;
    result.type = CommandType::Watch;
    result.cmd = "watch";
    result.interval = interval;
    std::string id = util::to_lower(util::trim(asset_id));
    if (id.empty()) {
        result.error = "Usage: watch <id> [seconds]";
        return result;
    }
    result.args.push_back(id);
    if (interval) {
        result.error = validate_interval(*interval);
    }
    return result;
}

ParsedCommand CommandParser::parse(const std::string& text) {
    ParsedCommand result;

    std::string trimmed = util::trim(text);
    if (trimmed.empty()) {
        result.error = "Empty command";
        return result;
    }

    std::vector<std::string> tokens;
    for (const auto& t : util::split(trimmed, ' ')) {
        std::string token = util::trim(t);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    std::string cmd = util::to_lower(tokens[0]);
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    if (is_quit(cmd)) {
        result.type = CommandType::Quit;
        result.cmd = cmd;
        return result;
    }

    if (cmd == "help") {
        result.type = CommandType::Help;
        result.cmd = cmd;
        return result;
    }

    if (cmd == "top") {
        if (args.empty()) {
            return make_top(DEFAULT_TOP_COUNT);
        }
        int count = 0;
        if (args.size() > 1 || !util::parse_int(args[0], count)) {
            result.type = CommandType::Top;
            result.cmd = cmd;
            result.error = "Usage: top [count]";
            return result;
        }
        return make_top(count);
    }

    if (cmd == "price") {
        if (args.size() != 1) {
            return make_price("");
        }
        return make_price(args[0]);
    }

    if (cmd == "search") {
        std::string query;
        for (const auto& a : args) {
            if (!query.empty()) query += " ";
            query += a;
        }
        return make_search(query);
    }

    if (cmd == "watch") {
        if (args.empty() || args.size() > 2) {
            return make_watch("", std::nullopt);
        }
        std::optional<int> interval;
        if (args.size() == 2) {
            int seconds = 0;
            if (!util::parse_int(args[1], seconds)) {
                result.type = CommandType::Watch;
                result.cmd = cmd;
                result.error = "Usage: watch <id> [seconds]";
                return result;
            }
            interval = seconds;
        }
        return make_watch(args[0], interval);
    }

    result.cmd = cmd;
    result.error = "Unknown command: " + cmd + ". Type 'help' for commands or 'quit' to exit.";
    return result;
}
