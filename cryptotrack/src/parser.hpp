#pragma once

#include <string>
#include <vector>
#include <optional>

enum class CommandType {
    Top,
    Price,
    Search,
    Watch,
    Help,
    Quit
};

struct ParsedCommand {
    CommandType type = CommandType::Help;
    std::string cmd;
    std::vector<std::string> args;
    std::optional<int> count;     // top
    std::optional<int> interval;  // watch
    std::optional<std::string> error;

    bool is_valid() const { return !error.has_value(); }
};

class CommandParser {
public:
    static constexpr int DEFAULT_TOP_COUNT = 10;

    // Parses one line of interactive input, e.g. "top 20" or "watch bitcoin 15".
    static ParsedCommand parse(const std::string& text);

    static ParsedCommand make_top(int count);
    static ParsedCommand make_price(const std::string& asset_id);
    static ParsedCommand make_search(const std::string& query);
    static ParsedCommand make_watch(const std::string& asset_id, std::optional<int> interval);

    // One rule for every entry point: an integer in [1, 250].
    static std::optional<std::string> validate_count(int count);
    static std::optional<std::string> validate_interval(int interval);

private:
    static bool is_quit(const std::string& cmd);
};
