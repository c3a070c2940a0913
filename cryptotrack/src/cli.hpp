#pragma once

#include "parser.hpp"
#include <optional>
#include <string>

struct CliOptions {
    std::optional<int> top;
    std::optional<std::string> price;
    std::optional<std::string> search;
    std::optional<std::string> watch;
    std::optional<int> interval;
    std::optional<std::string> currency;
    bool interactive{false};
    bool no_color{false};
    bool help{false};

    int mode_count() const;
};

// Throws InvalidInput for unknown options, missing values and non-integer
// counts.
CliOptions parse_cli(int argc, char** argv);

// Maps the selected mode to a command. Returns nullopt when no mode flag was
// given. Throws InvalidInput when several modes are combined.
std::optional<ParsedCommand> command_from_cli(const CliOptions& opts);

std::string usage_text();
std::string examples_text();
