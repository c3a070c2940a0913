#pragma once

#include <string>
#include <optional>
#include <cstddef>

enum class ChangeStyle {
    Positive,
    Negative,
    Neutral
};

// Plain display text plus a style hint; how the style is realized is up to
// the renderer.
struct StyledText {
    std::string text;
    ChangeStyle style;
};

class Formatter {
public:
    static constexpr size_t SYMBOL_WIDTH = 8;
    static constexpr size_t NAME_WIDTH = 20;
    static constexpr size_t PRICE_WIDTH = 15;
    static constexpr size_t CHANGE_WIDTH = 12;
    static constexpr size_t MARKET_CAP_WIDTH = 15;
    static constexpr size_t NAME_MAX_CHARS = 18;

    static std::string format_price(double value, const std::string& symbol = "$");
    static StyledText format_change(double percent);
    static std::string format_large_amount(std::optional<double> value,
                                           const std::string& symbol = "$");

    static std::string truncate_name(const std::string& name);
    static std::string pad_right(const std::string& text, size_t width);
    static std::string group_thousands(const std::string& fixed);
    static std::string currency_symbol(const std::string& vs_currency);
};
