#include "formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>

std::string Formatter::group_thousands(const std::string& fixed) {
    size_t start = (!fixed.empty() && fixed[0] == '-') ? 1 : 0;
    size_t dot = fixed.find('.');
    size_t int_end = (dot == std::string::npos) ? fixed.size() : dot;

    std::string out = fixed.substr(0, start);
    for (size_t i = start; i < int_end; i++) {
        out += fixed[i];
        size_t left = int_end - i - 1;
        if (left > 0 && left % 3 == 0) {
            out += ',';
        }
    }
    out += fixed.substr(int_end);
    return out;
}

std::string Formatter::format_price(double value, const std::string& symbol) {
    if (value >= 1000.0) {
        return symbol + group_thousands(fmt::format("{:.2f}", value));
    }
    if (value >= 1.0) {
        return symbol + fmt::format("{:.4f}", value);
    }
    return symbol + fmt::format("{:.8f}", value);
}

StyledText Formatter::format_change(double percent) {
    if (percent > 0.0) {
        return {fmt::format("+{:.2f}%", percent), ChangeStyle::Positive};
    }
    if (percent < 0.0) {
        return {fmt::format("{:.2f}%", percent), ChangeStyle::Negative};
    }
    return {"0.00%", ChangeStyle::Neutral};
}

std::string Formatter::format_large_amount(std::optional<double> value,
                                           const std::string& symbol) {
    if (!value.has_value() || *value <= 0.0) {
        return "N/A";
    }
    return symbol + group_thousands(fmt::format("{:.0f}", *value));
}

std::string Formatter::truncate_name(const std::string& name) {
    if (util::utf8_length(name) <= NAME_MAX_CHARS) {
        return name;
    }
    return util::utf8_prefix(name, NAME_MAX_CHARS) + "..";
}

std::string Formatter::pad_right(const std::string& text, size_t width) {
    return fmt::format("{:<{}}", text, width);
}

std::string Formatter::currency_symbol(const std::string& vs_currency) {
    std::string code = util::to_lower(vs_currency);
    if (code == "usd") return "$";
    if (code == "eur") return "€";
    if (code == "gbp") return "£";
    if (code == "jpy") return "¥";
    if (code == "inr") return "₹";
    return util::to_upper(code) + " ";
}
