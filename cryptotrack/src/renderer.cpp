#include "renderer.hpp"
#include "util.hpp"
#include <fmt/format.h>

namespace {

constexpr const char* ANSI_GREEN = "\033[92m";
constexpr const char* ANSI_RED = "\033[91m";
constexpr const char* ANSI_RESET = "\033[0m";

} // namespace

Renderer::Renderer(std::ostream& out, bool use_color, const std::string& currency_symbol)
    : out_(out)
    , use_color_(use_color)
    , currency_symbol_(currency_symbol)
{}

std::string Renderer::styled(const StyledText& text, size_t width) const {
    std::string padding = Formatter::pad_right(text.text, width).substr(text.text.size());

    if (!use_color_ || text.style == ChangeStyle::Neutral) {
        return text.text + padding;
    }

    const char* color = text.style == ChangeStyle::Positive ? ANSI_GREEN : ANSI_RED;
    return color + text.text + ANSI_RESET + padding;
}

void Renderer::render_quote(const AssetQuote& quote) {
    out_ << "\n" << util::to_upper(quote.id) << "\n";
    out_ << "Price: " << Formatter::format_price(quote.price, currency_symbol_) << "\n";
    out_ << "24h Change: " << styled(Formatter::format_change(quote.change_24h)) << "\n";
    out_ << "Market Cap: " << Formatter::format_large_amount(quote.market_cap, currency_symbol_) << "\n";
    out_ << "Volume (24h): " << Formatter::format_large_amount(quote.volume_24h, currency_symbol_) << "\n";

    if (quote.last_updated) {
        auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(*quote.last_updated));
        out_ << "Last Updated: " << util::format_clock_time(tp) << "\n";
    }
    out_.flush();
}

void Renderer::render_table(const std::vector<MarketEntry>& entries) {
    if (entries.empty()) return;

    out_ << Formatter::pad_right("Symbol", Formatter::SYMBOL_WIDTH) << " "
         << Formatter::pad_right("Name", Formatter::NAME_WIDTH) << " "
         << Formatter::pad_right("Price", Formatter::PRICE_WIDTH) << " "
         << Formatter::pad_right("24h Change", Formatter::CHANGE_WIDTH) << " "
         << Formatter::pad_right("Market Cap", Formatter::MARKET_CAP_WIDTH) << "\n";

    for (const auto& e : entries) {
        out_ << Formatter::pad_right(util::to_upper(e.symbol), Formatter::SYMBOL_WIDTH) << " "
             << Formatter::pad_right(Formatter::truncate_name(e.name), Formatter::NAME_WIDTH) << " "
             << Formatter::pad_right(Formatter::format_price(e.current_price, currency_symbol_),
                                     Formatter::PRICE_WIDTH) << " "
             << styled(Formatter::format_change(e.change_24h), Formatter::CHANGE_WIDTH) << " "
             << Formatter::pad_right(Formatter::format_large_amount(e.market_cap, currency_symbol_),
                                     Formatter::MARKET_CAP_WIDTH) << "\n";
    }
    out_.flush();
}

void Renderer::render_search_results(const std::vector<SearchResult>& results, bool numbered) {
    int index = 1;
    for (const auto& r : results) {
        if (numbered) {
            out_ << index++ << ". ";
        } else {
            out_ << "- ";
        }
        out_ << r.name << " (" << util::to_upper(r.symbol) << ") - ID: " << r.id << "\n";
    }
    out_.flush();
}

void Renderer::render_watch_header(const std::string& asset_id, int interval_seconds) {
    watch_line_width_ = 0;
    out_ << "Watching " << util::to_upper(asset_id) << " - Press Ctrl+C to stop\n";
    out_ << "Update interval: " << interval_seconds << " seconds\n";
    out_.flush();
}

void Renderer::render_watch_line(const std::string& asset_id,
                                 std::chrono::system_clock::time_point timestamp,
                                 const AssetQuote& quote) {
    std::string time = util::format_clock_time(timestamp);
    std::string id = util::to_upper(asset_id);
    std::string price = Formatter::format_price(quote.price, currency_symbol_);
    auto change = Formatter::format_change(quote.change_24h);

    // Blank out whatever a longer previous line left behind the cursor.
    size_t width = util::utf8_length(fmt::format("[{}] {}: {} ({})", time, id, price, change.text));
    std::string tail(width < watch_line_width_ ? watch_line_width_ - width : 0, ' ');
    watch_line_width_ = width;

    out_ << fmt::format("\r[{}] {}: {} ({}){}", time, id, price, styled(change), tail);
    out_.flush();
}

void Renderer::render_watch_stopped() {
    watch_line_width_ = 0;
    out_ << "\n\nStopped watching.\n";
    out_.flush();
}

void Renderer::render_line(const std::string& text) {
    out_ << text << "\n";
    out_.flush();
}

void Renderer::render_prompt(const std::string& prompt) {
    out_ << prompt;
    out_.flush();
}

void Renderer::render_error(const std::string& message) {
    out_ << "Error: " << message << "\n";
    out_.flush();
}
