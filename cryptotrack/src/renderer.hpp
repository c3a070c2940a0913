#pragma once

#include "models.hpp"
#include "formatter.hpp"
#include <chrono>
#include <ostream>
#include <string>
#include <vector>

class Renderer {
public:
    Renderer(std::ostream& out, bool use_color, const std::string& currency_symbol = "$");

    void render_quote(const AssetQuote& quote);
    void render_table(const std::vector<MarketEntry>& entries);
    void render_search_results(const std::vector<SearchResult>& results, bool numbered);

    void render_watch_header(const std::string& asset_id, int interval_seconds);
    void render_watch_line(const std::string& asset_id,
                           std::chrono::system_clock::time_point timestamp,
                           const AssetQuote& quote);
    void render_watch_stopped();

    void render_line(const std::string& text = "");
    void render_prompt(const std::string& prompt);
    void render_error(const std::string& message);

    // Applies the style attribute (ANSI when color is enabled) and pads the
    // visible text to `width`.
    std::string styled(const StyledText& text, size_t width = 0) const;

private:
    std::ostream& out_;
    bool use_color_;
    std::string currency_symbol_;
    size_t watch_line_width_ = 0;
};
