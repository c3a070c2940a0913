#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>

namespace util {
    std::string format_clock_time(std::chrono::system_clock::time_point tp);
    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_lower(std::string str);
    std::string to_upper(std::string str);
    std::string url_encode(const std::string& str);
    bool parse_int(const std::string& str, int& out);

    // Code point counts for UTF-8 text; continuation bytes are not counted.
    size_t utf8_length(const std::string& str);
    std::string utf8_prefix(const std::string& str, size_t count);
}
