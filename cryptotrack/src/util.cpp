#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace util {

std::string format_clock_time(std::chrono::system_clock::time_point tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&itt, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
    return ss.str();
}

std::string trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (start >= end) return "";
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string url_encode(const std::string& str) {
    std::ostringstream ss;
    ss << std::hex << std::uppercase;
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            ss << c;
        } else {
            ss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return ss.str();
}

bool parse_int(const std::string& str, int& out) {
    std::string s = trim(str);
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        int value = std::stoi(s, &pos);
        if (pos != s.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

size_t utf8_length(const std::string& str) {
    size_t count = 0;
    for (unsigned char c : str) {
        if (!is_continuation(c)) count++;
    }
    return count;
}

std::string utf8_prefix(const std::string& str, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < str.size(); i++) {
        if (is_continuation(static_cast<unsigned char>(str[i]))) continue;
        if (seen == count) return str.substr(0, i);
        seen++;
    }
    return str;
}

} // namespace util
