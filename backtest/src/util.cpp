#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid integer value for env var {}: {}", name, value));
    }
}

double get_env_double(const std::string& name, double default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid double value for env var {}: {}", name, value));
    }
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::optional<CalendarDate> parse_date(const std::string& text) {
    std::string s = trim(text);
    if (s.size() < 10) {
        return std::nullopt;
    }

    char sep = s[4];
    if ((sep != '-' && sep != '/') || s[7] != sep) {
        return std::nullopt;
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return std::nullopt;
        }
    }
    // Date must not run into more digits, e.g. "2024-01-015"
    if (s.size() > 10 && std::isdigit(static_cast<unsigned char>(s[10]))) {
        return std::nullopt;
    }

    CalendarDate date;
    date.year = std::stoi(s.substr(0, 4));
    date.month = std::stoi(s.substr(5, 2));
    date.day = std::stoi(s.substr(8, 2));

    static const int days_in_month[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (date.month < 1 || date.month > 12) {
        return std::nullopt;
    }
    bool leap = (date.year % 4 == 0 && date.year % 100 != 0) || date.year % 400 == 0;
    int max_day = days_in_month[date.month - 1];
    if (date.month == 2 && !leap) {
        max_day = 28;
    }
    if (date.day < 1 || date.day > max_day) {
        return std::nullopt;
    }

    return date;
}

} // namespace util
