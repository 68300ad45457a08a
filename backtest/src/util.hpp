#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(std::string str);

// Date utilities
// Accepts YYYY-MM-DD and YYYY/MM/DD; anything after the day (a time part) is ignored
std::optional<CalendarDate> parse_date(const std::string& text);

} // namespace util
