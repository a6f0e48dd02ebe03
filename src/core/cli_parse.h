#pragma once

#include <array>
#include <string>

namespace wallspan::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);
bool parse_non_negative_uint(const std::string& value, unsigned int& out);

bool parse_int(const std::string& token, int& out);
bool parse_double(const std::string& token, double& out);
bool parse_non_negative_double(const std::string& token, double& out);
bool parse_pair(const std::string& token, int& a, int& b);
bool parse_bool_value(const std::string& value, bool& out);

// Accepts "R,G,B" with every channel in 0-255.
bool parse_rgb(const std::string& value, std::array<unsigned char, 3>& out);

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

} // namespace wallspan::core
