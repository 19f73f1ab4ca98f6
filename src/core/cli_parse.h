#pragma once

#include <string>
#include <string_view>

namespace tekanim::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);
bool parse_non_negative_uint(const std::string& value, unsigned int& out);

bool parse_int(const std::string& token, int& out);
bool parse_double(const std::string& token, double& out);
bool parse_double_pair(const std::string& token, double& a, double& b);

// Parses "<start>..<end>". Values are not range checked.
bool parse_frame_range_token(const std::string& token, int& start, int& end);

bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error);

std::string to_quoted(const std::string& s);
std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

} // namespace tekanim::core
