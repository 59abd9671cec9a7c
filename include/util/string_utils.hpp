#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string trim(const std::string& input);
std::string join(const std::vector<std::string>& inputs, const std::string& connector);
std::vector<std::string> parseTokens(const std::string& input, char delimiter);
std::optional<int> parseInt(const std::string& input);
std::optional<std::uint64_t> parseUnsigned(const std::string& input);
std::string formatFixedPoint(double num, int precision);
std::string formatPercent(int count, int total);

#endif // STRING_UTILS_HPP
