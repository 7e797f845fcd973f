#pragma once

#include <string>
#include <vector>

namespace sttmon {
namespace utils {

// Invalid or truncated sequences decode to U+FFFD
std::u32string decodeUtf8(const std::string& text);
std::string encodeUtf8(const std::u32string& text);
void appendUtf8(std::string& out, char32_t codepoint);

// ASCII whitespace plus the Unicode space separators (NBSP, ideographic space, ...)
bool isWhitespace(char32_t codepoint);

std::vector<std::string> splitWhitespace(const std::string& text);
std::string collapseWhitespace(const std::string& text);
std::string trim(const std::string& text);

} // namespace utils
} // namespace sttmon
