#include "utils/utf8_utils.hpp"

namespace sttmon {
namespace utils {

namespace {

constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

} // namespace

std::u32string decodeUtf8(const std::string& text) {
    std::u32string result;
    result.reserve(text.size());
    
    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        char32_t codepoint = 0;
        
        if (lead < 0x80) {
            result.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codepoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codepoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codepoint = lead & 0x07;
        } else {
            result.push_back(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }
        
        if (i + length > text.size()) {
            result.push_back(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }
        
        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            unsigned char byte = static_cast<unsigned char>(text[i + k]);
            if (!isContinuation(byte)) {
                valid = false;
                break;
            }
            codepoint = (codepoint << 6) | (byte & 0x3F);
        }
        
        // Reject overlong forms, surrogates and out-of-range values
        if (valid) {
            if ((length == 2 && codepoint < 0x80) ||
                (length == 3 && codepoint < 0x800) ||
                (length == 4 && codepoint < 0x10000) ||
                (codepoint >= 0xD800 && codepoint <= 0xDFFF) ||
                codepoint > 0x10FFFF) {
                valid = false;
            }
        }
        
        if (!valid) {
            result.push_back(REPLACEMENT_CHARACTER);
            ++i;
            continue;
        }
        
        result.push_back(codepoint);
        i += length;
    }
    
    return result;
}

void appendUtf8(std::string& out, char32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        appendUtf8(out, REPLACEMENT_CHARACTER);
    }
}

std::string encodeUtf8(const std::u32string& text) {
    std::string result;
    result.reserve(text.size() * 3);
    for (char32_t codepoint : text) {
        appendUtf8(result, codepoint);
    }
    return result;
}

bool isWhitespace(char32_t codepoint) {
    switch (codepoint) {
        case U' ':
        case U'\t':
        case U'\n':
        case U'\v':
        case U'\f':
        case U'\r':
        case 0x1C: case 0x1D: case 0x1E: case 0x1F:
        case 0x85:
        case 0xA0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return codepoint >= 0x2000 && codepoint <= 0x200A;
    }
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::u32string current;
    
    for (char32_t codepoint : decodeUtf8(text)) {
        if (isWhitespace(codepoint)) {
            if (!current.empty()) {
                tokens.push_back(encodeUtf8(current));
                current.clear();
            }
        } else {
            current.push_back(codepoint);
        }
    }
    if (!current.empty()) {
        tokens.push_back(encodeUtf8(current));
    }
    
    return tokens;
}

std::string collapseWhitespace(const std::string& text) {
    std::string result;
    for (const auto& token : splitWhitespace(text)) {
        if (!result.empty()) {
            result += ' ';
        }
        result += token;
    }
    return result;
}

std::string trim(const std::string& text) {
    std::u32string decoded = decodeUtf8(text);
    size_t begin = 0;
    size_t end = decoded.size();
    while (begin < end && isWhitespace(decoded[begin])) {
        ++begin;
    }
    while (end > begin && isWhitespace(decoded[end - 1])) {
        --end;
    }
    return encodeUtf8(decoded.substr(begin, end - begin));
}

} // namespace utils
} // namespace sttmon
