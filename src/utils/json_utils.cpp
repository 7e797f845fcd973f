#include "utils/json_utils.hpp"
#include "utils/utf8_utils.hpp"
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <cmath>
#include <iomanip>

namespace sttmon {
namespace utils {

JsonValue JsonValue::null_value_;

const JsonValue& JsonValue::getProperty(const std::string& key) const {
    auto it = object_value_.find(key);
    return (it != object_value_.end()) ? it->second : null_value_;
}

std::string JsonValue::getString(const std::string& key, const std::string& fallback) const {
    const JsonValue& value = getProperty(key);
    return value.isString() ? value.asString() : fallback;
}

double JsonValue::getNumber(const std::string& key, double fallback) const {
    const JsonValue& value = getProperty(key);
    return value.isNumber() ? value.asNumber() : fallback;
}

bool JsonValue::getBool(const std::string& key, bool fallback) const {
    const JsonValue& value = getProperty(key);
    return value.isBool() ? value.asBool() : fallback;
}

JsonValue JsonParser::parse(const std::string& json) {
    size_t pos = 0;
    skipWhitespace(json, pos);
    JsonValue value = parseValue(json, pos);
    skipWhitespace(json, pos);
    if (pos != json.length()) {
        throw std::runtime_error("Trailing characters after JSON value");
    }
    return value;
}

std::string JsonParser::stringify(const JsonValue& value) {
    return stringifyValue(value);
}

JsonValue JsonParser::parseValue(const std::string& json, size_t& pos) {
    skipWhitespace(json, pos);
    
    if (pos >= json.length()) {
        throw std::runtime_error("Unexpected end of JSON");
    }
    
    char c = json[pos];
    
    if (c == '{') {
        return parseObject(json, pos);
    } else if (c == '[') {
        return parseArray(json, pos);
    } else if (c == '"') {
        return parseString(json, pos);
    } else if (c == 't' || c == 'f' || c == 'n') {
        return parseLiteral(json, pos);
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parseNumber(json, pos);
    } else {
        throw std::runtime_error("Unexpected character: " + std::string(1, c));
    }
}

JsonValue JsonParser::parseObject(const std::string& json, size_t& pos) {
    JsonValue obj;
    obj.setObject();
    
    pos++; // Skip '{'
    skipWhitespace(json, pos);
    
    if (pos < json.length() && json[pos] == '}') {
        pos++; // Skip '}'
        return obj;
    }
    
    while (pos < json.length()) {
        skipWhitespace(json, pos);
        
        // Parse key
        if (pos >= json.length() || json[pos] != '"') {
            throw std::runtime_error("Expected string key in object");
        }
        
        JsonValue key = parseString(json, pos);
        skipWhitespace(json, pos);
        
        // Expect ':'
        if (pos >= json.length() || json[pos] != ':') {
            throw std::runtime_error("Expected ':' after object key");
        }
        pos++; // Skip ':'
        
        // Parse value
        JsonValue value = parseValue(json, pos);
        obj.setObjectProperty(key.asString(), value);
        
        skipWhitespace(json, pos);
        
        if (pos >= json.length()) {
            throw std::runtime_error("Unexpected end of JSON in object");
        }
        
        if (json[pos] == '}') {
            pos++; // Skip '}'
            break;
        } else if (json[pos] == ',') {
            pos++; // Skip ','
        } else {
            throw std::runtime_error("Expected ',' or '}' in object");
        }
    }
    
    return obj;
}

JsonValue JsonParser::parseArray(const std::string& json, size_t& pos) {
    JsonValue arr;
    arr.setArray();
    
    pos++; // Skip '['
    skipWhitespace(json, pos);
    
    if (pos < json.length() && json[pos] == ']') {
        pos++; // Skip ']'
        return arr;
    }
    
    while (pos < json.length()) {
        JsonValue value = parseValue(json, pos);
        arr.addArrayElement(value);
        
        skipWhitespace(json, pos);
        
        if (pos >= json.length()) {
            throw std::runtime_error("Unexpected end of JSON in array");
        }
        
        if (json[pos] == ']') {
            pos++; // Skip ']'
            break;
        } else if (json[pos] == ',') {
            pos++; // Skip ','
            skipWhitespace(json, pos);
        } else {
            throw std::runtime_error("Expected ',' or ']' in array");
        }
    }
    
    return arr;
}

JsonValue JsonParser::parseString(const std::string& json, size_t& pos) {
    pos++; // Skip opening '"'
    std::string result;
    
    while (pos < json.length()) {
        char c = json[pos];
        
        if (c == '"') {
            pos++; // Skip closing '"'
            return JsonValue(result);
        } else if (c == '\\') {
            pos++; // Skip '\'
            if (pos >= json.length()) {
                throw std::runtime_error("Unexpected end of JSON in string escape");
            }
            
            char escaped = json[pos];
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    char32_t codepoint = parseHex4(json, pos + 1);
                    pos += 4;
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (pos + 6 < json.length() && json[pos + 1] == '\\' && json[pos + 2] == 'u') {
                            char32_t low = parseHex4(json, pos + 3);
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                                pos += 6;
                            } else {
                                codepoint = 0xFFFD;
                            }
                        } else {
                            codepoint = 0xFFFD;
                        }
                    } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                        codepoint = 0xFFFD;
                    }
                    appendUtf8(result, codepoint);
                    break;
                }
                default:
                    throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        } else {
            result += c;
        }
        
        pos++;
    }
    
    throw std::runtime_error("Unterminated string");
}

unsigned JsonParser::parseHex4(const std::string& json, size_t pos) {
    if (pos + 4 > json.length()) {
        throw std::runtime_error("Unexpected end of JSON in unicode escape");
    }
    unsigned value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = json[i];
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<unsigned>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<unsigned>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<unsigned>(c - 'A' + 10);
        } else {
            throw std::runtime_error("Invalid unicode escape");
        }
    }
    return value;
}

JsonValue JsonParser::parseNumber(const std::string& json, size_t& pos) {
    size_t start = pos;
    
    if (json[pos] == '-') {
        pos++;
    }
    
    if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
        throw std::runtime_error("Invalid number format");
    }
    
    // Parse integer part
    if (json[pos] == '0') {
        pos++;
    } else {
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }
    
    // Parse decimal part
    if (pos < json.length() && json[pos] == '.') {
        pos++;
        if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
            throw std::runtime_error("Invalid number format");
        }
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }
    
    // Parse exponent part
    if (pos < json.length() && (json[pos] == 'e' || json[pos] == 'E')) {
        pos++;
        if (pos < json.length() && (json[pos] == '+' || json[pos] == '-')) {
            pos++;
        }
        if (pos >= json.length() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
            throw std::runtime_error("Invalid number format");
        }
        while (pos < json.length() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
            pos++;
        }
    }
    
    std::string numberStr = json.substr(start, pos - start);
    double value = std::stod(numberStr);
    return JsonValue(value);
}

JsonValue JsonParser::parseLiteral(const std::string& json, size_t& pos) {
    if (json.substr(pos, 4) == "true") {
        pos += 4;
        return JsonValue(true);
    } else if (json.substr(pos, 5) == "false") {
        pos += 5;
        return JsonValue(false);
    } else if (json.substr(pos, 4) == "null") {
        pos += 4;
        return JsonValue();
    } else {
        throw std::runtime_error("Invalid literal");
    }
}

void JsonParser::skipWhitespace(const std::string& json, size_t& pos) {
    while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        pos++;
    }
}

std::string JsonParser::stringifyValue(const JsonValue& value) {
    switch (value.getType()) {
        case JsonType::NULL_VALUE:
            return "null";
        case JsonType::BOOLEAN:
            return value.asBool() ? "true" : "false";
        case JsonType::NUMBER: {
            double number = value.asNumber();
            std::ostringstream oss;
            if (std::floor(number) == number && std::fabs(number) < 9.0e15) {
                oss << static_cast<long long>(number);
            } else {
                oss << std::setprecision(15) << number;
            }
            return oss.str();
        }
        case JsonType::STRING:
            return "\"" + escapeString(value.asString()) + "\"";
        case JsonType::ARRAY: {
            std::string result = "[";
            const auto& arr = value.asArray();
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) result += ",";
                result += stringifyValue(arr[i]);
            }
            result += "]";
            return result;
        }
        case JsonType::OBJECT: {
            std::string result = "{";
            const auto& obj = value.asObject();
            bool first = true;
            for (const auto& pair : obj) {
                if (!first) result += ",";
                result += "\"" + escapeString(pair.first) + "\":" + stringifyValue(pair.second);
                first = false;
            }
            result += "}";
            return result;
        }
    }
    return "null";
}

std::string JsonParser::escapeString(const std::string& str) {
    std::string result;
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    result += "\\u00";
                    result += hex[(c >> 4) & 0x0F];
                    result += hex[c & 0x0F];
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // namespace utils
} // namespace sttmon
