#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sttmon {
namespace utils {

namespace {

const char* const kKnownStrategies[] = {"sequential", "levenshtein"};

const char* const kEnvironmentKeys[] = {
    "HOST", "PORT", "RESP_CHECKCODE", "UPDATE_INTERVAL_MS",
    "SUBTITLE_HOST", "SUBTITLE_PORT", "SUBTITLE_CHECKCODE",
    "OUTPUT_SUBTITLE_INSERTER_ENABLE", "RAW_OUT_PATH",
    "SIMILARITY_THRESHOLD", "MAX_LOOKAHEAD", "ALIGN_STRATEGY",
    "LOG_LEVEL"
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

// JSON numbers and numeric strings are both accepted for integer fields
std::string scalarToString(const JsonValue& value) {
    if (value.isString()) {
        return value.asString();
    }
    if (value.isNumber()) {
        std::ostringstream oss;
        oss.precision(17);
        oss << value.asNumber();
        return oss.str();
    }
    if (value.isBool()) {
        return value.asBool() ? "true" : "false";
    }
    return "";
}

} // namespace

Config Config::load(const std::string& configPath) {
    Config config;
    
    if (configPath.empty() || !std::filesystem::exists(configPath)) {
        Logger::info("Configuration file not found: " + configPath + ", using defaults");
        return config;
    }
    
    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open configuration file", configPath);
    }
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    
    std::string jsonStr = buffer.str();
    if (jsonStr.find_first_not_of(" \t\r\n") == std::string::npos) {
        Logger::info("Empty configuration file, using defaults");
        return config;
    }
    
    config = fromJson(jsonStr);
    Logger::info("Configuration loaded from: " + configPath);
    return config;
}

Config Config::fromJson(const std::string& jsonStr) {
    JsonValue root;
    try {
        root = JsonParser::parse(jsonStr);
    } catch (const std::exception& e) {
        throw ConfigurationException("Failed to parse configuration JSON", e.what());
    }
    if (!root.isObject()) {
        throw ConfigurationException("Configuration root must be a JSON object");
    }
    
    Config config;
    config.applyJson(root);
    return config;
}

void Config::applyJson(const JsonValue& root) {
    std::map<std::string, std::string> values;
    
    const JsonValue& monitor = root.getProperty("monitor");
    if (monitor.isObject()) {
        if (monitor.hasProperty("host")) values["HOST"] = scalarToString(monitor.getProperty("host"));
        if (monitor.hasProperty("port")) values["PORT"] = scalarToString(monitor.getProperty("port"));
        if (monitor.hasProperty("responseCheckcode")) {
            values["RESP_CHECKCODE"] = scalarToString(monitor.getProperty("responseCheckcode"));
        }
        if (monitor.hasProperty("updateIntervalMs")) {
            values["UPDATE_INTERVAL_MS"] = scalarToString(monitor.getProperty("updateIntervalMs"));
        }
    }
    
    const JsonValue& subtitle = root.getProperty("subtitle");
    if (subtitle.isObject()) {
        if (subtitle.hasProperty("host")) values["SUBTITLE_HOST"] = scalarToString(subtitle.getProperty("host"));
        if (subtitle.hasProperty("port")) values["SUBTITLE_PORT"] = scalarToString(subtitle.getProperty("port"));
        if (subtitle.hasProperty("checkcode")) {
            values["SUBTITLE_CHECKCODE"] = scalarToString(subtitle.getProperty("checkcode"));
        }
        if (subtitle.hasProperty("enabled")) {
            values["OUTPUT_SUBTITLE_INSERTER_ENABLE"] = scalarToString(subtitle.getProperty("enabled"));
        }
        if (subtitle.hasProperty("rawOutPath")) {
            values["RAW_OUT_PATH"] = scalarToString(subtitle.getProperty("rawOutPath"));
        }
    }
    
    const JsonValue& alignment = root.getProperty("alignment");
    if (alignment.isObject()) {
        if (alignment.hasProperty("similarityThreshold")) {
            values["SIMILARITY_THRESHOLD"] = scalarToString(alignment.getProperty("similarityThreshold"));
        }
        if (alignment.hasProperty("maxLookahead")) {
            values["MAX_LOOKAHEAD"] = scalarToString(alignment.getProperty("maxLookahead"));
        }
        if (alignment.hasProperty("strategy")) {
            values["ALIGN_STRATEGY"] = scalarToString(alignment.getProperty("strategy"));
        }
    }
    
    const JsonValue& logging = root.getProperty("logging");
    if (logging.isObject() && logging.hasProperty("level")) {
        values["LOG_LEVEL"] = scalarToString(logging.getProperty("level"));
    }
    
    applyOverrides(values);
}

void Config::applyEnvironment() {
    std::map<std::string, std::string> values;
    for (const char* key : kEnvironmentKeys) {
        const char* value = std::getenv(key);
        if (value != nullptr) {
            values[key] = value;
        }
    }
    applyOverrides(values);
}

void Config::applyOverrides(const std::map<std::string, std::string>& overrides) {
    for (const auto& entry : overrides) {
        const std::string& key = entry.first;
        const std::string& value = entry.second;
        
        if (key == "HOST") {
            host_ = value;
        } else if (key == "PORT") {
            port_ = parseInt(key, value);
        } else if (key == "RESP_CHECKCODE") {
            responseCheckcode_ = parseCheckcode(key, value);
        } else if (key == "UPDATE_INTERVAL_MS") {
            updateIntervalMs_ = parseInt(key, value);
        } else if (key == "SUBTITLE_HOST") {
            subtitleHost_ = value;
        } else if (key == "SUBTITLE_PORT") {
            subtitlePort_ = parseInt(key, value);
        } else if (key == "SUBTITLE_CHECKCODE") {
            subtitleCheckcode_ = parseCheckcode(key, value);
            subtitleCheckcodeExplicit_ = true;
        } else if (key == "OUTPUT_SUBTITLE_INSERTER_ENABLE") {
            subtitleForwardingEnabled_ = parseBool(value);
        } else if (key == "RAW_OUT_PATH") {
            rawOutPath_ = value;
        } else if (key == "SIMILARITY_THRESHOLD") {
            similarityThreshold_ = parseDouble(key, value);
        } else if (key == "MAX_LOOKAHEAD") {
            maxLookahead_ = parseInt(key, value);
        } else if (key == "ALIGN_STRATEGY") {
            alignStrategy_ = toLower(value);
        } else if (key == "LOG_LEVEL") {
            logLevel_ = value;
        } else {
            Logger::warn("Ignoring unknown configuration key: " + key);
        }
    }
    
    // The forwarder signs its frames with the monitor checkcode unless told otherwise
    if (!subtitleCheckcodeExplicit_) {
        subtitleCheckcode_ = responseCheckcode_;
    }
}

ConfigValidationResult Config::validate() const {
    ConfigValidationResult result;
    
    if (host_.empty()) {
        result.addError("monitor.host must not be empty");
    }
    if (port_ < 1 || port_ > 65535) {
        result.addError("monitor.port out of range: " + std::to_string(port_));
    }
    if (updateIntervalMs_ <= 0) {
        result.addError("monitor.updateIntervalMs must be positive");
    } else if (updateIntervalMs_ < 50) {
        result.addWarning("monitor.updateIntervalMs below 50ms re-scores very frequently");
    }
    
    if (subtitlePort_ < 1 || subtitlePort_ > 65535) {
        result.addError("subtitle.port out of range: " + std::to_string(subtitlePort_));
    }
    if (subtitleForwardingEnabled_ && subtitleHost_.empty()) {
        result.addError("subtitle.host must be set when forwarding is enabled");
    }
    if (subtitleForwardingEnabled_ && subtitleHost_ == host_ && subtitlePort_ == port_) {
        result.addWarning("subtitle sink points at the monitor itself");
    }
    
    if (!(similarityThreshold_ >= 0.0 && similarityThreshold_ <= 1.0)) {
        result.addError("alignment.similarityThreshold must be within [0, 1]");
    }
    if (maxLookahead_ < 1) {
        result.addError("alignment.maxLookahead must be at least 1");
    }
    if (std::find(std::begin(kKnownStrategies), std::end(kKnownStrategies), alignStrategy_) ==
        std::end(kKnownStrategies)) {
        result.addError("alignment.strategy unknown: " + alignStrategy_);
    }
    
    std::string level = toLower(logLevel_);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" && level != "error") {
        result.addWarning("logging.level unknown, INFO is used: " + logLevel_);
    }
    
    return result;
}

std::string Config::toJson() const {
    JsonValue monitor;
    monitor.setObject();
    monitor.setObjectProperty("host", JsonValue(host_));
    monitor.setObjectProperty("port", JsonValue(static_cast<double>(port_)));
    monitor.setObjectProperty("responseCheckcode", JsonValue(static_cast<double>(responseCheckcode_)));
    monitor.setObjectProperty("updateIntervalMs", JsonValue(static_cast<double>(updateIntervalMs_)));
    
    JsonValue subtitle;
    subtitle.setObject();
    subtitle.setObjectProperty("host", JsonValue(subtitleHost_));
    subtitle.setObjectProperty("port", JsonValue(static_cast<double>(subtitlePort_)));
    subtitle.setObjectProperty("checkcode", JsonValue(static_cast<double>(subtitleCheckcode_)));
    subtitle.setObjectProperty("enabled", JsonValue(subtitleForwardingEnabled_));
    subtitle.setObjectProperty("rawOutPath", JsonValue(rawOutPath_));
    
    JsonValue alignment;
    alignment.setObject();
    alignment.setObjectProperty("similarityThreshold", JsonValue(similarityThreshold_));
    alignment.setObjectProperty("maxLookahead", JsonValue(static_cast<double>(maxLookahead_)));
    alignment.setObjectProperty("strategy", JsonValue(alignStrategy_));
    
    JsonValue logging;
    logging.setObject();
    logging.setObjectProperty("level", JsonValue(logLevel_));
    
    JsonValue root;
    root.setObject();
    root.setObjectProperty("monitor", monitor);
    root.setObjectProperty("subtitle", subtitle);
    root.setObjectProperty("alignment", alignment);
    root.setObjectProperty("logging", logging);
    return JsonParser::stringify(root);
}

int Config::parseInt(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        long parsed = std::stol(value, &consumed, 10);
        if (consumed != value.size() || parsed < INT_MIN || parsed > INT_MAX) {
            throw std::invalid_argument(value);
        }
        return static_cast<int>(parsed);
    } catch (const std::exception&) {
        throw ConfigurationException("Invalid integer value '" + value + "'", key);
    }
}

int32_t Config::parseCheckcode(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        // Base 0 accepts both decimal and 0x-prefixed codes
        long long parsed = std::stoll(value, &consumed, 0);
        if (consumed != value.size() || parsed < INT32_MIN || parsed > INT32_MAX) {
            throw std::invalid_argument(value);
        }
        return static_cast<int32_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigurationException("Invalid checkcode '" + value + "'", key);
    }
}

double Config::parseDouble(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationException("Invalid number '" + value + "'", key);
    }
}

bool Config::parseBool(const std::string& value) {
    return toLower(value) == "true";
}

} // namespace utils
} // namespace sttmon
