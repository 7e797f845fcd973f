#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sttmon {
namespace utils {

class JsonValue;

struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    
    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }
    
    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }
    
    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

/**
 * Runtime configuration of the monitor, the subtitle forwarder and the
 * alignment engine. Values come from a JSON file (sections "monitor",
 * "subtitle", "alignment", "logging") and are then overridden by the
 * environment variables HOST, PORT, RESP_CHECKCODE, SUBTITLE_HOST,
 * SUBTITLE_PORT, SUBTITLE_CHECKCODE, OUTPUT_SUBTITLE_INSERTER_ENABLE,
 * SIMILARITY_THRESHOLD, MAX_LOOKAHEAD, ALIGN_STRATEGY, UPDATE_INTERVAL_MS,
 * RAW_OUT_PATH and LOG_LEVEL.
 */
class Config {
public:
    Config() = default;

    // Missing file yields defaults; unreadable or malformed JSON throws ConfigurationException
    static Config load(const std::string& configPath);
    static Config fromJson(const std::string& jsonStr);

    void applyEnvironment();
    // Keys use the environment variable names; throws ConfigurationException on unparsable values
    void applyOverrides(const std::map<std::string, std::string>& overrides);

    ConfigValidationResult validate() const;
    std::string toJson() const;
    
    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    int32_t getResponseCheckcode() const { return responseCheckcode_; }
    int getUpdateIntervalMs() const { return updateIntervalMs_; }

    const std::string& getSubtitleHost() const { return subtitleHost_; }
    int getSubtitlePort() const { return subtitlePort_; }
    int32_t getSubtitleCheckcode() const { return subtitleCheckcode_; }
    bool isSubtitleForwardingEnabled() const { return subtitleForwardingEnabled_; }
    const std::string& getRawOutPath() const { return rawOutPath_; }

    double getSimilarityThreshold() const { return similarityThreshold_; }
    int getMaxLookahead() const { return maxLookahead_; }
    const std::string& getAlignStrategy() const { return alignStrategy_; }

    const std::string& getLogLevel() const { return logLevel_; }

    void setPort(int port) { port_ = port; }
    void setSimilarityThreshold(double threshold) { similarityThreshold_ = threshold; }
    
private:
    void applyJson(const JsonValue& root);

    static int parseInt(const std::string& key, const std::string& value);
    static int32_t parseCheckcode(const std::string& key, const std::string& value);
    static double parseDouble(const std::string& key, const std::string& value);
    static bool parseBool(const std::string& value);

    std::string host_ = "127.0.0.1";
    int port_ = 26072;
    int32_t responseCheckcode_ = 20250918;
    int updateIntervalMs_ = 500;

    std::string subtitleHost_ = "127.0.0.1";
    int subtitlePort_ = 26071;
    int32_t subtitleCheckcode_ = 20250918;
    bool subtitleCheckcodeExplicit_ = false;
    bool subtitleForwardingEnabled_ = false;
    std::string rawOutPath_ = "./raw_out";

    double similarityThreshold_ = 0.6;
    int maxLookahead_ = 3;
    std::string alignStrategy_ = "sequential";

    std::string logLevel_ = "INFO";
};

} // namespace utils
} // namespace sttmon
