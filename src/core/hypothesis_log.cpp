#include "core/hypothesis_log.hpp"
#include "utils/utf8_utils.hpp"
#include <utility>

namespace sttmon {
namespace core {

bool HypothesisLog::append(const std::string& fragment) {
    std::string trimmed = utils::trim(fragment);
    if (trimmed.empty()) {
        return false;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    fragments_.push_back(std::move(trimmed));
    return true;
}

std::string HypothesisLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string joined;
    for (const auto& fragment : fragments_) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += fragment;
    }
    return joined;
}

std::vector<std::string> HypothesisLog::fragments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fragments_;
}

size_t HypothesisLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fragments_.size();
}

bool HypothesisLog::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fragments_.empty();
}

void HypothesisLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    fragments_.clear();
}

} // namespace core
} // namespace sttmon
