#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace sttmon {
namespace core {

/**
 * Append-only record of the recognized fragments received so far.
 * Written by client threads, read by the update timer.
 */
class HypothesisLog {
public:
    // Trims the fragment; empty fragments are ignored. Returns true if appended.
    bool append(const std::string& fragment);
    // All fragments joined with single spaces
    std::string snapshot() const;
    std::vector<std::string> fragments() const;
    size_t size() const;
    bool empty() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> fragments_;
};

} // namespace core
} // namespace sttmon
