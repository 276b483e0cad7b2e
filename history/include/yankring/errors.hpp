#pragma once

#include "yankring/log.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace yankring {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Entry rejected before persistence (oversize, malformed shape)
class ValidationError : public Error {
public:
    using Error::Error;
};

// Backing file corrupted or inaccessible
class StoreUnavailable : public Error {
public:
    StoreUnavailable(const std::string& what, int sqlite_code = 0)
        : Error(what), code_(sqlite_code) {}
    int sqliteCode() const { return code_; }

private:
    int code_;
};

// Write lock not acquired within the configured bound
class ContentionTimeout : public Error {
public:
    using Error::Error;
};

struct BackoffPolicy {
    std::chrono::milliseconds initialDelay {10};
    std::chrono::milliseconds maxDelay {500};
    std::chrono::milliseconds deadline {5000};
    int factor {2};
};

// Runs op until it returns true or the deadline passes. Returns false on timeout.
// Exceptions from op propagate unchanged.
template <typename Op>
bool retryWithBackoff(const BackoffPolicy& policy, Op&& op) {
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    auto delay = policy.initialDelay;
    for (;;) {
        if (op()) return true;
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
        if (elapsed >= policy.deadline) return false;
        auto wait = std::min(delay, policy.deadline - elapsed);
        std::this_thread::sleep_for(wait);
        delay = std::min(delay * policy.factor, policy.maxDelay);
    }
}

// Runs fn at a public operation boundary: failures are logged under context
// and replaced by fallback.
template <typename T, typename Fn>
T guarded(const Logger& log, const char* context, T fallback, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        log.error(context, std::string("operation failed: ") + e.what());
        return fallback;
    }
}

template <typename Fn>
void guarded(const Logger& log, const char* context, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        log.error(context, std::string("operation failed: ") + e.what());
    }
}

} // namespace yankring
