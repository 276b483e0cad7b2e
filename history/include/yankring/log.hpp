#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace yankring {

// Category-tagged diagnostics on stderr. debug() is silent unless enabled;
// error() always prints.
class Logger {
public:
    explicit Logger(bool debug_enabled = false, std::ostream* out = nullptr);

    void setDebug(bool enabled) { debug_ = enabled; }
    bool debugEnabled() const { return debug_; }

    void debug(std::string_view category, const std::string& message) const;
    void error(std::string_view category, const std::string& message) const;

private:
    void write(std::string_view category, bool is_error, const std::string& message) const;

    bool debug_;
    std::ostream* out_;
};

// First max_len bytes of text with newlines escaped, for log lines.
std::string preview(std::string_view text, size_t max_len = 30);

} // namespace yankring
