#pragma once

#include "yankring/cache.hpp"
#include "yankring/editor.hpp"
#include "yankring/log.hpp"
#include "yankring/rounder.hpp"
#include "yankring/store.hpp"
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace yankring {

struct ChangeEvent {
    SessionId session {0};
    // register named by the editor event, if any
    std::optional<std::string> channel;
};

// Turns genuine register changes into history entries.
//
// The first observation of a channel only records a baseline, unless it is
// event-sourced (the editor reported a yank). After that an entry is written
// whenever the content differs from the last one seen on that channel.
// An active cycle in the event's session is cancelled before the write.
class RegisterMonitor {
public:
    RegisterMonitor(IEntryStore& store,
                    HistoryCache& cache,
                    RounderManager& rounders,
                    IRegisterReader& registers,
                    IHighlighter& highlighter,
                    std::set<std::string> tracked_channels,
                    const Logger& log);

    // Returns the stored entry when one was recorded. Failures are logged, never thrown.
    std::optional<HistoryEntry> checkChanges(const ChangeEvent& event, bool event_sourced);

    // Records content the plugin itself put into a channel (e.g. while cycling)
    // as the baseline, so it is not taken for a new yank.
    void acknowledge(const std::string& channel, const std::string& content);

    // Forgets all baselines
    void reset();

    std::string lastContent(const std::string& channel = kUnnamedChannel) const;
    bool isTracked(const std::string& channel) const { return tracked_.count(channel) != 0; }

private:
    struct ChannelState {
        bool initialized {false};
        std::string lastContent;
    };

    std::optional<HistoryEntry> checkLocked(const ChangeEvent& event, bool event_sourced);
    void cancelCycling(SessionId session);
    int64_t nextTimestamp();

    IEntryStore& store_;
    HistoryCache& cache_;
    RounderManager& rounders_;
    IRegisterReader& registers_;
    IHighlighter& highlighter_;
    std::set<std::string> tracked_;
    const Logger& log_;
    std::unordered_map<std::string, ChannelState> states_;
    int64_t last_timestamp_ {0};
    mutable std::mutex mutex_;
};

} // namespace yankring
