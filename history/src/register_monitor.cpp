#include "yankring/register_monitor.hpp"
#include "yankring/errors.hpp"

namespace yankring {

RegisterMonitor::RegisterMonitor(IEntryStore& store,
                                 HistoryCache& cache,
                                 RounderManager& rounders,
                                 IRegisterReader& registers,
                                 IHighlighter& highlighter,
                                 std::set<std::string> tracked_channels,
                                 const Logger& log)
    : store_(store),
      cache_(cache),
      rounders_(rounders),
      registers_(registers),
      highlighter_(highlighter),
      tracked_(std::move(tracked_channels)),
      log_(log) {
    tracked_.insert(kUnnamedChannel);
}

std::optional<HistoryEntry> RegisterMonitor::checkChanges(const ChangeEvent& event, bool event_sourced) {
    std::lock_guard<std::mutex> lock(mutex_);
    return guarded(log_, "register checkChanges", std::optional<HistoryEntry>(),
                   [&] { return checkLocked(event, event_sourced); });
}

std::optional<HistoryEntry> RegisterMonitor::checkLocked(const ChangeEvent& event, bool event_sourced) {
    std::string channel = kUnnamedChannel;
    if (event_sourced && event.channel && !event.channel->empty()) channel = *event.channel;

    if (!isTracked(channel)) {
        log_.debug("register", "skipping untracked register " + channel);
        return std::nullopt;
    }

    auto content = registers_.read(channel);
    if (!content || content->text.empty()) return std::nullopt;

    ChannelState& state = states_[channel];
    if (!state.initialized) {
        state.initialized = true;
        if (!event_sourced) {
            state.lastContent = content->text;
            log_.debug("register", "baseline for " + channel + ": \"" + preview(content->text) + "\"");
            return std::nullopt;
        }
    }

    if (content->text == state.lastContent) return std::nullopt;
    state.lastContent = content->text;

    cancelCycling(event.session);

    HistoryEntry entry;
    entry.content = content->text;
    entry.kind = parseKind(content->regtype, &entry.blockWidth);
    entry.timestamp = nextTimestamp();
    entry.sourceChannel = channel;
    entry.sourceFile = content->sourceFile;
    entry.sourceLine = content->sourceLine;
    entry.sourceContentType = content->sourceContentType;

    HistoryEntry stored;
    try {
        stored = store_.append(entry);
    } catch (const Error& e) {
        // not recorded this time; a later distinct change is tried on its own
        log_.error("register", std::string("yank not recorded: ") + e.what());
        return std::nullopt;
    }
    cache_.add(stored);
    log_.debug("register", "stored id=" + std::to_string(stored.id.value_or(-1)) + " from " + channel + " \"" +
                               preview(stored.content, 50) + "\" (cache " + std::to_string(cache_.size()) + ")");
    return stored;
}

void RegisterMonitor::cancelCycling(SessionId session) {
    Rounder& rounder = rounders_.getRounder(session);
    if (!rounder.isActive()) return;
    rounder.stop("new yank detected");
    highlighter_.clear();
}

int64_t RegisterMonitor::nextTimestamp() {
    int64_t ts = now_ms();
    if (ts <= last_timestamp_) ts = last_timestamp_ + 1;
    last_timestamp_ = ts;
    return ts;
}

void RegisterMonitor::acknowledge(const std::string& channel, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChannelState& state = states_[channel];
    state.initialized = true;
    state.lastContent = content;
}

void RegisterMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.clear();
}

std::string RegisterMonitor::lastContent(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(channel);
    return it == states_.end() ? std::string() : it->second.lastContent;
}

} // namespace yankring
