#include "yankring/rounder.hpp"
#include <exception>
#include <string>

namespace yankring {

namespace {

// Marks the rounder as applying while editor calls are in flight
class ApplyingScope {
public:
    explicit ApplyingScope(std::atomic<bool>& flag) : flag_(flag) { flag_.store(true); }
    ~ApplyingScope() { flag_.store(false); }

private:
    std::atomic<bool>& flag_;
};

} // namespace

Rounder::Rounder(const Logger& log) : log_(log) {}

Rounder::~Rounder() {
    std::lock_guard<std::mutex> lock(mutex_);
    discardCheckpointLocked();
}

void Rounder::start(std::vector<HistoryEntry> snapshot, PasteContext paste) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        log_.debug("rounder", "restarting active cycle");
        discardCheckpointLocked();
    }
    resetLocked();
    active_ = true;
    snapshot_ = std::move(snapshot);
    cursor_ = 0;
    paste_ = std::move(paste);
    log_.debug("rounder", "started with " + std::to_string(snapshot_.size()) + " entries");
}

std::optional<CycleStep> Rounder::stepLocked(CycleDirection dir) {
    if (!active_ || snapshot_.empty()) {
        log_.debug("rounder", "navigation ignored: not active or no entries");
        return std::nullopt;
    }
    if (dir == CycleDirection::Older) {
        if (cursor_ + 1 >= snapshot_.size()) {
            log_.debug("rounder", "already at oldest entry");
            return std::nullopt;
        }
        ++cursor_;
    } else {
        if (cursor_ == 0) {
            log_.debug("rounder", "already at newest entry");
            return std::nullopt;
        }
        --cursor_;
    }
    const bool first = first_cycle_;
    first_cycle_ = false;
    return makeStepLocked(first);
}

CycleStep Rounder::makeStepLocked(bool first) const {
    CycleStep step;
    step.entry = snapshot_[cursor_];
    step.index = cursor_;
    step.applyToken = apply_token_;
    step.firstStep = first;
    step.overrides = overrides_;
    return step;
}

std::optional<CycleStep> Rounder::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stepLocked(CycleDirection::Older);
}

std::optional<CycleStep> Rounder::previous() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stepLocked(CycleDirection::Newer);
}

void Rounder::applyLocked(const CycleStep& step, ICheckpointStore& checkpoints, IEntryApplier& applier) {
    ApplyingScope scope(applying_);
    if (checkpoint_) checkpoints.restore(*checkpoint_);
    AppliedChange change = applier.apply(step.entry, step, *paste_, checkpoint_.get());
    if (change.undoSeq) apply_token_ = *change.undoSeq;
    last_applied_ = change;
}

std::optional<CycleStep> Rounder::cycle(CycleDirection dir, ICheckpointStore& checkpoints, IEntryApplier& applier) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t saved_cursor = cursor_;
    const bool saved_first = first_cycle_;
    auto step = stepLocked(dir);
    if (!step) return std::nullopt;
    try {
        applyLocked(*step, checkpoints, applier);
    } catch (...) {
        cursor_ = saved_cursor;
        first_cycle_ = saved_first;
        throw;
    }
    log_.debug("rounder", "applied index " + std::to_string(step->index) + " id=" +
                              std::to_string(step->entry.id.value_or(-1)) + " \"" + preview(step->entry.content) +
                              "\"");
    return step;
}

std::optional<CycleStep> Rounder::reapply(ICheckpointStore& checkpoints, IEntryApplier& applier) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || cursor_ >= snapshot_.size()) return std::nullopt;
    CycleStep step = makeStepLocked(first_cycle_);
    applyLocked(step, checkpoints, applier);
    return step;
}

void Rounder::stop(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return;
    discardCheckpointLocked();
    resetLocked();
    log_.debug("rounder", "stopped: " + reason);
}

void Rounder::discardCheckpointLocked() {
    if (!checkpoint_) return;
    try {
        checkpoint_->discard();
    } catch (const std::exception& e) {
        log_.error("rounder", "failed to discard checkpoint " + checkpoint_->describe() + ": " + e.what());
    }
    checkpoint_.reset();
}

void Rounder::resetLocked() {
    active_ = false;
    snapshot_.clear();
    cursor_ = 0;
    first_cycle_ = true;
    paste_.reset();
    checkpoint_.reset();
    apply_token_ = 0;
    last_applied_.reset();
    cursor_before_paste_.reset();
    overrides_.clear();
    replace_info_.reset();
}

bool Rounder::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool Rounder::isFirstCycle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return first_cycle_;
}

std::optional<HistoryEntry> Rounder::currentEntry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || cursor_ >= snapshot_.size()) return std::nullopt;
    return snapshot_[cursor_];
}

std::optional<PasteContext> Rounder::pasteContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paste_;
}

std::optional<Position> Rounder::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || snapshot_.empty()) return std::nullopt;
    return Position {cursor_ + 1, snapshot_.size()};
}

void Rounder::setCheckpoint(std::unique_ptr<Checkpoint> checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    discardCheckpointLocked();
    checkpoint_ = std::move(checkpoint);
    // nothing to own it while idle
    if (!active_) discardCheckpointLocked();
}

bool Rounder::hasCheckpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkpoint_ != nullptr;
}

void Rounder::setApplyToken(int64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply_token_ = token;
}

int64_t Rounder::applyToken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_token_;
}

void Rounder::recordApplied(const AppliedChange& change) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (change.undoSeq) apply_token_ = *change.undoSeq;
    last_applied_ = change;
}

std::optional<AppliedChange> Rounder::lastApplied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_applied_;
}

void Rounder::setCursorBeforePaste(CursorPos pos) {
    std::lock_guard<std::mutex> lock(mutex_);
    cursor_before_paste_ = pos;
}

std::optional<CursorPos> Rounder::cursorBeforePaste() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_before_paste_;
}

void Rounder::setPresentationOverride(const std::string& key, bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[key] = value;
}

std::optional<bool> Rounder::presentationOverride(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = overrides_.find(key);
    if (it == overrides_.end()) return std::nullopt;
    return it->second;
}

void Rounder::setReplaceInfo(ReplaceInfo info) {
    std::lock_guard<std::mutex> lock(mutex_);
    replace_info_ = std::move(info);
}

std::optional<ReplaceInfo> Rounder::replaceInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return replace_info_;
}

Rounder& RounderManager::getRounder(SessionId session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = rounders_[session];
    if (!slot) {
        log_.debug("rounder", "creating rounder for session " + std::to_string(session));
        slot = std::make_unique<Rounder>(log_);
    }
    return *slot;
}

bool RounderManager::hasRounder(SessionId session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rounders_.count(session) != 0;
}

void RounderManager::deleteRounder(SessionId session) {
    std::unique_ptr<Rounder> victim;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rounders_.find(session);
        if (it == rounders_.end()) return;
        victim = std::move(it->second);
        rounders_.erase(it);
    }
    victim->stop("session closed");
}

void RounderManager::clear() {
    std::unordered_map<SessionId, std::unique_ptr<Rounder>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(rounders_);
    }
    for (auto& kv : all) kv.second->stop("manager cleared");
}

size_t RounderManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rounders_.size();
}

} // namespace yankring
