#pragma once

#include "yankring/editor.hpp"
#include "yankring/entry.hpp"
#include "yankring/log.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace yankring {

enum class CycleDirection : uint8_t {
    Older, // next()
    Newer, // previous()
};

struct CycleStep {
    HistoryEntry entry;
    size_t index {0};
    int64_t applyToken {0};
    // true for the first navigation of a cycle: the buffer still holds the
    // text pasted before cycling began
    bool firstStep {false};
    std::unordered_map<std::string, bool> overrides;
};

// Set when cycling was entered through "replace selection with register"
struct ReplaceInfo {
    bool singleUndo {false};
    std::string motionWise;
    std::optional<TextRange> deletedRange;
};

struct Position {
    size_t current {0}; // 1-based
    size_t total {0};
};

// Per-session history cycling state machine (Idle / Active).
//
// start() captures an immutable snapshot of the cache; the cursor starts at
// index 0, the content already applied. next() walks toward older entries and
// previous() toward newer ones; neither wraps. All state transitions hold the
// rounder's own mutex, including the editor calls made by cycle(), so the
// applier must not call back into the same rounder.
class Rounder {
public:
    explicit Rounder(const Logger& log);
    ~Rounder();

    Rounder(const Rounder&) = delete;
    Rounder& operator=(const Rounder&) = delete;

    // Idle -> Active, or restarts an active cycle (old checkpoint discarded)
    void start(std::vector<HistoryEntry> snapshot, PasteContext paste);

    // Cursor movement only. nullopt when idle or at the boundary.
    std::optional<CycleStep> next();
    std::optional<CycleStep> previous();

    // Moves the cursor, restores the checkpoint, applies the new entry and
    // records what the editor reported. The cursor is left unchanged if the
    // editor calls fail.
    std::optional<CycleStep> cycle(CycleDirection dir, ICheckpointStore& checkpoints, IEntryApplier& applier);

    // Re-applies the current entry, e.g. after a presentation override changed
    std::optional<CycleStep> reapply(ICheckpointStore& checkpoints, IEntryApplier& applier);

    // Active -> Idle. Discards the checkpoint. No-op when already idle.
    void stop(const std::string& reason);

    bool isActive() const;
    bool isFirstCycle() const;
    bool isApplying() const { return applying_.load(); }
    std::optional<HistoryEntry> currentEntry() const;
    std::optional<PasteContext> pasteContext() const;
    std::optional<Position> position() const;

    void setCheckpoint(std::unique_ptr<Checkpoint> checkpoint);
    bool hasCheckpoint() const;
    void setApplyToken(int64_t token);
    int64_t applyToken() const;

    void recordApplied(const AppliedChange& change);
    std::optional<AppliedChange> lastApplied() const;
    void setCursorBeforePaste(CursorPos pos);
    std::optional<CursorPos> cursorBeforePaste() const;

    // Transient presentation options, dropped on stop()
    void setPresentationOverride(const std::string& key, bool value);
    std::optional<bool> presentationOverride(const std::string& key) const;

    void setReplaceInfo(ReplaceInfo info);
    std::optional<ReplaceInfo> replaceInfo() const;

private:
    std::optional<CycleStep> stepLocked(CycleDirection dir);
    CycleStep makeStepLocked(bool first) const;
    void applyLocked(const CycleStep& step, ICheckpointStore& checkpoints, IEntryApplier& applier);
    void discardCheckpointLocked();
    void resetLocked();

    const Logger& log_;
    bool active_ {false};
    std::vector<HistoryEntry> snapshot_;
    size_t cursor_ {0};
    bool first_cycle_ {true};
    std::optional<PasteContext> paste_;
    std::unique_ptr<Checkpoint> checkpoint_;
    int64_t apply_token_ {0};
    std::optional<AppliedChange> last_applied_;
    std::optional<CursorPos> cursor_before_paste_;
    std::unordered_map<std::string, bool> overrides_;
    std::optional<ReplaceInfo> replace_info_;
    std::atomic<bool> applying_ {false};
    mutable std::mutex mutex_;
};

// One rounder per editing session, created on first use.
class RounderManager {
public:
    explicit RounderManager(const Logger& log) : log_(log) {}

    Rounder& getRounder(SessionId session);
    bool hasRounder(SessionId session) const;
    void deleteRounder(SessionId session);
    // Stops and drops every rounder
    void clear();
    size_t size() const;

private:
    const Logger& log_;
    std::unordered_map<SessionId, std::unique_ptr<Rounder>> rounders_;
    mutable std::mutex mutex_;
};

} // namespace yankring
