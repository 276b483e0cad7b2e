#pragma once

#include "yankring/entry.hpp"
#include <memory>
#include <optional>
#include <string>

namespace yankring {

using SessionId = int;

struct CursorPos {
    int line {0};
    int col {0};

    bool operator==(const CursorPos& o) const { return line == o.line && col == o.col; }
    bool operator!=(const CursorPos& o) const { return !(*this == o); }
};

struct TextRange {
    CursorPos start;
    CursorPos end;
};

enum class PasteMode : uint8_t { After, Before, AfterMoveCursor, BeforeMoveCursor };

// How a paste was issued; captured when cycling starts
struct PasteContext {
    PasteMode mode {PasteMode::After};
    int count {1};
    std::string channel {kUnnamedChannel};
    bool visual {false};
    // concrete command used by a replace operation, overrides mode when set
    std::optional<PasteMode> applyMode;
};

// What the host reports after putting text into the buffer
struct AppliedChange {
    TextRange range;
    CursorPos cursor;
    int64_t changeTick {0};
    // host undo sequence after the change, when the host reports one
    std::optional<int64_t> undoSeq;
};

// Content currently held in a channel, with optional provenance
struct ChannelContent {
    std::string text;
    std::string regtype {"v"};
    std::optional<std::string> sourceFile;
    std::optional<int> sourceLine;
    std::optional<std::string> sourceContentType;
};

// Saved editor undo state. Owned by the rounder for the duration of one cycle.
// Hosts that write undo state to a file return a SideFileCheckpoint
// (yankring/side_file_checkpoint.hpp) from ICheckpointStore::save().
class Checkpoint {
public:
    virtual ~Checkpoint() = default;
    virtual std::string describe() const = 0;
    // Releases the underlying resource. Idempotent; a resource that is already
    // gone is not an error.
    virtual void discard() = 0;
};

class IRegisterReader {
public:
    virtual ~IRegisterReader() = default;
    virtual std::optional<ChannelContent> read(const std::string& channel) = 0;
};

class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;
    // nullptr when there is nothing meaningful to save (no edit history yet)
    virtual std::unique_ptr<Checkpoint> save() = 0;
    // Must treat a checkpoint whose resource was removed as already restored
    virtual void restore(const Checkpoint& checkpoint) = 0;
};

struct CycleStep;

class IEntryApplier {
public:
    virtual ~IEntryApplier() = default;
    // Puts entry into the buffer in place of the previous step. Repeating a call
    // for the same step and checkpoint gives the same result.
    virtual AppliedChange apply(const HistoryEntry& entry,
                                const CycleStep& step,
                                const PasteContext& paste,
                                const Checkpoint* checkpoint) = 0;
};

// Presentation only
class IHighlighter {
public:
    virtual ~IHighlighter() = default;
    virtual void apply(const std::string& channel) = 0;
    virtual void clear() = 0;
};

class NullHighlighter : public IHighlighter {
public:
    void apply(const std::string&) override {}
    void clear() override {}
};

} // namespace yankring
