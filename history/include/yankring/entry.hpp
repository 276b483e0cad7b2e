#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace yankring {

// Register type of a captured yank
enum class EntryKind : uint8_t {
    Charwise = 0,
    Linewise = 1,
    Blockwise = 2,
};

constexpr const char* kUnnamedChannel = "\"";

struct HistoryEntry {
    std::optional<int64_t> id;      // rowid, set by the store
    std::string content;
    EntryKind kind {EntryKind::Charwise};
    std::optional<int> blockWidth;  // blockwise only
    int64_t timestamp {0};          // milliseconds since epoch
    int64_t size {0};               // byte length of content at insertion
    std::string sourceChannel;
    std::optional<std::string> sourceFile;
    std::optional<int> sourceLine;
    std::optional<std::string> sourceContentType;
};

// (lastTimestamp, entryCount) of the store, compared by the sync coordinator
struct SyncStatus {
    int64_t lastTimestamp {0};
    int64_t entryCount {0};

    bool operator==(const SyncStatus& o) const {
        return lastTimestamp == o.lastTimestamp && entryCount == o.entryCount;
    }
    bool operator!=(const SyncStatus& o) const { return !(*this == o); }
};

// Persisted code of a kind: 'v', 'V' or 'b'
const char* kindCode(EntryKind kind);

// Parses a persisted code; nullopt for anything outside the closed set.
std::optional<EntryKind> kindFromCode(std::string_view code);

// Parses an editor regtype string ("v", "V", "\x16<width>", "b").
// Unknown values fall back to charwise. Block width is written to *width when present.
EntryKind parseKind(std::string_view regtype, std::optional<int>* width = nullptr);

int64_t now_ms();

} // namespace yankring
