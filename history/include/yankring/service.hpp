#pragma once

#include "yankring/cache.hpp"
#include "yankring/config.hpp"
#include "yankring/editor.hpp"
#include "yankring/log.hpp"
#include "yankring/register_monitor.hpp"
#include "yankring/rounder.hpp"
#include "yankring/store.hpp"
#include "yankring/sync.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yankring {

// Entry point used by the editor integration. Owns the store, cache, sync
// coordinator, rounders and register monitor; the editor capabilities are
// borrowed and must outlive the service.
//
// Every operation is safe to call before initialize() or after a failed
// one: it logs and does nothing.
class HistoryService {
public:
    HistoryService(IRegisterReader& registers,
                   ICheckpointStore& checkpoints,
                   IEntryApplier& applier,
                   IHighlighter& highlighter,
                   std::ostream* log_out = nullptr);
    ~HistoryService();

    HistoryService(const HistoryService&) = delete;
    HistoryService& operator=(const HistoryService&) = delete;

    // Opens <persistPath>/history.db and loads the cache. False on failure.
    bool initialize(const Config& config);
    // Same, over an already opened store
    bool initialize(const Config& config, std::unique_ptr<IEntryStore> store);
    bool ready() const { return store_ != nullptr; }

    // The editor reported a yank into event.channel
    std::optional<HistoryEntry> onYank(const ChangeEvent& event);
    // Compares the unnamed channel with its baseline
    std::optional<HistoryEntry> pollRegisters(SessionId session);

    // Called right before a paste; begins a cycle over the current cache.
    bool preparePaste(SessionId session, const PasteContext& paste, std::optional<CursorPos> cursor_before = {});
    void onPasteExecuted(SessionId session, const AppliedChange& change);

    std::optional<Position> cycleOlder(SessionId session);
    std::optional<Position> cycleNewer(SessionId session);

    // Flips a transient presentation option and re-applies the current entry.
    // Returns the new value, nullopt when not cycling.
    std::optional<bool> toggleOverride(SessionId session, const std::string& key);

    void onCursorMoved(SessionId session, CursorPos cursor, int64_t change_tick);
    void stopCycling(SessionId session, const std::string& reason);
    void closeSession(SessionId session);

    std::vector<HistoryEntry> listHistory(size_t limit);
    std::vector<HistoryEntry> search(const std::string& query, size_t limit = HistoryCache::kDefaultSearchLimit);
    CacheStats stats() const;

    // Stops every cycle and closes the store. Idempotent.
    void shutdown();

    const Config& config() const { return config_; }
    const Logger& logger() const { return log_; }
    RounderManager& rounders() { return rounders_; }

private:
    std::optional<Position> cycle(SessionId session, CycleDirection dir);
    std::optional<HistoryEntry> recordLocal(std::optional<HistoryEntry> stored);
    Rounder* activeRounder(SessionId session);
    bool presentationDefault(const std::string& key) const;
    void highlight(const PasteContext& paste);

    Logger log_;
    IRegisterReader& registers_;
    ICheckpointStore& checkpoints_;
    IEntryApplier& applier_;
    IHighlighter& highlighter_;
    Config config_;
    RounderManager rounders_;
    std::unique_ptr<IEntryStore> store_;
    std::unique_ptr<HistoryCache> cache_;
    std::unique_ptr<SyncCoordinator> sync_;
    std::unique_ptr<RegisterMonitor> monitor_;
};

} // namespace yankring
