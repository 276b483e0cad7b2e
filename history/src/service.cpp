#include "yankring/service.hpp"
#include "yankring/db.hpp"
#include "yankring/errors.hpp"
#include <chrono>

namespace yankring {

HistoryService::HistoryService(IRegisterReader& registers,
                               ICheckpointStore& checkpoints,
                               IEntryApplier& applier,
                               IHighlighter& highlighter,
                               std::ostream* log_out)
    : log_(false, log_out),
      registers_(registers),
      checkpoints_(checkpoints),
      applier_(applier),
      highlighter_(highlighter),
      rounders_(log_) {}

HistoryService::~HistoryService() {
    shutdown();
}

bool HistoryService::initialize(const Config& config) {
    log_.setDebug(config.debug);
    StoreOptions opts;
    opts.maxEntries = static_cast<size_t>(config.maxEntries);
    opts.maxContentSize = config.maxContentSize;
    opts.lockTimeout = std::chrono::milliseconds(config.lockTimeoutMs);
    try {
        return initialize(config, SqliteEntryStore::open(config.persistPath, opts, log_));
    } catch (const std::exception& e) {
        log_.error("service", std::string("history unavailable: ") + e.what());
        return false;
    }
}

bool HistoryService::initialize(const Config& config, std::unique_ptr<IEntryStore> store) {
    if (ready()) shutdown();
    config_ = config;
    log_.setDebug(config.debug);
    if (!store) {
        log_.error("service", "no store given");
        return false;
    }

    auto cache = std::make_unique<HistoryCache>(static_cast<size_t>(config_.maxEntries));
    cache->setAll(store->recent(static_cast<size_t>(config_.maxEntries)));
    auto sync = std::make_unique<SyncCoordinator>(*store, *cache, static_cast<size_t>(config_.maxEntries), log_);
    sync->updateStatus();
    auto monitor = std::make_unique<RegisterMonitor>(*store, *cache, rounders_, registers_, highlighter_,
                                                     config_.trackedChannels(), log_);

    store_ = std::move(store);
    cache_ = std::move(cache);
    sync_ = std::move(sync);
    monitor_ = std::move(monitor);
    log_.debug("service", "initialized with " + std::to_string(cache_->size()) + " entries from " +
                              config_.persistPath);
    return true;
}

std::optional<HistoryEntry> HistoryService::onYank(const ChangeEvent& event) {
    if (!ready()) return std::nullopt;
    return recordLocal(monitor_->checkChanges(event, true));
}

std::optional<HistoryEntry> HistoryService::pollRegisters(SessionId session) {
    if (!ready()) return std::nullopt;
    // while cycling the unnamed channel holds what the cycle put there
    if (activeRounder(session)) return std::nullopt;
    return recordLocal(monitor_->checkChanges(ChangeEvent {session, std::nullopt}, false));
}

std::optional<HistoryEntry> HistoryService::recordLocal(std::optional<HistoryEntry> stored) {
    // own writes are already in the cache; a reload would lose moveToFront promotions
    if (stored) {
        guarded(log_, "service recordLocal", [&] { sync_->noteLocalAppend(*stored); });
    }
    return stored;
}

Rounder* HistoryService::activeRounder(SessionId session) {
    if (!rounders_.hasRounder(session)) return nullptr;
    Rounder& rounder = rounders_.getRounder(session);
    return rounder.isActive() ? &rounder : nullptr;
}

bool HistoryService::preparePaste(SessionId session, const PasteContext& paste, std::optional<CursorPos> cursor_before) {
    if (!ready()) return false;
    return guarded(log_, "service preparePaste", false, [&] {
        sync_->syncIfNeeded();
        if (activeRounder(session)) stopCycling(session, "new paste");

        auto entries = cache_->getAll();
        if (entries.empty()) {
            log_.debug("service", "no history to cycle");
            return false;
        }

        // taken first: a cycle must never run without the state to restore
        auto checkpoint = checkpoints_.save();
        Rounder& rounder = rounders_.getRounder(session);
        rounder.start(std::move(entries), paste);
        if (cursor_before) rounder.setCursorBeforePaste(*cursor_before);
        rounder.setCheckpoint(std::move(checkpoint));
        return true;
    });
}

void HistoryService::onPasteExecuted(SessionId session, const AppliedChange& change) {
    if (!ready()) return;
    guarded(log_, "service onPasteExecuted", [&] {
        Rounder* rounder = activeRounder(session);
        if (!rounder) return;
        rounder->recordApplied(change);
        if (auto paste = rounder->pasteContext()) highlight(*paste);
    });
}

std::optional<Position> HistoryService::cycleOlder(SessionId session) {
    return cycle(session, CycleDirection::Older);
}

std::optional<Position> HistoryService::cycleNewer(SessionId session) {
    return cycle(session, CycleDirection::Newer);
}

std::optional<Position> HistoryService::cycle(SessionId session, CycleDirection dir) {
    if (!ready()) return std::nullopt;
    return guarded(log_, "service cycle", std::optional<Position>(), [&]() -> std::optional<Position> {
        Rounder* rounder = activeRounder(session);
        if (!rounder) {
            log_.debug("service", "cycle ignored: no paste to cycle");
            return std::nullopt;
        }
        sync_->syncIfNeeded();

        auto step = rounder->cycle(dir, checkpoints_, applier_);
        if (!step) return std::nullopt;

        // the applier puts the entry into its source register, which the editor mirrors into the unnamed one
        const std::string& target = step->entry.sourceChannel.empty() ? std::string(kUnnamedChannel)
                                                                      : step->entry.sourceChannel;
        monitor_->acknowledge(target, step->entry.content);
        monitor_->acknowledge(kUnnamedChannel, step->entry.content);

        if (auto paste = rounder->pasteContext()) highlight(*paste);
        return rounder->position();
    });
}

bool HistoryService::presentationDefault(const std::string& key) const {
    if (key == "smart_indent") return config_.smartIndent;
    return false;
}

std::optional<bool> HistoryService::toggleOverride(SessionId session, const std::string& key) {
    if (!ready()) return std::nullopt;
    return guarded(log_, "service toggleOverride", std::optional<bool>(), [&]() -> std::optional<bool> {
        Rounder* rounder = activeRounder(session);
        if (!rounder) return std::nullopt;

        const bool value = !rounder->presentationOverride(key).value_or(presentationDefault(key));
        rounder->setPresentationOverride(key, value);
        log_.debug("service", key + (value ? " on" : " off"));
        if (rounder->reapply(checkpoints_, applier_)) {
            if (auto paste = rounder->pasteContext()) highlight(*paste);
        }
        return value;
    });
}

void HistoryService::onCursorMoved(SessionId session, CursorPos cursor, int64_t change_tick) {
    if (!ready()) return;
    guarded(log_, "service onCursorMoved", [&] {
        Rounder* rounder = activeRounder(session);
        if (!rounder || rounder->isApplying()) return;
        auto last = rounder->lastApplied();
        if (!last) return;
        if (last->cursor != cursor || last->changeTick != change_tick) {
            stopCycling(session, "cursor moved");
        }
    });
}

void HistoryService::stopCycling(SessionId session, const std::string& reason) {
    if (!ready()) return;
    guarded(log_, "service stopCycling", [&] {
        Rounder* rounder = activeRounder(session);
        if (!rounder) return;
        // the entry the user settled on becomes the newest
        if (auto current = rounder->currentEntry()) {
            if (current->id) cache_->moveToFront(*current->id);
        }
        rounder->stop(reason);
        highlighter_.clear();
    });
}

void HistoryService::closeSession(SessionId session) {
    stopCycling(session, "session closed");
    rounders_.deleteRounder(session);
}

std::vector<HistoryEntry> HistoryService::listHistory(size_t limit) {
    if (!ready()) return {};
    return guarded(log_, "service listHistory", std::vector<HistoryEntry>(), [&] {
        sync_->syncIfNeeded();
        return cache_->getRecent(limit);
    });
}

std::vector<HistoryEntry> HistoryService::search(const std::string& query, size_t limit) {
    if (!ready()) return {};
    return guarded(log_, "service search", std::vector<HistoryEntry>(), [&] {
        sync_->syncIfNeeded();
        return cache_->search(query, limit);
    });
}

CacheStats HistoryService::stats() const {
    if (!ready()) return {};
    return cache_->stats();
}

void HistoryService::highlight(const PasteContext& paste) {
    if (!config_.useRegionHighlight) return;
    highlighter_.apply(paste.channel);
}

void HistoryService::shutdown() {
    rounders_.clear();
    if (!ready()) return;
    guarded(log_, "service shutdown", [&] {
        highlighter_.clear();
        store_->close();
    });
    monitor_.reset();
    sync_.reset();
    cache_.reset();
    store_.reset();
    log_.debug("service", "shut down");
}

} // namespace yankring
