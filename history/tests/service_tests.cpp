#include "yankring/db.hpp"
#include "yankring/service.hpp"
#include "test_fakes.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace yankring;
using namespace yankring::testing;

struct Editor {
    FakeRegisterReader registers;
    FakeCheckpointStore checkpoints;
    FakeApplier applier;
    RecordingHighlighter highlighter;
    std::ostringstream logs;
};

static Config config_for(const TempDir& dir) {
    Config c;
    c.persistPath = dir.str();
    c.registerKeys = "ab";
    return c;
}

static void yank(HistoryService& svc, Editor& ed, const std::string& text, const std::string& channel = "\"") {
    ed.registers.set(channel, text);
    if (channel != "\"") ed.registers.set("\"", text);
    auto stored = svc.onYank(ChangeEvent {1, channel});
    assert(stored && stored->content == text);
}

static void test_yank_paste_cycle() {
    TempDir dir("service-cycle");
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    assert(svc.ready());

    yank(svc, ed, "E3");
    yank(svc, ed, "E2");
    yank(svc, ed, "E1");
    assert(svc.listHistory(10).size() == 3);
    assert(svc.listHistory(10)[0].content == "E1");

    PasteContext paste;
    assert(svc.preparePaste(1, paste, CursorPos {1, 0}));
    assert(ed.checkpoints.saved == 1);
    assert(svc.rounders().getRounder(1).cursorBeforePaste() == CursorPos({1, 0}));

    AppliedChange pasted;
    pasted.cursor = CursorPos {1, 2};
    pasted.changeTick = 5;
    svc.onPasteExecuted(1, pasted);
    assert(ed.highlighter.applied.size() == 1);

    auto pos = svc.cycleOlder(1);
    assert(pos && pos->current == 2 && pos->total == 3);
    assert(ed.applier.applied.back() == "E2");
    pos = svc.cycleOlder(1);
    assert(pos && pos->current == 3);
    assert(ed.applier.applied.back() == "E3");
    assert(!svc.cycleOlder(1));
    pos = svc.cycleNewer(1);
    assert(pos && pos->current == 2);
    assert(ed.applier.applied.back() == "E2");
    assert(ed.checkpoints.restored.size() == 3);

    // the editor now holds E2 in the unnamed register; polling must not record it
    ed.registers.set("\"", "E2");
    assert(!svc.pollRegisters(1));

    // cursor where the last application left it: still cycling
    auto last = svc.rounders().getRounder(1).lastApplied();
    svc.onCursorMoved(1, last->cursor, last->changeTick);
    assert(svc.rounders().getRounder(1).isActive());

    // moving away ends the cycle and promotes E2
    svc.onCursorMoved(1, CursorPos {last->cursor.line + 1, 0}, last->changeTick);
    assert(!svc.rounders().getRounder(1).isActive());
    assert(ed.checkpoints.discarded == 1);
    assert(ed.highlighter.cleared >= 1);
    auto history = svc.listHistory(10);
    assert(history[0].content == "E2");
    assert(history[1].content == "E1");
    assert(history[2].content == "E3");

    // the cycled content is not a new yank after the cycle either
    assert(!svc.pollRegisters(1));
    assert(svc.listHistory(10).size() == 3);

    assert(!svc.cycleOlder(1));
}

static void test_new_yank_and_change_tick_stop_cycle() {
    TempDir dir("service-stop");
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    yank(svc, ed, "one");
    yank(svc, ed, "two");

    assert(svc.preparePaste(1, PasteContext {}));
    assert(svc.cycleOlder(1));
    auto last = svc.rounders().getRounder(1).lastApplied();
    svc.onCursorMoved(1, last->cursor, last->changeTick + 1);
    assert(!svc.rounders().getRounder(1).isActive());

    assert(svc.preparePaste(1, PasteContext {}));
    yank(svc, ed, "three", "a");
    assert(!svc.rounders().getRounder(1).isActive());
    assert(ed.checkpoints.discarded == 2);
    assert(svc.listHistory(10)[0].content == "three");
    assert(svc.listHistory(10)[0].sourceChannel == "a");

    // untracked channel
    ed.registers.set("q", "ignored");
    assert(!svc.onYank(ChangeEvent {1, std::string("q")}));

    // a second paste restarts the cycle over the fresh cache
    assert(svc.preparePaste(1, PasteContext {}));
    assert(svc.preparePaste(1, PasteContext {}));
    assert(ed.checkpoints.discarded == 3);
    assert(svc.rounders().getRounder(1).position()->total == 3);
}

static void test_sessions_are_independent() {
    TempDir dir("service-sessions");
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    yank(svc, ed, "x");
    yank(svc, ed, "y");

    assert(svc.preparePaste(1, PasteContext {}));
    assert(svc.preparePaste(2, PasteContext {}));
    assert(svc.cycleOlder(2));
    svc.stopCycling(2, "done");
    assert(svc.rounders().getRounder(1).isActive());
    assert(svc.cycleOlder(1)->current == 2);

    svc.closeSession(1);
    assert(!svc.rounders().hasRounder(1));
    assert(!svc.cycleOlder(1));
}

static void test_toggle_override() {
    TempDir dir("service-toggle");
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    assert(!svc.toggleOverride(1, "smart_indent"));

    yank(svc, ed, "a");
    yank(svc, ed, "b");
    assert(svc.preparePaste(1, PasteContext {}));
    assert(svc.cycleOlder(1));

    // smart_indent defaults to on, so the first toggle turns it off
    auto v = svc.toggleOverride(1, "smart_indent");
    assert(v && *v == false);
    assert(ed.applier.applied.back() == "a");
    assert(ed.applier.steps.back().overrides.at("smart_indent") == false);
    v = svc.toggleOverride(1, "smart_indent");
    assert(v && *v == true);

    svc.stopCycling(1, "done");
    assert(!svc.rounders().getRounder(1).presentationOverride("smart_indent"));
}

static void test_cross_process_sync() {
    TempDir dir("service-sync");
    Editor ed1;
    Editor ed2;
    HistoryService first(ed1.registers, ed1.checkpoints, ed1.applier, ed1.highlighter, &ed1.logs);
    HistoryService second(ed2.registers, ed2.checkpoints, ed2.applier, ed2.highlighter, &ed2.logs);
    assert(first.initialize(config_for(dir)));
    assert(second.initialize(config_for(dir)));

    yank(first, ed1, "shared");
    auto seen = second.listHistory(10);
    assert(seen.size() == 1 && seen[0].content == "shared");
    assert(second.search("SHAR").size() == 1);
    assert(second.stats().entryCount == 1);

    // a history that only exists elsewhere can be cycled here
    assert(second.preparePaste(1, PasteContext {}));
    assert(second.rounders().getRounder(1).position()->total == 1);
}

static void test_persisted_history_loaded() {
    TempDir dir("service-reload");
    {
        Editor ed;
        HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
        assert(svc.initialize(config_for(dir)));
        yank(svc, ed, "survives");
        svc.shutdown();
        svc.shutdown();
        assert(!svc.ready());
    }
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    assert(svc.stats().entryCount == 1);
    assert(svc.listHistory(1)[0].content == "survives");
}

static void test_unavailable_store() {
    TempDir dir("service-broken");
    // a regular file where the data directory should be
    const auto blocker = dir.path() / "not-a-dir";
    std::ofstream(blocker) << "x";
    Config c;
    c.persistPath = (blocker / "sub").string();

    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(!svc.initialize(c));
    assert(!svc.ready());
    assert(ed.logs.str().find("history unavailable") != std::string::npos);

    // everything degrades to a no-op
    ed.registers.set("\"", "text");
    assert(!svc.onYank(ChangeEvent {1, std::string("\"")}));
    assert(!svc.pollRegisters(1));
    assert(!svc.preparePaste(1, PasteContext {}));
    assert(!svc.cycleOlder(1));
    assert(svc.listHistory(10).empty());
    assert(svc.search("t").empty());
    assert(svc.stats().entryCount == 0);
    svc.onCursorMoved(1, CursorPos {}, 0);
    svc.stopCycling(1, "x");
    svc.shutdown();

    // empty history: nothing to cycle
    TempDir empty("service-empty");
    HistoryService fresh(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(fresh.initialize(config_for(empty)));
    assert(!fresh.preparePaste(1, PasteContext {}));
    assert(ed.checkpoints.saved == 0);
}

static void test_editor_failure_is_contained() {
    TempDir dir("service-editor-failure");
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    yank(svc, ed, "p");
    yank(svc, ed, "q");
    assert(svc.preparePaste(1, PasteContext {}));

    ed.applier.failApply = true;
    assert(!svc.cycleOlder(1));
    assert(ed.logs.str().find("apply failed") != std::string::npos);
    assert(svc.rounders().getRounder(1).position()->current == 1);

    ed.applier.failApply = false;
    assert(svc.cycleOlder(1)->current == 2);
}

static void test_memory_store_injection() {
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    Config c;
    c.maxEntries = 2;
    c.useRegionHighlight = false;
    auto store = std::make_unique<MemoryStore>(2);
    store->append(make_entry("seed", 1));
    assert(svc.initialize(c, std::move(store)));
    assert(svc.listHistory(10).size() == 1);

    yank(svc, ed, "n1");
    yank(svc, ed, "n2");
    assert(svc.listHistory(10).size() == 2);
    assert(svc.preparePaste(1, PasteContext {}));
    assert(svc.cycleOlder(1));
    assert(ed.highlighter.applied.empty());

    assert(!svc.initialize(c, nullptr));
    assert(!svc.ready());
}

static void test_failed_checkpoint_does_not_start_cycle() {
    TempDir dir("service-checkpoint-failure");
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    yank(svc, ed, "first");
    yank(svc, ed, "second");

    ed.checkpoints.failSave = true;
    assert(!svc.preparePaste(1, PasteContext {}));
    assert(!svc.rounders().getRounder(1).isActive());
    assert(ed.logs.str().find("undo state not written") != std::string::npos);

    // no cycle step may run without a checkpoint to restore
    assert(!svc.cycleOlder(1));
    assert(ed.applier.applied.empty());

    // an active cycle is ended, not left half-restarted
    ed.checkpoints.failSave = false;
    assert(svc.preparePaste(1, PasteContext {}));
    ed.checkpoints.failSave = true;
    assert(!svc.preparePaste(1, PasteContext {}));
    assert(!svc.rounders().getRounder(1).isActive());
    assert(ed.checkpoints.discarded == 1);

    ed.checkpoints.failSave = false;
    assert(svc.preparePaste(1, PasteContext {}));
    assert(svc.cycleOlder(1));
    assert(ed.checkpoints.restored.size() == 1);
}

static void test_promotion_survives_own_yank() {
    TempDir dir("service-promotion");
    Editor ed;
    HistoryService svc(ed.registers, ed.checkpoints, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    yank(svc, ed, "E3");
    yank(svc, ed, "E2");
    yank(svc, ed, "E1");

    assert(svc.preparePaste(1, PasteContext {}));
    assert(svc.cycleOlder(1));
    assert(svc.cycleOlder(1));
    svc.stopCycling(1, "done");
    assert(svc.listHistory(10)[0].content == "E3");

    yank(svc, ed, "E4");
    auto history = svc.listHistory(10);
    assert(history.size() == 4);
    assert(history[0].content == "E4");
    assert(history[1].content == "E3");
    assert(history[2].content == "E1");
    assert(history[3].content == "E2");

    // a write from another process still forces a reload, back to stored order
    StoreOptions opts;
    auto other = SqliteEntryStore::open(dir.str(), opts, svc.logger());
    other->append(make_entry("elsewhere", now_ms() + 60000));
    yank(svc, ed, "E5");
    history = svc.listHistory(10);
    assert(history.size() == 6);
    assert(history[0].content == "elsewhere");
    assert(history[1].content == "E5");
    assert(history[2].content == "E4");
    assert(history[3].content == "E1");
    other->close();
}

static void test_side_file_checkpoints_are_removed() {
    TempDir dir("service-side-files");
    Editor ed;
    FileCheckpointStore files;
    HistoryService svc(ed.registers, files, ed.applier, ed.highlighter, &ed.logs);
    assert(svc.initialize(config_for(dir)));
    yank(svc, ed, "left");
    yank(svc, ed, "right");

    assert(svc.preparePaste(1, PasteContext {}));
    assert(files.files.size() == 1);
    assert(std::filesystem::exists(files.files[0]));
    assert(svc.cycleOlder(1));
    assert(files.restored.size() == 1);
    assert(files.restored[0] == files.files[0].string());

    // a new paste replaces the file, stopping removes the last one
    assert(svc.preparePaste(1, PasteContext {}));
    assert(files.files.size() == 2);
    assert(!std::filesystem::exists(files.files[0]));
    assert(std::filesystem::exists(files.files[1]));
    svc.stopCycling(1, "cursor moved");
    assert(!std::filesystem::exists(files.files[1]));
}

int main() {
    test_yank_paste_cycle();
    test_new_yank_and_change_tick_stop_cycle();
    test_sessions_are_independent();
    test_toggle_override();
    test_cross_process_sync();
    test_persisted_history_loaded();
    test_unavailable_store();
    test_editor_failure_is_contained();
    test_memory_store_injection();
    test_failed_checkpoint_does_not_start_cycle();
    test_promotion_survives_own_yank();
    test_side_file_checkpoints_are_removed();
    return 0;
}
