#include "yankring/cache.hpp"
#include "yankring/config.hpp"
#include "yankring/db.hpp"
#include "yankring/errors.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace yankring;

static std::optional<std::string> get_arg(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

static bool has_flag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

static void print_entry(const HistoryEntry& e) {
    std::cout << e.id.value_or(-1) << "\t" << kindCode(e.kind) << "\t" << e.timestamp << "\t" << e.sourceChannel
              << "\t" << preview(e.content, 60) << "\n";
}

int main(int argc, char** argv) {
    // Demo runner: inspect or feed a history database from the command line
    std::vector<std::string> warnings;
    Config config = loadConfig(get_arg(argc, argv, "--config").value_or(""), &warnings);
    for (const auto& w : warnings) std::cerr << "config: " << w << "\n";
    if (auto db = get_arg(argc, argv, "--db")) config.persistPath = *db;

    Logger log(config.debug);
    StoreOptions opts;
    opts.maxEntries = static_cast<size_t>(config.maxEntries);
    opts.maxContentSize = config.maxContentSize;
    opts.lockTimeout = std::chrono::milliseconds(config.lockTimeoutMs);

    std::unique_ptr<SqliteEntryStore> store;
    try {
        store = SqliteEntryStore::open(config.persistPath, opts, log);
    } catch (const Error& e) {
        std::cerr << "cannot open history: " << e.what() << "\n";
        return 2;
    }

    if (auto text = get_arg(argc, argv, "--add")) {
        HistoryEntry entry;
        entry.content = *text;
        entry.timestamp = now_ms();
        entry.sourceChannel = kUnnamedChannel;
        try {
            auto stored = store->append(entry);
            std::cout << "Added id=" << stored.id.value_or(-1) << "\n";
        } catch (const Error& e) {
            std::cerr << "add failed: " << e.what() << "\n";
            return 1;
        }
    }

    if (auto n = get_arg(argc, argv, "--list")) {
        size_t limit = 0;
        try {
            limit = static_cast<size_t>(std::stoul(*n));
        } catch (const std::exception&) {
            std::cerr << "--list expects a number\n";
            return 1;
        }
        for (const auto& e : store->recent(limit)) print_entry(e);
    }

    if (auto q = get_arg(argc, argv, "--search")) {
        HistoryCache cache(store->maxEntries());
        cache.setAll(store->recent(store->maxEntries()));
        for (const auto& e : cache.search(*q)) print_entry(e);
    }

    if (has_flag(argc, argv, "--status")) {
        auto status = store->syncStatus();
        std::cout << "db: " << store->dbPath() << "\n"
                  << "journal: " << store->journalMode() << "\n"
                  << "entries: " << status.entryCount << "\n"
                  << "last: " << status.lastTimestamp << "\n";
    }

    store->close();
    return 0;
}
