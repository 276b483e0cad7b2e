#include "yankring/side_file_checkpoint.hpp"
#include "yankring/errors.hpp"
#include <atomic>
#include <unistd.h>

namespace fs = std::filesystem;

namespace yankring {

SideFileCheckpoint::SideFileCheckpoint(fs::path path, const Logger& log) : path_(std::move(path)), log_(log) {}

SideFileCheckpoint::~SideFileCheckpoint() {
    if (discarded_) return;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) log_.error("undo", "failed to delete checkpoint file " + path_.string() + ": " + ec.message());
}

fs::path SideFileCheckpoint::makeTempPath(const std::string& prefix) {
    static std::atomic<unsigned> counter {0};
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = "/tmp";
    return dir / (prefix + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) + "-" +
                  std::to_string(now_ms()) + ".txt");
}

bool SideFileCheckpoint::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

void SideFileCheckpoint::discard() {
    if (discarded_) return;
    std::error_code ec;
    const bool removed = fs::remove(path_, ec);
    if (ec) {
        throw Error("failed to delete checkpoint file " + path_.string() + ": " + ec.message());
    }
    discarded_ = true;
    log_.debug("undo", removed ? "deleted checkpoint file " + path_.string()
                               : "checkpoint file already removed " + path_.string());
}

} // namespace yankring
