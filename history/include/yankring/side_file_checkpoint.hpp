#pragma once

#include "yankring/editor.hpp"
#include "yankring/log.hpp"
#include <filesystem>
#include <string>

namespace yankring {

// Checkpoint backed by a file the host wrote its undo state into
// (e.g. `wundo <path>`). discard() deletes the file.
class SideFileCheckpoint : public Checkpoint {
public:
    SideFileCheckpoint(std::filesystem::path path, const Logger& log);
    ~SideFileCheckpoint() override;

    // Fresh path in the temp directory, unique within this process
    static std::filesystem::path makeTempPath(const std::string& prefix = "yankring-undo-");

    const std::filesystem::path& path() const { return path_; }
    bool exists() const;
    bool discarded() const { return discarded_; }

    std::string describe() const override { return path_.string(); }
    void discard() override;

private:
    std::filesystem::path path_;
    const Logger& log_;
    bool discarded_ {false};
};

} // namespace yankring
