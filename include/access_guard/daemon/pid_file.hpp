#pragma once

#include <string>

namespace access_guard {
namespace daemon {

// Single-instance guard. The file is removed again when the owner is
// destroyed, but only if this process wrote it.
class PidFile {
public:
    explicit PidFile(std::string path);
    ~PidFile();

    PidFile(const PidFile&) = delete;
    PidFile& operator=(const PidFile&) = delete;

    // Fails when another live process holds the file. A stale file left by
    // a dead process is replaced.
    bool acquire();
    void release();

    bool held() const { return held_; }
    const std::string& path() const { return path_; }

    // -1 when the file is missing, unreadable or names a dead process.
    static int livePid(const std::string& path);

private:
    std::string path_;
    bool held_ = false;
};

}}
