#pragma once

#include <bmr/result.hpp>
#include <string>

namespace bmr {

// Exclusive advisory lock on a file (flock). Each acquisition opens its own
// file description, so threads of one process exclude each other as well as
// separate processes. Released on destruction.
class KeyLock {
public:
    // Blocks until the lock is held or `timeout_seconds` elapse
    // (0 = wait forever). Creates the lock file and its parent directory.
    static Result<KeyLock> acquire(const std::string& lock_path,
                                   int timeout_seconds = 0);

    KeyLock(KeyLock&& other) noexcept;
    KeyLock& operator=(KeyLock&& other) noexcept;
    KeyLock(const KeyLock&) = delete;
    KeyLock& operator=(const KeyLock&) = delete;
    ~KeyLock();

    const std::string& path() const { return path_; }

    void release();

private:
    KeyLock(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::string path_;
};

} // namespace bmr
