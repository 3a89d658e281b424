#include <bmr/lock.hpp>
#include <bmr/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace bmr {

Result<KeyLock> KeyLock::acquire(const std::string& lock_path, int timeout_seconds) {
    std::error_code ec;
    fs::create_directories(fs::path(lock_path).parent_path(), ec);
    if (ec) {
        return BmrError{BmrError::IO,
            "cannot create lock directory for " + lock_path + ": " + ec.message()};
    }

    int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return BmrError{BmrError::IO,
            "cannot open lock file " + lock_path + ": " + strerror(errno)};
    }

    auto start = std::chrono::steady_clock::now();
    bool logged = false;
    while (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            int saved = errno;
            close(fd);
            return BmrError{BmrError::IO,
                "flock " + lock_path + " failed: " + strerror(saved)};
        }
        if (!logged) {
            log::debug("waiting for lock %s", lock_path.c_str());
            logged = true;
        }
        if (timeout_seconds > 0 &&
            std::chrono::steady_clock::now() - start >=
                std::chrono::seconds(timeout_seconds)) {
            close(fd);
            return BmrError{BmrError::IO,
                "timed out after " + std::to_string(timeout_seconds) +
                "s waiting for lock " + lock_path,
                "another process is cloning or updating the same remote"};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    return Result<KeyLock>::ok(KeyLock(fd, lock_path));
}

KeyLock::KeyLock(KeyLock&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

KeyLock& KeyLock::operator=(KeyLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

KeyLock::~KeyLock() {
    release();
}

void KeyLock::release() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }
}

} // namespace bmr
