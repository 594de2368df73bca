#pragma once

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace tradegate {
namespace util {

/**
 * FileLock - exclusive advisory lock held for the object's lifetime
 *
 * Opens (creating if needed) the lock file and blocks in flock(LOCK_EX)
 * until every other holder has released it. Each FileLock opens its own
 * descriptor, so two locks on one path exclude each other even inside a
 * single process.
 *
 * Usage:
 *   {
 *       FileLock lock("data/tradegate_store.json.lock");
 *       // read-modify-write the guarded file
 *   }
 */
class FileLock {
public:
    /**
     * @throws std::runtime_error if the lock file cannot be opened or locked
     */
    explicit FileLock(const std::string& path) : path_(path) {
        fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd_ < 0)
            throw std::runtime_error("Cannot open lock file " + path_ + ": " + std::strerror(errno));

        int rc;
        do {
            rc = ::flock(fd_, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int err = errno;
            ::close(fd_);
            throw std::runtime_error("Cannot lock " + path_ + ": " + std::strerror(err));
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

}  // namespace util
}  // namespace tradegate
