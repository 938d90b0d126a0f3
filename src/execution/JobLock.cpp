#include "execution/JobLock.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "common/Logger.h"

namespace rebalex {
namespace execution {

JobLock::JobLock(std::string name, std::filesystem::path lock_dir)
    : name_(std::move(name)), path_(std::move(lock_dir) / (name_ + ".lock")) {}

JobLock::~JobLock() {
    release();
}

bool JobLock::tryAcquire() {
    return lock(false);
}

bool JobLock::acquire() {
    return lock(true);
}

bool JobLock::lock(bool wait) {
    if (fd_ >= 0) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);

    const int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR("job lock {}: open failed: {}", name_, std::strerror(errno));
        return false;
    }
    int rc = 0;
    do {
        rc = ::flock(fd, wait ? LOCK_EX : (LOCK_EX | LOCK_NB));
    } while (rc != 0 && wait && errno == EINTR);
    if (rc != 0) {
        if (errno != EWOULDBLOCK) {
            LOG_ERROR("job lock {}: flock failed: {}", name_, std::strerror(errno));
        }
        ::close(fd);
        return false;
    }

    const std::string owner = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) == 0) {
        const ssize_t written = ::write(fd, owner.data(), owner.size());
        if (written < 0) {
            LOG_WARN("job lock {}: could not record owner pid", name_);
        }
    }
    fd_ = fd;
    return true;
}

void JobLock::release() {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace execution
} // namespace rebalex
