#pragma once

#include <filesystem>
#include <string>

namespace rebalex {
namespace execution {

// Advisory named lock backed by flock(2) on <lock_dir>/<name>.lock. Held
// until release() or destruction; a crashed holder releases automatically.
class JobLock {
public:
    JobLock(std::string name, std::filesystem::path lock_dir);
    ~JobLock();

    JobLock(const JobLock&) = delete;
    JobLock& operator=(const JobLock&) = delete;

    bool tryAcquire();
    // Blocks until the lock is free.
    bool acquire();
    void release();
    bool held() const { return fd_ >= 0; }
    const std::string& name() const { return name_; }

private:
    bool lock(bool wait);

    std::string name_;
    std::filesystem::path path_;
    int fd_ = -1;
};

} // namespace execution
} // namespace rebalex
