#include "execution/PosixProcessLauncher.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

#include "common/Logger.h"

namespace rebalex {
namespace execution {

std::optional<int> PosixProcessLauncher::launch(const core::LaunchSpec& spec) {
    if (spec.argv.empty()) {
        LOG_ERROR("launch: empty argv");
        return std::nullopt;
    }

    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        LOG_ERROR("launch: pipe failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // The child only execs: the environment is assembled here, not after fork.
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string item(*entry);
        const auto eq = item.find('=');
        if (eq != std::string::npos) {
            merged[item.substr(0, eq)] = item.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : spec.env) {
        merged[key] = value;
    }
    std::vector<std::string> env_storage;
    env_storage.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& item : env_storage) {
        envp.push_back(item.data());
    }
    envp.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        LOG_ERROR("launch: fork failed: {}", std::strerror(errno));
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        ::close(status_pipe[0]);
        ::setsid();
        if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
            const int err = errno;
            (void)!::write(status_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        if (!spec.log_path.empty()) {
            const int log_fd = ::open(spec.log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (log_fd >= 0) {
                ::dup2(log_fd, STDOUT_FILENO);
                ::dup2(log_fd, STDERR_FILENO);
                ::close(log_fd);
            }
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        const int err = errno;
        (void)!::write(status_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0) {
        LOG_ERROR("launch: exec of {} failed: {}", spec.argv.front(), std::strerror(child_errno));
        ::waitpid(pid, nullptr, 0);
        return std::nullopt;
    }

    LOG_INFO("launch: started {} pid={}", spec.argv.front(), static_cast<int>(pid));
    return static_cast<int>(pid);
}

bool PosixProcessLauncher::isAlive(int pid) {
    if (pid <= 0) {
        return false;
    }
    int status = 0;
    const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
        return false;
    }
    if (reaped == 0) {
        return true;
    }
    // Not our child: probe with signal 0.
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<long long> PosixProcessLauncher::startTime(int pid) {
    if (pid <= 0) {
        return std::nullopt;
    }
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!in.is_open() || !std::getline(in, line)) {
        return std::nullopt;
    }
    // comm may contain spaces and parentheses; fields resume after the last ')'
    const auto close = line.rfind(')');
    if (close == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream fields(line.substr(close + 1));
    std::string field;
    // the text after ')' starts at field 3 (state)
    for (int index = 3; index <= 22; ++index) {
        if (!(fields >> field)) {
            return std::nullopt;
        }
    }
    try {
        return std::stoll(field);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool PosixProcessLauncher::signal(int pid, bool force) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, force ? SIGKILL : SIGTERM) != 0) {
        LOG_WARN("signal {} to pid {} failed: {}", force ? "SIGKILL" : "SIGTERM", pid, std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace execution
} // namespace rebalex
