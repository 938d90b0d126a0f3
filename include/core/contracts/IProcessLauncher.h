#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rebalex {
namespace core {

struct LaunchSpec {
    std::vector<std::string> argv;
    std::string working_dir;
    std::map<std::string, std::string> env;
    // stdout/stderr are appended here when set
    std::string log_path;
};

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // Returns the pid once the process is started; nullopt on failure.
    virtual std::optional<int> launch(const LaunchSpec& spec) = 0;
    virtual bool isAlive(int pid) = 0;
    // force=false sends SIGTERM, force=true sends SIGKILL.
    virtual bool signal(int pid, bool force) = 0;
    // Start time of the process holding pid, in clock ticks since boot.
    // nullopt when the pid is gone or the platform does not expose it.
    virtual std::optional<long long> startTime(int pid) = 0;
};

} // namespace core
} // namespace rebalex
