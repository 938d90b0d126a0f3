#pragma once

#include "core/contracts/IProcessLauncher.h"

namespace rebalex {
namespace execution {

// fork/execvpe launcher. The child runs in its own session with stdout and
// stderr appended to LaunchSpec::log_path. Exec failures are reported back
// through a close-on-exec pipe, so launch() fails instead of returning the
// pid of a child that never ran.
class PosixProcessLauncher : public core::IProcessLauncher {
public:
    std::optional<int> launch(const core::LaunchSpec& spec) override;
    bool isAlive(int pid) override;
    bool signal(int pid, bool force) override;
    // Field 22 of /proc/<pid>/stat.
    std::optional<long long> startTime(int pid) override;
};

} // namespace execution
} // namespace rebalex
