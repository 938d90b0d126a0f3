#pragma once

#include <filesystem>

#include "core/contracts/IRiskHaltGuard.h"

namespace rebalex {
namespace core {

// Reads {"<project>:<mode>": {"status": "...", "reason": "..."}} from a JSON
// file maintained by the external guard. Missing file or entry means active;
// an unreadable file is treated as halted.
class FileRiskHaltGuard : public IRiskHaltGuard {
public:
    explicit FileRiskHaltGuard(std::filesystem::path file_path);

    GuardState evaluate(long long project_id, TradingMode mode) override;

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace rebalex
