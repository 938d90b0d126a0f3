#pragma once

#include <string>

#include "common/Types.h"

namespace rebalex {
namespace core {

struct GuardState {
    // "active" | "halted"
    std::string status = "active";
    std::string reason;

    bool halted() const { return status == "halted"; }
};

class IRiskHaltGuard {
public:
    virtual ~IRiskHaltGuard() = default;

    virtual GuardState evaluate(long long project_id, TradingMode mode) = 0;
};

} // namespace core
} // namespace rebalex
