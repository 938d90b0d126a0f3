#include "core/adapters/FileRiskHaltGuard.h"

#include <fstream>

#include <nlohmann/json.hpp>

#include "common/Logger.h"

namespace rebalex {
namespace core {

FileRiskHaltGuard::FileRiskHaltGuard(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

GuardState FileRiskHaltGuard::evaluate(long long project_id, TradingMode mode) {
    GuardState state;
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        return state;
    }

    std::ifstream in(file_path_, std::ios::binary);
    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("risk guard state unreadable {}: {}", file_path_.string(), e.what());
        state.status = "halted";
        state.reason = "guard_state_unreadable";
        return state;
    }

    const std::string key = std::to_string(project_id) + ":" + toString(mode);
    if (!raw.is_object() || !raw.contains(key) || !raw[key].is_object()) {
        return state;
    }
    state.status = raw[key].value("status", std::string("active"));
    state.reason = raw[key].value("reason", std::string());
    return state;
}

} // namespace core
} // namespace rebalex
