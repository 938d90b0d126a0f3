#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/model/ExecutionTypes.h"

namespace rebalex {
namespace core {

std::optional<RunStatus> parseRunStatus(const std::string& value);
std::optional<OrderStatus> parseOrderStatus(const std::string& value);
SubmissionChannel parseSubmissionChannel(const std::string& value);

nlohmann::json toJson(const CompletionSummary& summary);
nlohmann::json toJson(const Run& run);
nlohmann::json toJson(const Order& order);
nlohmann::json toJson(const Fill& fill);

// Throw nlohmann::json::exception / std::invalid_argument on malformed rows.
Run runFromJson(const nlohmann::json& j);
Order orderFromJson(const nlohmann::json& j);
Fill fillFromJson(const nlohmann::json& j);

} // namespace core
} // namespace rebalex
