#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/BridgeTypes.h"

namespace rebalex {
namespace bridge {

// JSON <-> struct translation for the bridge file protocol. Parsers are
// lenient about optional fields and return nullopt only when a record has no
// usable identity.
class BridgeCodec {
public:
    static core::BridgeStatus parseStatus(const nlohmann::json& j, long long now_ms, long long heartbeat_stale_ms);
    static core::OpenOrdersSnapshot parseOpenOrders(const nlohmann::json& j);
    static core::HoldingsSnapshot parseHoldings(const nlohmann::json& j);
    static core::QuotesSnapshot parseQuotes(const nlohmann::json& j);
    static std::optional<core::ExecutionEvent> parseExecutionEvent(const nlohmann::json& j);
    static std::optional<core::CommandResult> parseCommandResult(const nlohmann::json& j);
    static std::optional<core::PendingCommand> parseCommandHeader(const nlohmann::json& j);

    static nlohmann::json toJson(const core::SubmitCommand& command);
    static nlohmann::json toJson(const core::CancelCommand& command);
    static nlohmann::json toJson(const core::ExecutionParams& params);
    static nlohmann::json intentToJson(const std::vector<core::IntentRecord>& records);
    static std::vector<core::IntentRecord> intentFromJson(const nlohmann::json& j);

    // Last close of a "date,close" CSV body; nullopt when no row parses.
    static std::optional<double> lastCloseFromCsv(const std::string& body);

    // Accepts epoch milliseconds or an ISO-8601 string.
    static long long timestampMs(const nlohmann::json& j, const char* key);
};

} // namespace bridge
} // namespace rebalex
