#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/model/BridgeTypes.h"

namespace rebalex {
namespace core {

// File-protocol boundary to the broker session. Reads never throw on missing
// or malformed files; they report an absent snapshot instead.
class IBrokerBridge {
public:
    virtual ~IBrokerBridge() = default;

    virtual bool reachable() = 0;

    virtual BridgeStatus readStatus() = 0;
    virtual OpenOrdersSnapshot readOpenOrders() = 0;
    virtual HoldingsSnapshot readHoldings() = 0;
    virtual QuotesSnapshot readQuotes() = 0;
    virtual std::map<std::string, double> readHistoricalCloses(const std::vector<std::string>& symbols) = 0;

    // Leader log when run_id is empty, otherwise the run-scoped log.
    virtual std::vector<ExecutionEvent> readExecutionEvents(std::optional<long long> run_id) = 0;
    virtual std::vector<std::string> readSessionLog(long long run_id) = 0;

    virtual std::optional<CommandResult> readCommandResult(const std::string& command_id) = 0;
    // Commands without a result file.
    virtual std::vector<PendingCommand> listPendingCommands() = 0;

    virtual bool writeSubmitCommand(const SubmitCommand& command) = 0;
    virtual bool writeCancelCommand(const CancelCommand& command) = 0;
    // Rewrites an unprocessed command with an expiry in the past.
    virtual bool expireCommand(const std::string& command_id, long long now_ms) = 0;

    virtual std::string runOutputDir(long long run_id) = 0;
    virtual std::optional<std::string> writeOrderIntent(long long run_id, const std::vector<IntentRecord>& records) = 0;
    virtual std::optional<std::vector<IntentRecord>> readOrderIntent(const std::string& path) = 0;
    virtual std::optional<std::string> writeExecutionParams(long long run_id, const ExecutionParams& params) = 0;
};

} // namespace core
} // namespace rebalex
