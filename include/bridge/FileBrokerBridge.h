#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

#include "common/Clock.h"
#include "core/contracts/IBrokerBridge.h"

namespace rebalex {
namespace bridge {

struct BridgeOptions {
    std::filesystem::path root = "bridge";
    long long heartbeat_stale_ms = 10000;
};

// Bridge directory layout:
//   bridge_status.json, open_orders.json, positions.json, quotes.json,
//   execution_events.jsonl, commands/<id>.json, command_results/<id>.json,
//   runs/run_<id>/{order_intent.json, execution_params.json,
//                  execution_events.jsonl, session.log},
//   history/<SYMBOL>.csv
class FileBrokerBridge : public core::IBrokerBridge {
public:
    FileBrokerBridge(BridgeOptions options, std::shared_ptr<const IClock> clock);

    bool reachable() override;

    core::BridgeStatus readStatus() override;
    core::OpenOrdersSnapshot readOpenOrders() override;
    core::HoldingsSnapshot readHoldings() override;
    core::QuotesSnapshot readQuotes() override;
    std::map<std::string, double> readHistoricalCloses(const std::vector<std::string>& symbols) override;

    std::vector<core::ExecutionEvent> readExecutionEvents(std::optional<long long> run_id) override;
    std::vector<std::string> readSessionLog(long long run_id) override;

    std::optional<core::CommandResult> readCommandResult(const std::string& command_id) override;
    std::vector<core::PendingCommand> listPendingCommands() override;

    bool writeSubmitCommand(const core::SubmitCommand& command) override;
    bool writeCancelCommand(const core::CancelCommand& command) override;
    bool expireCommand(const std::string& command_id, long long now_ms) override;

    std::string runOutputDir(long long run_id) override;
    std::optional<std::string> writeOrderIntent(long long run_id, const std::vector<core::IntentRecord>& records) override;
    std::optional<std::vector<core::IntentRecord>> readOrderIntent(const std::string& path) override;
    std::optional<std::string> writeExecutionParams(long long run_id, const core::ExecutionParams& params) override;

    const std::filesystem::path& root() const { return options_.root; }

private:
    std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path) const;
    std::vector<core::ExecutionEvent> readEventLog(const std::filesystem::path& path) const;
    std::filesystem::path commandPath(const std::string& command_id) const;
    std::filesystem::path resultPath(const std::string& command_id) const;
    std::filesystem::path runDir(long long run_id) const;

    BridgeOptions options_;
    std::shared_ptr<const IClock> clock_;
};

} // namespace bridge
} // namespace rebalex
