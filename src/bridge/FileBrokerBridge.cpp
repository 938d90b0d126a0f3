#include "bridge/FileBrokerBridge.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "bridge/BridgeCodec.h"
#include "common/Logger.h"
#include "common/LotSizeHelper.h"
#include "common/PathUtils.h"
#include "common/TimeUtils.h"

namespace rebalex {
namespace bridge {

namespace {
bool isSafeFileToken(const std::string& value) {
    if (value.empty() || value.size() > 128) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    }) && value.find("..") == std::string::npos;
}
} // namespace

FileBrokerBridge::FileBrokerBridge(BridgeOptions options, std::shared_ptr<const IClock> clock)
    : options_(std::move(options)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {}

bool FileBrokerBridge::reachable() {
    std::error_code ec;
    return std::filesystem::is_directory(options_.root, ec) &&
           std::filesystem::exists(options_.root / "bridge_status.json", ec);
}

std::optional<nlohmann::json> FileBrokerBridge::readJsonFile(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    try {
        nlohmann::json raw;
        in >> raw;
        return raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("bridge: malformed json {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

core::BridgeStatus FileBrokerBridge::readStatus() {
    const auto raw = readJsonFile(options_.root / "bridge_status.json");
    if (!raw || !raw->is_object()) {
        return core::BridgeStatus{};
    }
    return BridgeCodec::parseStatus(*raw, clock_->nowMs(), options_.heartbeat_stale_ms);
}

core::OpenOrdersSnapshot FileBrokerBridge::readOpenOrders() {
    const auto raw = readJsonFile(options_.root / "open_orders.json");
    if (!raw || !raw->is_object()) {
        return core::OpenOrdersSnapshot{};
    }
    return BridgeCodec::parseOpenOrders(*raw);
}

core::HoldingsSnapshot FileBrokerBridge::readHoldings() {
    const auto raw = readJsonFile(options_.root / "positions.json");
    if (!raw || !raw->is_object()) {
        return core::HoldingsSnapshot{};
    }
    return BridgeCodec::parseHoldings(*raw);
}

core::QuotesSnapshot FileBrokerBridge::readQuotes() {
    const auto raw = readJsonFile(options_.root / "quotes.json");
    if (!raw || !raw->is_object()) {
        return core::QuotesSnapshot{};
    }
    return BridgeCodec::parseQuotes(*raw);
}

std::map<std::string, double> FileBrokerBridge::readHistoricalCloses(const std::vector<std::string>& symbols) {
    std::map<std::string, double> closes;
    for (const auto& raw_symbol : symbols) {
        const std::string symbol = common::normalizeSymbol(raw_symbol);
        if (!isSafeFileToken(symbol)) {
            continue;
        }
        std::ifstream in(options_.root / "history" / (symbol + ".csv"), std::ios::binary);
        if (!in.is_open()) {
            continue;
        }
        std::ostringstream body;
        body << in.rdbuf();
        const auto close = BridgeCodec::lastCloseFromCsv(body.str());
        if (close) {
            closes[symbol] = *close;
        }
    }
    return closes;
}

std::vector<core::ExecutionEvent> FileBrokerBridge::readEventLog(const std::filesystem::path& path) const {
    std::vector<core::ExecutionEvent> events;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return events;
    }

    std::string row;
    int malformed = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            const auto event = BridgeCodec::parseExecutionEvent(nlohmann::json::parse(row));
            if (event) {
                events.push_back(*event);
            }
        } catch (const nlohmann::json::exception&) {
            ++malformed;
        }
    }
    if (malformed > 0) {
        LOG_WARN("bridge: {} malformed event lines in {}", malformed, path.string());
    }
    return events;
}

std::vector<core::ExecutionEvent> FileBrokerBridge::readExecutionEvents(std::optional<long long> run_id) {
    if (run_id) {
        return readEventLog(runDir(*run_id) / "execution_events.jsonl");
    }
    return readEventLog(options_.root / "execution_events.jsonl");
}

std::vector<std::string> FileBrokerBridge::readSessionLog(long long run_id) {
    std::vector<std::string> lines;
    std::ifstream in(runDir(run_id) / "session.log", std::ios::binary);
    if (!in.is_open()) {
        return lines;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::filesystem::path FileBrokerBridge::commandPath(const std::string& command_id) const {
    return options_.root / "commands" / (command_id + ".json");
}

std::filesystem::path FileBrokerBridge::resultPath(const std::string& command_id) const {
    return options_.root / "command_results" / (command_id + ".json");
}

std::filesystem::path FileBrokerBridge::runDir(long long run_id) const {
    return options_.root / "runs" / ("run_" + std::to_string(run_id));
}

std::optional<core::CommandResult> FileBrokerBridge::readCommandResult(const std::string& command_id) {
    if (!isSafeFileToken(command_id)) {
        return std::nullopt;
    }
    const auto raw = readJsonFile(resultPath(command_id));
    if (!raw || !raw->is_object()) {
        return std::nullopt;
    }
    auto result = BridgeCodec::parseCommandResult(*raw);
    if (result && result->command_id.empty()) {
        result->command_id = command_id;
    }
    return result;
}

std::vector<core::PendingCommand> FileBrokerBridge::listPendingCommands() {
    std::vector<core::PendingCommand> pending;
    const auto dir = options_.root / "commands";
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return pending;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        const std::string command_id = entry.path().stem().string();
        if (std::filesystem::exists(resultPath(command_id), ec)) {
            continue;
        }
        const auto raw = readJsonFile(entry.path());
        if (!raw || !raw->is_object()) {
            continue;
        }
        auto header = BridgeCodec::parseCommandHeader(*raw);
        if (header) {
            pending.push_back(*header);
        }
    }
    std::sort(pending.begin(), pending.end(), [](const auto& a, const auto& b) {
        return a.created_at_ms < b.created_at_ms;
    });
    return pending;
}

bool FileBrokerBridge::writeSubmitCommand(const core::SubmitCommand& command) {
    if (!isSafeFileToken(command.command_id)) {
        LOG_ERROR("bridge: refusing unsafe command id '{}'", command.command_id);
        return false;
    }
    return utils::PathUtils::writeFileAtomically(commandPath(command.command_id),
                                                 BridgeCodec::toJson(command).dump(2));
}

bool FileBrokerBridge::writeCancelCommand(const core::CancelCommand& command) {
    if (!isSafeFileToken(command.command_id)) {
        LOG_ERROR("bridge: refusing unsafe command id '{}'", command.command_id);
        return false;
    }
    return utils::PathUtils::writeFileAtomically(commandPath(command.command_id),
                                                 BridgeCodec::toJson(command).dump(2));
}

bool FileBrokerBridge::expireCommand(const std::string& command_id, long long now_ms) {
    if (!isSafeFileToken(command_id)) {
        return false;
    }
    std::error_code ec;
    if (std::filesystem::exists(resultPath(command_id), ec)) {
        return false;
    }
    auto raw = readJsonFile(commandPath(command_id));
    if (!raw || !raw->is_object()) {
        return false;
    }
    (*raw)["expires_at"] = utils::TimeUtils::formatIsoUtc(now_ms - 1000);
    (*raw)["superseded"] = true;
    return utils::PathUtils::writeFileAtomically(commandPath(command_id), raw->dump(2));
}

std::string FileBrokerBridge::runOutputDir(long long run_id) {
    return runDir(run_id).string();
}

std::optional<std::string> FileBrokerBridge::writeOrderIntent(
    long long run_id,
    const std::vector<core::IntentRecord>& records
) {
    const auto path = runDir(run_id) / "order_intent.json";
    if (!utils::PathUtils::writeFileAtomically(path, BridgeCodec::intentToJson(records).dump(2))) {
        LOG_ERROR("bridge: failed to write order intent {}", path.string());
        return std::nullopt;
    }
    return path.string();
}

std::optional<std::vector<core::IntentRecord>> FileBrokerBridge::readOrderIntent(const std::string& path) {
    const auto raw = readJsonFile(path);
    if (!raw) {
        return std::nullopt;
    }
    try {
        return BridgeCodec::intentFromJson(*raw);
    } catch (const std::invalid_argument& e) {
        LOG_WARN("bridge: unusable order intent {}: {}", path, e.what());
        return std::nullopt;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("bridge: unusable order intent {}: {}", path, e.what());
        return std::nullopt;
    }
}

std::optional<std::string> FileBrokerBridge::writeExecutionParams(
    long long run_id,
    const core::ExecutionParams& params
) {
    const auto path = runDir(run_id) / "execution_params.json";
    if (!utils::PathUtils::writeFileAtomically(path, BridgeCodec::toJson(params).dump(2))) {
        LOG_ERROR("bridge: failed to write execution params {}", path.string());
        return std::nullopt;
    }
    return path.string();
}

} // namespace bridge
} // namespace rebalex
