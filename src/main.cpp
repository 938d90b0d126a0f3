#include "common/Config.h"
#include "common/Logger.h"
#include "core/state/RecordJson.h"
#include "engine/ExecutionEngine.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rebalex;

namespace {

void printUsage() {
    std::cout
        << "usage: RebalexCtl [--config PATH] <command> [options]\n"
        << "\n"
        << "commands:\n"
        << "  create-run --project N [--mode paper|live] [--confirm LIVE] [--request-key K]\n"
        << "             [--target SYM=W,...] [--order SYM:SIDE:QTY[:LIMIT]]... [--portfolio-value V]\n"
        << "             [--cash V] [--order-type T] [--bypass-risk] [--deadline-ms EPOCH_MS]\n"
        << "  execute RUN_ID [--dry-run] [--force] [--confirm LIVE]\n"
        << "  status RUN_ID\n"
        << "  refresh RUN_ID\n"
        << "  resume RUN_ID [--reason TEXT]\n"
        << "  terminate RUN_ID [--reason TEXT]\n"
        << "  summary RUN_ID\n"
        << "  order --client-id ID --symbol SYM --side BUY|SELL --qty N [--type T] [--limit P]\n"
        << "  cancel-order ORDER_ID|CLIENT_ID [--actor NAME]\n"
        << "  recover-orders\n"
        << "  watch\n";
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, sep)) {
        if (!part.empty()) {
            out.push_back(part);
        }
    }
    return out;
}

// --key value pairs and bare --flags; repeated keys accumulate.
struct Args {
    std::vector<std::string> positional;
    std::multimap<std::string, std::string> options;

    bool has(const std::string& key) const { return options.count(key) > 0; }
    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }
    std::vector<std::string> all(const std::string& key) const {
        std::vector<std::string> out;
        auto range = options.equal_range(key);
        for (auto it = range.first; it != range.second; ++it) out.push_back(it->second);
        return out;
    }
};

Args parseArgs(int argc, char* argv[], int start) {
    static const std::vector<std::string> kFlags = {"--dry-run", "--force", "--bypass-risk"};
    Args args;
    for (int i = start; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            args.positional.push_back(arg);
            continue;
        }
        if (std::find(kFlags.begin(), kFlags.end(), arg) != kFlags.end()) {
            args.options.emplace(arg, "true");
        } else if (i + 1 < argc) {
            args.options.emplace(arg, argv[++i]);
        } else {
            throw std::invalid_argument("missing value for " + arg);
        }
    }
    return args;
}

long long requireRunId(const Args& args) {
    if (args.positional.empty()) {
        throw std::invalid_argument("run_id_required");
    }
    return std::stoll(args.positional.front());
}

core::OrderRequest parseOrderSpec(const std::string& spec) {
    const auto parts = split(spec, ':');
    if (parts.size() < 3) {
        throw std::invalid_argument("order spec must be SYM:SIDE:QTY[:LIMIT]");
    }
    core::OrderRequest order;
    order.symbol = parts[0];
    order.side = parts[1];
    order.quantity = std::stod(parts[2]);
    if (parts.size() > 3) {
        order.order_type = "LMT";
        order.limit_price = std::stod(parts[3]);
    }
    return order;
}

nlohmann::json reportJson(const execution::ReconcileReport& report) {
    nlohmann::json j = {
        {"run_id", report.run_id},
        {"status_before", toString(report.status_before)},
        {"status_after", toString(report.status_after)},
        {"events_applied", report.events_applied},
        {"command_results_applied", report.command_results_applied},
        {"low_confidence_marked", report.low_confidence_marked},
        {"recovered", report.recovered},
        {"fills_recorded", report.fills_recorded},
        {"cancels_confirmed", report.cancels_confirmed},
        {"forced_terminal", report.forced_terminal},
        {"fallback_triggered", report.fallback_triggered},
        {"auto_resumed", report.auto_resumed},
        {"diagnostic", report.diagnostic},
    };
    if (report.process) {
        j["process"] = {{"pid", report.process->pid}, {"outcome", report.process->outcome}};
    }
    return j;
}

int runCommand(engine::ExecutionEngine& engine, const std::string& command, const Args& args) {
    auto& coordinator = engine.coordinator();

    if (command == "create-run") {
        core::RunCreateRequest request;
        request.project_id = std::stoll(args.get("--project", "0"));
        request.mode = args.get("--mode", "paper");
        request.live_confirm_token = args.get("--confirm");
        request.request_key = args.get("--request-key");
        for (const auto& pair : split(args.get("--target"), ',')) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                throw std::invalid_argument("target must be SYM=WEIGHT");
            }
            request.target_weights[pair.substr(0, eq)] = std::stod(pair.substr(eq + 1));
        }
        for (const auto& spec : args.all("--order")) {
            request.orders.push_back(parseOrderSpec(spec));
        }
        if (args.has("--portfolio-value")) request.portfolio_value = std::stod(args.get("--portfolio-value"));
        if (args.has("--cash")) request.cash_available = std::stod(args.get("--cash"));
        if (args.has("--order-type")) request.order_type = args.get("--order-type");
        if (args.has("--deadline-ms")) request.deadline_ms = std::stoll(args.get("--deadline-ms"));
        request.bypass_risk = args.has("--bypass-risk");

        const auto result = coordinator.createRun(request);
        std::cout << nlohmann::json{{"run", core::toJson(result.run)},
                                    {"orders_created", result.orders_created},
                                    {"reused", result.reused}}.dump(2)
                  << std::endl;
        return 0;
    }

    if (command == "execute") {
        core::ExecuteOptions options;
        options.dry_run = args.has("--dry-run");
        options.force = args.has("--force");
        options.live_confirm_token = args.get("--confirm");
        const auto result = coordinator.executeRun(requireRunId(args), options);
        std::cout << nlohmann::json{{"run_id", result.run_id},
                                    {"status", toString(result.status)},
                                    {"message", result.message},
                                    {"dry_run", result.dry_run},
                                    {"channel", toString(result.channel)},
                                    {"orders_total", result.orders_total},
                                    {"risk_reasons", result.risk_reasons},
                                    {"missing_prices", result.missing_prices},
                                    {"completion", core::toJson(result.completion)}}.dump(2)
                  << std::endl;
        return result.status == RunStatus::FAILED ? 2 : 0;
    }

    if (command == "status") {
        const auto view = coordinator.getRunStatus(requireRunId(args));
        nlohmann::json orders = nlohmann::json::array();
        for (const auto& order : view.orders) {
            orders.push_back(core::toJson(order));
        }
        std::cout << nlohmann::json{{"run", core::toJson(view.run)}, {"orders", orders}}.dump(2) << std::endl;
        return 0;
    }

    if (command == "refresh") {
        std::cout << reportJson(coordinator.refreshRun(requireRunId(args))).dump(2) << std::endl;
        return 0;
    }

    if (command == "resume") {
        const auto run = coordinator.resumeRun(requireRunId(args), args.get("--reason", "manual_resume"));
        std::cout << core::toJson(run).dump(2) << std::endl;
        return 0;
    }

    if (command == "terminate") {
        const auto run = coordinator.terminateRun(requireRunId(args), args.get("--reason", "manual_terminate"));
        std::cout << core::toJson(run).dump(2) << std::endl;
        return 0;
    }

    if (command == "summary") {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& row : coordinator.symbolSummary(requireRunId(args))) {
            nlohmann::json j = {
                {"symbol", row.symbol},
                {"requested_quantity", row.requested_quantity},
                {"filled_quantity", row.filled_quantity},
                {"avg_fill_price", row.avg_fill_price},
            };
            j["target_weight"] = row.target_weight ? nlohmann::json(*row.target_weight) : nlohmann::json();
            j["current_holding"] = row.current_holding ? nlohmann::json(*row.current_holding) : nlohmann::json();
            j["last_status"] = row.last_status ? nlohmann::json(toString(*row.last_status)) : nlohmann::json();
            rows.push_back(j);
        }
        std::cout << rows.dump(2) << std::endl;
        return 0;
    }

    if (command == "order") {
        core::OrderRequest request;
        request.client_order_id = args.get("--client-id");
        request.symbol = args.get("--symbol");
        request.side = args.get("--side", "BUY");
        request.quantity = std::stod(args.get("--qty", "0"));
        request.order_type = args.get("--type", "MKT");
        if (args.has("--limit")) request.limit_price = std::stod(args.get("--limit"));
        const auto result = coordinator.createDirectOrder(request);
        std::cout << nlohmann::json{{"order", core::toJson(result.order)},
                                    {"created", result.created},
                                    {"submitted", result.submitted},
                                    {"reason", result.reason}}.dump(2)
                  << std::endl;
        return result.submitted || !result.created ? 0 : 2;
    }

    if (command == "cancel-order") {
        if (args.positional.empty()) {
            throw std::invalid_argument("order_ref_required");
        }
        const auto result = coordinator.cancelOrder(args.positional.front(), args.get("--actor", "cli"));
        std::cout << nlohmann::json{{"order", core::toJson(result.order)},
                                    {"noop", result.noop},
                                    {"command_id", result.command_id},
                                    {"reason", result.reason}}.dump(2)
                  << std::endl;
        return 0;
    }

    if (command == "recover-orders") {
        const auto report = coordinator.recoverStuckOrders();
        std::cout << nlohmann::json{{"scanned", report.scanned},
                                    {"cancelled", report.cancelled},
                                    {"replaced", report.replaced},
                                    {"skipped", report.skipped},
                                    {"failed", report.failed},
                                    {"reason", report.reason}}.dump(2)
                  << std::endl;
        return report.reason.empty() ? 0 : 2;
    }

    if (command == "watch") {
        if (!engine.startScheduler()) {
            LOG_ERROR("scheduler not started");
            return 1;
        }
        boost::asio::io_context io;
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&engine](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            LOG_INFO("signal {} received, stopping", signal);
            engine.stopScheduler();
        });
        io.run();
        return 0;
    }

    printUsage();
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "config/config.json";
        int first = 1;
        if (argc > 2 && std::string(argv[1]) == "--config") {
            config_path = argv[2];
            first = 3;
        }
        if (first >= argc) {
            printUsage();
            return 1;
        }

        auto& config = Config::getInstance();
        config.load(config_path);
        const auto engine_config = config.getEngineConfig();

        Logger::getInstance().initialize(engine_config.paths.log_dir);
        Logger::getInstance().setLevel(config.getLogLevel());

        const std::string command = argv[first];
        const Args args = parseArgs(argc, argv, first + 1);

        engine::ExecutionEngine engine(engine_config);
        return runCommand(engine, command, args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << std::endl;
        return 1;
    }
}
