#include "risk/RiskGate.h"
#include "core/adapters/FileRiskHaltGuard.h"

#include <filesystem>
#include <fstream>
#include <iostream>

#include "TestSupport.h"

using namespace rebalex;

namespace {
risk::RiskOrderLine line(const std::string& symbol, OrderSide side, double quantity, double price) {
    risk::RiskOrderLine out;
    out.symbol = symbol;
    out.side = side;
    out.quantity = quantity;
    out.price = price;
    return out;
}

bool hasReason(const risk::RiskGateResult& result, const std::string& reason) {
    for (const auto& r : result.reasons) {
        if (r == reason) return true;
    }
    return false;
}
}

int main() {
    const auto dir = test::makeTempDir("risk");
    const auto guard_file = dir / "guard_state.json";
    auto guard = std::make_shared<core::FileRiskHaltGuard>(guard_file);

    // No limits, no guard file: everything passes
    {
        risk::RiskGate gate(risk::RiskLimits{}, guard);
        risk::RiskGateInput input;
        input.orders = {line("AAPL", OrderSide::BUY, 100, 50.0), line("MSFT", OrderSide::SELL, 10, 300.0)};
        const auto result = gate.evaluate(input);
        REBALEX_EXPECT(result.allowed, "unlimited gate allows");
        REBALEX_EXPECT(result.symbol_count == 2, "symbol count");
        REBALEX_EXPECT(result.total_notional == 8000.0, "total notional");
        REBALEX_EXPECT(result.guard_status == "active", "missing guard file is active");
    }

    // Each limit reports its own reason
    {
        risk::RiskLimits limits;
        limits.max_order_notional = 4000.0;
        limits.max_total_notional = 7000.0;
        limits.max_symbols = 1;
        limits.max_position_ratio = 0.3;
        limits.min_cash_buffer_ratio = 0.05;
        risk::RiskGate gate(limits, guard);

        risk::RiskGateInput input;
        input.orders = {line("AAPL", OrderSide::BUY, 100, 50.0), line("MSFT", OrderSide::SELL, 10, 300.0)};
        input.portfolio_value = 10000.0;
        input.cash_available = 5000.0;
        input.held_quantity["MSFT"] = 10.0;
        const auto result = gate.evaluate(input);

        REBALEX_EXPECT(!result.allowed, "limits block");
        REBALEX_EXPECT(hasReason(result, "max_symbols"), "max symbols");
        REBALEX_EXPECT(hasReason(result, "max_order_notional:AAPL"), "order notional");
        REBALEX_EXPECT(!hasReason(result, "max_order_notional:MSFT"), "small order passes");
        REBALEX_EXPECT(hasReason(result, "max_total_notional"), "total notional");
        REBALEX_EXPECT(hasReason(result, "max_position_ratio:AAPL"), "position ratio");
        REBALEX_EXPECT(!hasReason(result, "max_position_ratio:MSFT"), "full exit has no exposure");
        // 5000 - 5000 + 3000 = 3000 cash after, 30% buffer
        REBALEX_EXPECT(!hasReason(result, "min_cash_buffer_ratio"), "cash buffer ok");

        input.cash_available.reset();
        const auto missing = gate.evaluate(input);
        REBALEX_EXPECT(hasReason(missing, "min_cash_buffer_ratio:missing_cash_available"), "cash required");

        input.bypass_limits = true;
        const auto bypassed = gate.evaluate(input);
        REBALEX_EXPECT(bypassed.allowed && bypassed.bypassed, "bypass skips limits");
    }

    // Halt guard blocks unless forced, also when limits are bypassed
    {
        test::writeJson(guard_file, {{"3:live", {{"status", "halted"}, {"reason", "daily_loss"}}}});
        risk::RiskGate gate(risk::RiskLimits{}, guard);

        risk::RiskGateInput input;
        input.project_id = 3;
        input.mode = TradingMode::LIVE;
        input.bypass_limits = true;
        input.orders = {line("AAPL", OrderSide::BUY, 1, 50.0)};
        const auto halted = gate.evaluate(input);
        REBALEX_EXPECT(!halted.allowed && halted.firstReason() == "guard_halted", "guard halts");
        REBALEX_EXPECT(halted.guard_reason == "daily_loss", "guard reason");

        input.force_guard = true;
        const auto forced = gate.evaluate(input);
        REBALEX_EXPECT(forced.allowed && forced.forced, "force overrides guard");

        input.force_guard = false;
        input.mode = TradingMode::PAPER;
        REBALEX_EXPECT(gate.evaluate(input).allowed, "guard scoped by mode");
    }

    // Unreadable guard state fails closed
    {
        {
            std::ofstream out(guard_file, std::ios::trunc);
            out << "{ broken";
        }
        const auto state = guard->evaluate(1, TradingMode::PAPER);
        REBALEX_EXPECT(state.halted() && state.reason == "guard_state_unreadable", "unreadable guard halts");
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] RiskGate PASSED\n";
    return 0;
}
