#pragma once
// ===================================================================
// Lot sizing, symbol and order-type normalization helpers shared by the
// intent builder, the bridge codecs and the coordinator.
// ===================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>

#include "common/Types.h"

namespace rebalex {
namespace common {

// Floors a quantity to a multiple of the lot size (lot <= 0 means 1).
inline double floorToLot(double quantity, int lot_size) {
    const double lot = lot_size > 0 ? static_cast<double>(lot_size) : 1.0;
    if (quantity <= 0.0) return 0.0;
    // Nudge so 1199.9999999 from float math still counts as 1200.
    return std::floor(quantity / lot + kQuantityTolerance) * lot;
}

inline bool quantityEquals(double a, double b, double scale = 1.0) {
    const double tol = kQuantityTolerance * (std::max)(1.0, std::fabs(scale));
    return std::fabs(a - b) <= tol;
}

inline std::string normalizeSymbol(std::string symbol) {
    symbol.erase(std::remove_if(symbol.begin(), symbol.end(),
                                [](unsigned char c) { return std::isspace(c); }),
                 symbol.end());
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}

// Accepts canonical names and the common aliases; nullopt for anything else.
inline std::optional<OrderType> parseOrderType(const std::string& raw) {
    const std::string value = normalizeSymbol(raw);
    if (value.empty() || value == "MKT" || value == "MARKET") return OrderType::MKT;
    if (value == "LMT" || value == "LIMIT") return OrderType::LMT;
    if (value == "ADAPTIVE_LMT" || value == "ADAPTIVE" || value == "ADAPTIVE_LIMIT") return OrderType::ADAPTIVE_LMT;
    if (value == "PEG_MID" || value == "PEG_MIDPOINT" || value == "MIDPOINT") return OrderType::PEG_MID;
    return std::nullopt;
}

inline std::optional<OrderSide> parseOrderSide(const std::string& raw) {
    const std::string value = normalizeSymbol(raw);
    if (value == "BUY") return OrderSide::BUY;
    if (value == "SELL") return OrderSide::SELL;
    return std::nullopt;
}

inline std::optional<TradingMode> parseTradingMode(const std::string& raw) {
    std::string value = normalizeSymbol(raw);
    if (value == "PAPER") return TradingMode::PAPER;
    if (value == "LIVE") return TradingMode::LIVE;
    return std::nullopt;
}

inline bool requiresPrimePrice(OrderType type) {
    return type == OrderType::ADAPTIVE_LMT || type == OrderType::PEG_MID;
}

inline double signedQuantity(OrderSide side, double quantity) {
    return side == OrderSide::BUY ? quantity : -quantity;
}

} // namespace common
} // namespace rebalex
