#pragma once

#include <map>
#include <optional>
#include <string>

#include "common/Types.h"
#include "core/model/BridgeTypes.h"

namespace rebalex {
namespace execution {

struct ResolvedPrice {
    double price = 0.0;
    // "ask" | "bid" | "mid" | "last" | "close" | "history"
    std::string source;
};

// Picks live quotes while they are fresh and falls back to the latest
// historical close otherwise.
class PriceResolver {
public:
    PriceResolver(
        core::QuotesSnapshot quotes,
        std::map<std::string, double> history_closes,
        long long now_ms,
        long long quote_stale_ms
    );

    // Sizing price: last, then mid, then quote close, then history.
    std::optional<ResolvedPrice> referencePrice(const std::string& symbol) const;

    // BUY: ask, mid, last. SELL: bid, mid, last. Then history.
    std::optional<ResolvedPrice> limitPrice(const std::string& symbol, OrderSide side) const;

    bool quotesUsable() const;

private:
    const core::QuoteItem* quote(const std::string& symbol) const;
    std::optional<ResolvedPrice> historyPrice(const std::string& symbol) const;

    core::QuotesSnapshot quotes_;
    std::map<std::string, double> history_closes_;
    long long now_ms_ = 0;
    long long quote_stale_ms_ = 0;
};

} // namespace execution
} // namespace rebalex
