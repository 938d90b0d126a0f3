#include "execution/PriceResolver.h"

namespace rebalex {
namespace execution {

namespace {
bool positive(const std::optional<double>& v) {
    return v.has_value() && *v > 0.0;
}

std::optional<double> mid(const core::QuoteItem& q) {
    if (positive(q.bid) && positive(q.ask) && *q.ask >= *q.bid) {
        return (*q.bid + *q.ask) / 2.0;
    }
    return std::nullopt;
}
} // namespace

PriceResolver::PriceResolver(
    core::QuotesSnapshot quotes,
    std::map<std::string, double> history_closes,
    long long now_ms,
    long long quote_stale_ms
) : quotes_(std::move(quotes)),
    history_closes_(std::move(history_closes)),
    now_ms_(now_ms),
    quote_stale_ms_(quote_stale_ms) {}

bool PriceResolver::quotesUsable() const {
    if (!quotes_.present || quotes_.stale) {
        return false;
    }
    return quote_stale_ms_ <= 0 || now_ms_ - quotes_.refreshed_at_ms <= quote_stale_ms_;
}

const core::QuoteItem* PriceResolver::quote(const std::string& symbol) const {
    if (!quotesUsable()) {
        return nullptr;
    }
    auto it = quotes_.items.find(symbol);
    return it == quotes_.items.end() ? nullptr : &it->second;
}

std::optional<ResolvedPrice> PriceResolver::historyPrice(const std::string& symbol) const {
    auto it = history_closes_.find(symbol);
    if (it == history_closes_.end() || !(it->second > 0.0)) {
        return std::nullopt;
    }
    return ResolvedPrice{it->second, "history"};
}

std::optional<ResolvedPrice> PriceResolver::referencePrice(const std::string& symbol) const {
    if (const auto* q = quote(symbol)) {
        if (positive(q->last)) return ResolvedPrice{*q->last, "last"};
        if (const auto m = mid(*q)) return ResolvedPrice{*m, "mid"};
        if (positive(q->close)) return ResolvedPrice{*q->close, "close"};
    }
    return historyPrice(symbol);
}

std::optional<ResolvedPrice> PriceResolver::limitPrice(const std::string& symbol, OrderSide side) const {
    if (const auto* q = quote(symbol)) {
        if (side == OrderSide::BUY && positive(q->ask)) return ResolvedPrice{*q->ask, "ask"};
        if (side == OrderSide::SELL && positive(q->bid)) return ResolvedPrice{*q->bid, "bid"};
        if (const auto m = mid(*q)) return ResolvedPrice{*m, "mid"};
        if (positive(q->last)) return ResolvedPrice{*q->last, "last"};
    }
    return historyPrice(symbol);
}

} // namespace execution
} // namespace rebalex
