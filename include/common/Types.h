#pragma once

#include <string>

namespace rebalex {

using Price = double;
using Quantity = double;
using Amount = double;

enum class TradingMode { PAPER, LIVE };
enum class OrderSide { BUY, SELL };
enum class OrderType { MKT, LMT, ADAPTIVE_LMT, PEG_MID };
enum class OrderStatus { NEW, SUBMITTED, PARTIAL, FILLED, CANCELED, REJECTED, SKIPPED };
enum class RunStatus { QUEUED, RUNNING, STALLED, BLOCKED, DONE, PARTIAL, FAILED, CANCELED };
enum class SubmissionChannel { NONE, LEADER, SHORT_LIVED };

// Relative tolerance used for every quantity comparison.
constexpr double kQuantityTolerance = 1e-6;

inline std::string toString(TradingMode mode) {
    return mode == TradingMode::LIVE ? "live" : "paper";
}

inline std::string toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MKT: return "MKT";
        case OrderType::LMT: return "LMT";
        case OrderType::ADAPTIVE_LMT: return "ADAPTIVE_LMT";
        case OrderType::PEG_MID: return "PEG_MID";
    }
    return "MKT";
}

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::NEW: return "NEW";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::PARTIAL: return "PARTIAL";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELED: return "CANCELED";
        case OrderStatus::REJECTED: return "REJECTED";
        case OrderStatus::SKIPPED: return "SKIPPED";
    }
    return "NEW";
}

inline std::string toString(RunStatus status) {
    switch (status) {
        case RunStatus::QUEUED: return "queued";
        case RunStatus::RUNNING: return "running";
        case RunStatus::STALLED: return "stalled";
        case RunStatus::BLOCKED: return "blocked";
        case RunStatus::DONE: return "done";
        case RunStatus::PARTIAL: return "partial";
        case RunStatus::FAILED: return "failed";
        case RunStatus::CANCELED: return "canceled";
    }
    return "queued";
}

inline std::string toString(SubmissionChannel channel) {
    switch (channel) {
        case SubmissionChannel::NONE: return "none";
        case SubmissionChannel::LEADER: return "leader";
        case SubmissionChannel::SHORT_LIVED: return "short_lived";
    }
    return "none";
}

} // namespace rebalex
