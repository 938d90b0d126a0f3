#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/model/ExecutionTypes.h"

namespace rebalex {
namespace core {

struct OrderCreateResult {
    Order order;
    bool created = false;
};

struct FillApplyResult {
    bool applied = false;
    bool duplicate = false;
    std::optional<Order> order;
};

// System of record for runs, orders and fills. Every mutation is applied to
// the freshest copy of the row under the store's own lock; a mutator returns
// false to leave the row untouched.
class IExecutionStore {
public:
    virtual ~IExecutionStore() = default;

    using RunMutator = std::function<bool(Run&)>;
    using OrderMutator = std::function<bool(Order&)>;

    // Assigns id and timestamps.
    virtual Run createRun(Run run) = 0;
    virtual std::optional<Run> getRun(long long run_id) = 0;
    virtual std::vector<Run> listRuns() = 0;
    virtual std::optional<Run> updateRun(long long run_id, const RunMutator& mutator) = 0;

    // Idempotent by client_order_id: a known key with an identical payload
    // returns the stored order; a conflicting payload throws
    // std::invalid_argument("client_order_id_conflict").
    virtual OrderCreateResult createOrder(Order order) = 0;
    virtual std::optional<Order> getOrder(long long order_id) = 0;
    virtual std::optional<Order> findOrderByClientId(const std::string& client_order_id) = 0;
    virtual std::vector<Order> listOrdersForRun(long long run_id) = 0;
    virtual std::vector<Order> listFreeOrders() = 0;
    virtual std::optional<Order> updateOrder(long long order_id, const OrderMutator& mutator) = 0;

    // Records the fill and applies the order mutation in one transaction.
    // A fill whose exec_token is already stored is a duplicate and changes
    // nothing; so does a mutator returning false.
    virtual FillApplyResult applyFill(Fill fill, const OrderMutator& mutator) = 0;
    virtual std::vector<Fill> listFills(long long order_id) = 0;
};

} // namespace core
} // namespace rebalex
