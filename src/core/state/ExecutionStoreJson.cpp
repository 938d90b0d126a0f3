#include "core/state/ExecutionStoreJson.h"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

#include "common/Logger.h"
#include "common/LotSizeHelper.h"
#include "common/PathUtils.h"
#include "core/state/RecordJson.h"
#include "execution/JobLock.h"

namespace rebalex {
namespace core {

namespace {
constexpr int kSchemaVersion = 1;

bool samePayload(const Order& a, const Order& b) {
    if (a.run_id != b.run_id || a.symbol != b.symbol || a.side != b.side || a.order_type != b.order_type) {
        return false;
    }
    if (!common::quantityEquals(a.quantity, b.quantity, a.quantity)) {
        return false;
    }
    if (a.limit_price.has_value() != b.limit_price.has_value()) {
        return false;
    }
    return !a.limit_price || common::quantityEquals(*a.limit_price, *b.limit_price, *a.limit_price);
}

// Inter-process write lock for one transaction.
class WriteLock {
public:
    WriteLock(const std::string& name, const std::filesystem::path& dir) : lock_(name, dir) {
        if (!lock_.acquire()) {
            throw std::runtime_error("store_lock_failed");
        }
    }

private:
    rebalex::execution::JobLock lock_;
};
} // namespace

ExecutionStoreJson::ExecutionStoreJson(std::filesystem::path file_path, std::shared_ptr<const IClock> clock)
    : file_path_(std::move(file_path)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      lock_dir_(file_path_.parent_path()),
      lock_name_(file_path_.stem().string()) {
    std::lock_guard<std::mutex> lock(mutex_);
    reloadIfChangedLocked();
}

ExecutionStoreJson::FileStamp ExecutionStoreJson::statFile() const {
    FileStamp stamp;
    struct stat st {};
    if (::stat(file_path_.c_str(), &st) != 0) {
        return stamp;
    }
    stamp.exists = true;
    stamp.inode = static_cast<unsigned long long>(st.st_ino);
    stamp.size = static_cast<long long>(st.st_size);
    stamp.mtime_ns = static_cast<long long>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    return stamp;
}

void ExecutionStoreJson::reloadIfChangedLocked() {
    const FileStamp stamp = statFile();
    if (stamp == loaded_stamp_) {
        return;
    }
    loadLocked();
    loaded_stamp_ = stamp;
}

void ExecutionStoreJson::loadLocked() {
    next_run_id_ = 1;
    next_order_id_ = 1;
    next_fill_id_ = 1;
    runs_.clear();
    orders_.clear();
    client_index_.clear();
    fills_.clear();
    fill_tokens_.clear();

    if (!std::filesystem::exists(file_path_)) {
        return;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("execution_store_unreadable");
    }

    nlohmann::json raw;
    try {
        in >> raw;
        next_run_id_ = raw.value("next_run_id", 1LL);
        next_order_id_ = raw.value("next_order_id", 1LL);
        next_fill_id_ = raw.value("next_fill_id", 1LL);

        for (const auto& row : raw.value("runs", nlohmann::json::array())) {
            Run run = runFromJson(row);
            next_run_id_ = std::max(next_run_id_, run.id + 1);
            runs_[run.id] = std::move(run);
        }
        for (const auto& row : raw.value("orders", nlohmann::json::array())) {
            Order order = orderFromJson(row);
            next_order_id_ = std::max(next_order_id_, order.id + 1);
            client_index_[order.client_order_id] = order.id;
            orders_[order.id] = std::move(order);
        }
        for (const auto& row : raw.value("fills", nlohmann::json::array())) {
            Fill fill = fillFromJson(row);
            next_fill_id_ = std::max(next_fill_id_, fill.id + 1);
            fill_tokens_.insert(fill.exec_token);
            fills_[fill.order_id].push_back(std::move(fill));
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("execution store {} is corrupt: {}", file_path_.string(), e.what());
        throw std::runtime_error("execution_store_corrupt");
    }

    LOG_DEBUG("execution store loaded: runs={}, orders={}, fills={}",
             runs_.size(), orders_.size(), fill_tokens_.size());
}

bool ExecutionStoreJson::persistLocked() {
    nlohmann::json raw;
    raw["schema_version"] = kSchemaVersion;
    raw["saved_at_ms"] = clock_->nowMs();
    raw["next_run_id"] = next_run_id_;
    raw["next_order_id"] = next_order_id_;
    raw["next_fill_id"] = next_fill_id_;

    nlohmann::json runs = nlohmann::json::array();
    for (const auto& [id, run] : runs_) {
        runs.push_back(toJson(run));
    }
    nlohmann::json orders = nlohmann::json::array();
    for (const auto& [id, order] : orders_) {
        orders.push_back(toJson(order));
    }
    nlohmann::json fills = nlohmann::json::array();
    for (const auto& [order_id, rows] : fills_) {
        for (const auto& fill : rows) {
            fills.push_back(toJson(fill));
        }
    }
    raw["runs"] = std::move(runs);
    raw["orders"] = std::move(orders);
    raw["fills"] = std::move(fills);

    if (!utils::PathUtils::writeFileAtomically(file_path_, raw.dump(2))) {
        LOG_ERROR("execution store write failed: {}", file_path_.string());
        return false;
    }
    loaded_stamp_ = statFile();
    return true;
}

Run ExecutionStoreJson::createRun(Run run) {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteLock file_lock(lock_name_, lock_dir_);
    reloadIfChangedLocked();
    const long long now = clock_->nowMs();
    run.id = next_run_id_++;
    run.created_at_ms = now;
    run.updated_at_ms = now;
    if (run.last_progress_at_ms == 0) {
        run.last_progress_at_ms = now;
    }
    runs_[run.id] = run;
    if (!persistLocked()) {
        runs_.erase(run.id);
        --next_run_id_;
        throw std::runtime_error("store_write_failed");
    }
    return run;
}

std::optional<Run> ExecutionStoreJson::getRun(long long run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reloadIfChangedLocked();
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Run> ExecutionStoreJson::listRuns() {
    std::lock_guard<std::mutex> lock(mutex_);
    reloadIfChangedLocked();
    std::vector<Run> out;
    out.reserve(runs_.size());
    for (const auto& [id, run] : runs_) {
        out.push_back(run);
    }
    return out;
}

std::optional<Run> ExecutionStoreJson::updateRun(long long run_id, const RunMutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteLock file_lock(lock_name_, lock_dir_);
    reloadIfChangedLocked();
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return std::nullopt;
    }

    Run next = it->second;
    if (!mutator(next)) {
        return it->second;
    }
    next.id = run_id;
    next.created_at_ms = it->second.created_at_ms;
    next.updated_at_ms = clock_->nowMs();

    Run previous = it->second;
    it->second = next;
    if (!persistLocked()) {
        it->second = previous;
        throw std::runtime_error("store_write_failed");
    }
    return next;
}

OrderCreateResult ExecutionStoreJson::createOrder(Order order) {
    if (order.client_order_id.empty()) {
        throw std::invalid_argument("client_order_id_required");
    }
    if (order.symbol.empty()) {
        throw std::invalid_argument("symbol_required");
    }
    if (!(order.quantity > 0.0)) {
        throw std::invalid_argument("quantity_must_be_positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    WriteLock file_lock(lock_name_, lock_dir_);
    reloadIfChangedLocked();
    auto existing = client_index_.find(order.client_order_id);
    if (existing != client_index_.end()) {
        const Order& stored = orders_.at(existing->second);
        if (!samePayload(stored, order)) {
            throw std::invalid_argument("client_order_id_conflict");
        }
        return OrderCreateResult{stored, false};
    }
    if (order.run_id && runs_.find(*order.run_id) == runs_.end()) {
        throw std::invalid_argument("run_not_found");
    }

    const long long now = clock_->nowMs();
    order.id = next_order_id_++;
    order.status = OrderStatus::NEW;
    order.filled_quantity = 0.0;
    order.created_at_ms = now;
    order.updated_at_ms = now;
    order.last_progress_at_ms = now;
    orders_[order.id] = order;
    client_index_[order.client_order_id] = order.id;

    if (!persistLocked()) {
        orders_.erase(order.id);
        client_index_.erase(order.client_order_id);
        --next_order_id_;
        throw std::runtime_error("store_write_failed");
    }
    return OrderCreateResult{order, true};
}

std::optional<Order> ExecutionStoreJson::getOrder(long long order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reloadIfChangedLocked();
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Order> ExecutionStoreJson::findOrderByClientId(const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reloadIfChangedLocked();
    auto it = client_index_.find(client_order_id);
    if (it == client_index_.end()) {
        return std::nullopt;
    }
    return orders_.at(it->second);
}

std::vector<Order> ExecutionStoreJson::listOrdersForRun(long long run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reloadIfChangedLocked();
    std::vector<Order> out;
    for (const auto& [id, order] : orders_) {
        if (order.run_id && *order.run_id == run_id) {
            out.push_back(order);
        }
    }
    return out;
}

std::vector<Order> ExecutionStoreJson::listFreeOrders() {
    std::lock_guard<std::mutex> lock(mutex_);
    reloadIfChangedLocked();
    std::vector<Order> out;
    for (const auto& [id, order] : orders_) {
        if (!order.run_id) {
            out.push_back(order);
        }
    }
    return out;
}

bool ExecutionStoreJson::mutateOrderCopy(const Order& current, Order& next, const OrderMutator& mutator) const {
    next = current;
    if (!mutator(next)) {
        return false;
    }
    next.id = current.id;
    next.run_id = current.run_id;
    next.client_order_id = current.client_order_id;
    next.created_at_ms = current.created_at_ms;

    const double tol = kQuantityTolerance * std::max(1.0, current.quantity);
    if (next.filled_quantity < current.filled_quantity - tol) {
        LOG_WARN("order {} mutation would regress filled_quantity {} -> {}, ignored",
                 current.client_order_id, current.filled_quantity, next.filled_quantity);
        return false;
    }
    if (next.filled_quantity > next.quantity + tol) {
        LOG_WARN("order {} mutation would overfill {} > {}, ignored",
                 current.client_order_id, next.filled_quantity, next.quantity);
        return false;
    }
    next.updated_at_ms = clock_->nowMs();
    return true;
}

std::optional<Order> ExecutionStoreJson::updateOrder(long long order_id, const OrderMutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteLock file_lock(lock_name_, lock_dir_);
    reloadIfChangedLocked();
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }

    Order next;
    if (!mutateOrderCopy(it->second, next, mutator)) {
        return it->second;
    }

    Order previous = it->second;
    it->second = next;
    if (!persistLocked()) {
        it->second = previous;
        throw std::runtime_error("store_write_failed");
    }
    return next;
}

FillApplyResult ExecutionStoreJson::applyFill(Fill fill, const OrderMutator& mutator) {
    FillApplyResult result;
    if (fill.exec_token.empty()) {
        throw std::invalid_argument("exec_token_required");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    WriteLock file_lock(lock_name_, lock_dir_);
    reloadIfChangedLocked();
    auto it = orders_.find(fill.order_id);
    if (it == orders_.end()) {
        return result;
    }
    if (fill_tokens_.count(fill.exec_token) > 0) {
        result.duplicate = true;
        result.order = it->second;
        return result;
    }

    Order next;
    if (!mutateOrderCopy(it->second, next, mutator)) {
        result.order = it->second;
        return result;
    }

    Order previous = it->second;
    fill.id = next_fill_id_++;
    it->second = next;
    fills_[fill.order_id].push_back(fill);
    fill_tokens_.insert(fill.exec_token);

    if (!persistLocked()) {
        it->second = previous;
        fills_[fill.order_id].pop_back();
        fill_tokens_.erase(fill.exec_token);
        --next_fill_id_;
        throw std::runtime_error("store_write_failed");
    }

    result.applied = true;
    result.order = next;
    return result;
}

std::vector<Fill> ExecutionStoreJson::listFills(long long order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reloadIfChangedLocked();
    auto it = fills_.find(order_id);
    if (it == fills_.end()) {
        return {};
    }
    return it->second;
}

} // namespace core
} // namespace rebalex
