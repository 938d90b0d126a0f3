#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "common/Clock.h"
#include "core/contracts/IExecutionStore.h"

namespace rebalex {
namespace core {

// JSON document store. The whole document is rewritten atomically (temp file
// + rename) after every committed transaction; a failed write rolls the
// in-memory state back and throws std::runtime_error("store_write_failed").
// Several processes may share one file: each write transaction holds
// <dir>/<stem>.lock and reloads the document first when another writer
// replaced it, and reads pick up replaced documents too.
class ExecutionStoreJson : public IExecutionStore {
public:
    ExecutionStoreJson(std::filesystem::path file_path, std::shared_ptr<const IClock> clock);

    Run createRun(Run run) override;
    std::optional<Run> getRun(long long run_id) override;
    std::vector<Run> listRuns() override;
    std::optional<Run> updateRun(long long run_id, const RunMutator& mutator) override;

    OrderCreateResult createOrder(Order order) override;
    std::optional<Order> getOrder(long long order_id) override;
    std::optional<Order> findOrderByClientId(const std::string& client_order_id) override;
    std::vector<Order> listOrdersForRun(long long run_id) override;
    std::vector<Order> listFreeOrders() override;
    std::optional<Order> updateOrder(long long order_id, const OrderMutator& mutator) override;

    FillApplyResult applyFill(Fill fill, const OrderMutator& mutator) override;
    std::vector<Fill> listFills(long long order_id) override;

private:
    struct FileStamp {
        bool exists = false;
        unsigned long long inode = 0;
        long long size = 0;
        long long mtime_ns = 0;

        bool operator==(const FileStamp& other) const {
            return exists == other.exists && inode == other.inode && size == other.size &&
                   mtime_ns == other.mtime_ns;
        }
        bool operator!=(const FileStamp& other) const { return !(*this == other); }
    };

    FileStamp statFile() const;
    void loadLocked();
    void reloadIfChangedLocked();
    bool persistLocked();
    // Runs the mutator on a copy; returns false when it declined or would
    // violate a row invariant.
    bool mutateOrderCopy(const Order& current, Order& next, const OrderMutator& mutator) const;

    std::filesystem::path file_path_;
    std::shared_ptr<const IClock> clock_;
    std::filesystem::path lock_dir_;
    std::string lock_name_;
    mutable std::mutex mutex_;
    FileStamp loaded_stamp_;

    long long next_run_id_ = 1;
    long long next_order_id_ = 1;
    long long next_fill_id_ = 1;
    std::map<long long, Run> runs_;
    std::map<long long, Order> orders_;
    std::map<std::string, long long> client_index_;
    std::map<long long, std::vector<Fill>> fills_;
    std::set<std::string> fill_tokens_;
};

} // namespace core
} // namespace rebalex
