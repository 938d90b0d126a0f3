#include "execution/JobLock.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include "TestSupport.h"

using rebalex::execution::JobLock;

int main() {
    const auto dir = rebalex::test::makeTempDir("joblock") / "locks";

    {
        JobLock first("trade_execution", dir);
        JobLock second("trade_execution", dir);
        JobLock other("reconcile", dir);

        REBALEX_EXPECT(first.tryAcquire(), "first holder acquires");
        REBALEX_EXPECT(first.held(), "first holds");
        REBALEX_EXPECT(first.tryAcquire(), "re-acquire by holder is a no-op");
        REBALEX_EXPECT(!second.tryAcquire(), "second holder is busy");
        REBALEX_EXPECT(!second.held(), "busy holder holds nothing");
        REBALEX_EXPECT(other.tryAcquire(), "different name is independent");
        REBALEX_EXPECT(std::filesystem::exists(dir / "trade_execution.lock"), "lock file created");

        first.release();
        REBALEX_EXPECT(!first.held(), "released");
        REBALEX_EXPECT(second.tryAcquire(), "acquire after release");
    }

    {
        // destruction releases
        JobLock again("trade_execution", dir);
        REBALEX_EXPECT(again.tryAcquire(), "acquire after scope exit");
    }

    {
        // acquire() waits for the holder
        JobLock holder("execution_store", dir);
        REBALEX_EXPECT(holder.tryAcquire(), "holder acquires");
        std::atomic<bool> acquired{false};
        std::thread waiter([&dir, &acquired]() {
            JobLock blocking("execution_store", dir);
            if (blocking.acquire()) {
                acquired = true;
            }
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        const bool before_release = acquired.load();
        holder.release();
        waiter.join();
        REBALEX_EXPECT(!before_release, "waiter blocked while held");
        REBALEX_EXPECT(acquired.load(), "waiter acquires after release");
    }

    std::error_code ec;
    std::filesystem::remove_all(dir.parent_path(), ec);
    std::cout << "[TEST] JobLock PASSED\n";
    return 0;
}
