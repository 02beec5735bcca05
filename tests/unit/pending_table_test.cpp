/**
 * pending_table_test.cpp - PendingTable unit tests
 *
 * Covers keyed insert/take, generation retirement, and the exactly-once
 * resolution guarantee under concurrent take/retire.
 */

#include "rpc/pending_table.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace toolproxy::rpc;

namespace {

WaiterPtr make_waiter(uint64_t generation, int64_t id) {
    return std::make_shared<Waiter>(generation, id, std::chrono::steady_clock::now() + std::chrono::seconds(5));
}

}  // namespace

TEST(PendingTableTest, InsertAndTake) {
    PendingTable table;
    auto waiter = make_waiter(1, 1);
    auto future = waiter->future();

    ASSERT_TRUE(table.insert(waiter));
    EXPECT_EQ(table.size(), 1u);

    auto taken = table.take(1, 1);
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(table.size(), 0u);
    EXPECT_EQ(table.take(1, 1), nullptr);

    taken->resolve(RpcResult::ok({{"value", 42}}));
    auto result = future.get();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.value["value"], 42);
}

TEST(PendingTableTest, DuplicateKeyRejected) {
    PendingTable table;
    ASSERT_TRUE(table.insert(make_waiter(1, 5)));
    EXPECT_FALSE(table.insert(make_waiter(1, 5)));
    EXPECT_TRUE(table.insert(make_waiter(2, 5)));
    EXPECT_EQ(table.size(1), 1u);
    EXPECT_EQ(table.size(2), 1u);
}

TEST(PendingTableTest, TakeRequiresMatchingGeneration) {
    PendingTable table;
    ASSERT_TRUE(table.insert(make_waiter(2, 1)));
    EXPECT_EQ(table.take(1, 1), nullptr);
    EXPECT_NE(table.take(2, 1), nullptr);
}

TEST(PendingTableTest, RetireFailsOnlyOlderGenerations) {
    PendingTable table;
    auto old_a = make_waiter(1, 1);
    auto old_b = make_waiter(1, 2);
    auto fresh = make_waiter(2, 1);
    auto fa = old_a->future();
    auto fb = old_b->future();
    auto ff = fresh->future();
    ASSERT_TRUE(table.insert(old_a));
    ASSERT_TRUE(table.insert(old_b));
    ASSERT_TRUE(table.insert(fresh));

    size_t failed = table.retire_through(1, RpcResult::failure(ErrorKind::RESTART, "restarted"));
    EXPECT_EQ(failed, 2u);

    EXPECT_EQ(fa.get().error_kind, ErrorKind::RESTART);
    EXPECT_EQ(fb.get().error_kind, ErrorKind::RESTART);
    EXPECT_EQ(ff.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);
    EXPECT_EQ(table.size(), 1u);
}

TEST(PendingTableTest, RetiredGenerationRejectsInsertAndTake) {
    PendingTable table;
    table.retire_through(3, RpcResult::failure(ErrorKind::RESTART, "gone"));

    EXPECT_TRUE(table.is_retired(1));
    EXPECT_TRUE(table.is_retired(3));
    EXPECT_FALSE(table.is_retired(4));
    EXPECT_FALSE(table.insert(make_waiter(3, 1)));
    EXPECT_EQ(table.take(3, 1), nullptr);
    EXPECT_TRUE(table.insert(make_waiter(4, 1)));
}

TEST(PendingTableTest, RetireIsIdempotent) {
    PendingTable table;
    ASSERT_TRUE(table.insert(make_waiter(1, 1)));
    EXPECT_EQ(table.retire_through(1, RpcResult::failure(ErrorKind::RESTART, "x")), 1u);
    EXPECT_EQ(table.retire_through(1, RpcResult::failure(ErrorKind::RESTART, "x")), 0u);
    // Retiring an older generation never un-retires a newer one
    EXPECT_EQ(table.retire_through(0, RpcResult::failure(ErrorKind::RESTART, "x")), 0u);
    EXPECT_TRUE(table.is_retired(1));
}

TEST(PendingTableTest, ConcurrentTakeAndRetireResolveExactlyOnce) {
    constexpr int kWaiters = 500;
    PendingTable table;
    std::vector<std::future<RpcResult>> futures;
    for (int i = 1; i <= kWaiters; ++i) {
        auto waiter = make_waiter(1, i);
        futures.push_back(waiter->future());
        ASSERT_TRUE(table.insert(waiter));
    }

    // The reader takes and resolves while a restart retires the generation.
    // std::promise throws on a second set_value, so double resolution would surface here.
    std::atomic<int> resolved_by_reader{0};
    std::thread reader([&]() {
        for (int i = 1; i <= kWaiters; ++i) {
            if (auto waiter = table.take(1, i)) {
                waiter->resolve(RpcResult::ok(i));
                resolved_by_reader++;
            }
        }
    });
    std::thread restarter([&]() {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        table.retire_through(1, RpcResult::failure(ErrorKind::RESTART, "restart"));
    });
    reader.join();
    restarter.join();

    int ok = 0;
    int restarted = 0;
    for (int i = 0; i < kWaiters; ++i) {
        auto result = futures[i].get();
        if (result.success) {
            EXPECT_EQ(result.value, i + 1);
            ok++;
        } else {
            EXPECT_EQ(result.error_kind, ErrorKind::RESTART);
            restarted++;
        }
    }
    EXPECT_EQ(ok, resolved_by_reader.load());
    EXPECT_EQ(ok + restarted, kWaiters);
    EXPECT_EQ(table.size(), 0u);
}
