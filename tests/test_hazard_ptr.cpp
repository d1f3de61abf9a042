#include <gtest/gtest.h>
#include "Hazard_Ptr.hpp"

#include <atomic>
#include <thread>
#include <utility>
#include <vector>

using namespace TS_Concurrency;

namespace {
    // a separate record pool from the containers under test
    using HPO = Hazard_Ptr_Owner<8>;

    std::atomic<int> deleted_count{ 0 };

    void delete_int(void* ptr) {
        delete static_cast<int*>(ptr);
        deleted_count.fetch_add(1, std::memory_order_relaxed);
    }
}

class HazardPtrTest : public ::testing::Test {
protected:
    void SetUp() override {
        HPO::try_reclaim_memory();
        deleted_count.store(0);
    }
};

TEST_F(HazardPtrTest, ProtectedPtrIsNotReclaimed) {
    int* ptr = new int(1);
    HPO owner;
    owner.protect(ptr);
    EXPECT_EQ(owner.get(), ptr);

    HPO::reclaim_memory_later(ptr, &delete_int);
    HPO::try_reclaim_memory();
    EXPECT_EQ(deleted_count.load(), 0);
    EXPECT_EQ(HPO::pending_reclaim_count(), 1u);

    owner.clear();
    EXPECT_EQ(owner.get(), nullptr);
    HPO::try_reclaim_memory();
    EXPECT_EQ(deleted_count.load(), 1);
    EXPECT_EQ(HPO::pending_reclaim_count(), 0u);
}

TEST_F(HazardPtrTest, ReclaimsAtThreshold) {
    // threshold is the half of the record count
    for (int i = 0; i < 3; ++i) HPO::reclaim_memory_later(new int(i), &delete_int);
    EXPECT_EQ(deleted_count.load(), 0);
    HPO::reclaim_memory_later(new int(3), &delete_int);
    EXPECT_EQ(deleted_count.load(), 4);
}

TEST_F(HazardPtrTest, RecordsAreReleasedOnDestruction) {
    for (int round = 0; round < 3; ++round) {
        std::vector<HPO> owners(8);
        EXPECT_EQ(owners.size(), 8u);
    }
    SUCCEED();
}

TEST_F(HazardPtrTest, MoveTransfersTheRecord) {
    int* ptr = new int(5);
    HPO owner;
    owner.protect(ptr);
    HPO moved{ std::move(owner) };
    EXPECT_EQ(moved.get(), ptr);
    EXPECT_EQ(owner.get(), nullptr);

    HPO::reclaim_memory_later(ptr, &delete_int);
    HPO::try_reclaim_memory();
    EXPECT_EQ(deleted_count.load(), 0);

    moved.clear();
    HPO::try_reclaim_memory();
    EXPECT_EQ(deleted_count.load(), 1);
}

TEST_F(HazardPtrTest, ExitedThreadHandsOverProtectedPtrs) {
    int* ptr = new int(7);
    HPO owner;
    owner.protect(ptr);

    std::thread retiring([ptr] {
        HPO::reclaim_memory_later(ptr, &delete_int);
    });
    retiring.join();
    EXPECT_EQ(deleted_count.load(), 0);

    owner.clear();
    HPO::try_reclaim_memory();
    EXPECT_EQ(deleted_count.load(), 1);
}

TEST(HazardPtrPoolTest, PoolGrowsBeyondTheBlockSize) {
    // a pool used by this test only
    using Small_HPO = Hazard_Ptr_Owner<4>;
    constexpr int OWNERS = 10;

    std::atomic<int> deleted{ 0 };
    static std::atomic<int>* counter;
    counter = &deleted;
    auto delete_counted = [](void* ptr) {
        delete static_cast<int*>(ptr);
        counter->fetch_add(1, std::memory_order_relaxed);
    };

    {
        std::vector<Small_HPO> owners(OWNERS);
        EXPECT_GE(Small_HPO::record_count(), static_cast<std::size_t>(OWNERS));

        // the ptrs protected by the records of the appended blocks are not reclaimed
        std::vector<int*> ptrs;
        for (int i = 0; i < OWNERS; ++i) {
            ptrs.push_back(new int(i));
            owners[i].protect(ptrs.back());
        }
        for (int* ptr : ptrs) Small_HPO::reclaim_memory_later(ptr, delete_counted);
        Small_HPO::try_reclaim_memory();
        EXPECT_EQ(deleted.load(), 0);
        EXPECT_EQ(Small_HPO::pending_reclaim_count(), static_cast<std::size_t>(OWNERS));
    }

    // the records are released with the owners
    Small_HPO::try_reclaim_memory();
    EXPECT_EQ(deleted.load(), OWNERS);

    // the released records are reused
    const std::size_t record_count = Small_HPO::record_count();
    {
        std::vector<Small_HPO> owners(OWNERS);
    }
    EXPECT_EQ(Small_HPO::record_count(), record_count);
}
