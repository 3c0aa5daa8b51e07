#include "docpack/basic/log.h"
#include "docpack/basic/parallel.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace
{
struct TestParallel : public ::testing::Test {
protected:
    void SetUp() override {
        nums.resize(1000);
        for (std::size_t i = 0; i < nums.size(); ++i) {
            nums[i] = static_cast<std::int32_t>(i);
        }
    }
    std::vector<std::int32_t> nums;
    const std::size_t expectedSum = (0 + 999) * 1000 / 2;
};
} // namespace

TEST_F(TestParallel, TestVecAccess) {
    std::atomic<std::size_t> pSum { 0 };
    DocPack::ParallelRun(
        nums.begin(), nums.end(),
        [&](decltype(nums.begin()) begin, std::size_t groupSize, std::size_t groupIndex) {
            EXPECT_LE(groupSize, 10u);
            EXPECT_EQ(*begin, static_cast<std::int32_t>(groupIndex * 10));
            std::size_t sum_value = 0;
            for (std::size_t i = 0; i < groupSize; ++i) {
                sum_value += *begin;
                ++begin;
            }
            pSum += sum_value;
        },
        10);
    EXPECT_EQ(pSum.load(), expectedSum);
}

TEST_F(TestParallel, TestIndexRange) {
    std::vector<std::int32_t> doubled(nums.size(), -1);
    DocPack::ParallelRun(
        std::size_t(0), nums.size(),
        [&](std::size_t begin, std::size_t groupSize, std::size_t) {
            for (auto i = begin; i < begin + groupSize; ++i)
                doubled[i] = nums[i] * 2;
        },
        7);
    for (std::size_t i = 0; i < nums.size(); ++i) {
        EXPECT_EQ(doubled[i], nums[i] * 2);
    }
}

TEST_F(TestParallel, TestRawPtrUnevenGroups) {
    std::size_t size  = 11;
    std::int32_t* ptr = nums.data();
    std::atomic<std::int32_t> pSum { 0 };
    std::mutex mutex;
    std::vector<std::size_t> groupSizes(6, 0);
    DocPack::ParallelRun(
        ptr, ptr + size,
        [&](std::int32_t* p, std::size_t groupSize, std::size_t groupIndex) {
            std::int32_t sum_value = 0;
            for (std::size_t i = 0; i < groupSize; ++i) {
                sum_value += *p;
                ++p;
            }
            DPDEBUG("sum_value:{} groupSize:{} groupIndex:{}", sum_value, groupSize, groupIndex);
            std::scoped_lock<std::mutex> locker(mutex);
            groupSizes.at(groupIndex) = groupSize;
            pSum += sum_value;
        },
        2);
    EXPECT_EQ(pSum.load(), 55);
    EXPECT_EQ(groupSizes, (std::vector<std::size_t> { 2, 2, 2, 2, 2, 1 }));
}

TEST_F(TestParallel, TestFirstGroupRunsInline) {
    const auto caller = std::this_thread::get_id();
    std::thread::id firstGroupThread;
    DocPack::ParallelRun(
        std::size_t(0), std::size_t(100),
        [&](std::size_t, std::size_t, std::size_t groupIndex) {
            if (groupIndex == 0) firstGroupThread = std::this_thread::get_id();
        },
        25);
    EXPECT_EQ(firstGroupThread, caller);
}

TEST_F(TestParallel, TestInlineExecutor) {
    const auto caller = std::this_thread::get_id();
    std::set<std::thread::id> threads;
    std::vector<std::size_t> order;
    DocPack::ParallelRun(
        nums.begin(), nums.end(),
        [&](decltype(nums.begin()), std::size_t, std::size_t groupIndex) {
            threads.insert(std::this_thread::get_id());
            order.push_back(groupIndex);
        },
        100, DocPack::InlineParallelExecutor {});
    EXPECT_EQ(threads, std::set<std::thread::id> { caller });
    ASSERT_EQ(order.size(), 10u);
    for (std::size_t i = 0; i < order.size(); ++i)
        EXPECT_EQ(order[i], i);
}

TEST_F(TestParallel, TestException) {
    std::atomic<std::size_t> finished { 0 };
    EXPECT_THROW(DocPack::ParallelRun(
                     nums.begin(), nums.end(),
                     [&](decltype(nums.begin()), std::size_t, std::size_t groupIndex) {
                         if (groupIndex == 3) throw std::invalid_argument("test");
                         ++finished;
                     },
                     10),
                 std::invalid_argument);
    // every other group still ran to completion before the rethrow
    EXPECT_EQ(finished.load(), 99u);
}

TEST_F(TestParallel, TestEmptyRangeAndZeroGroupSize) {
    std::size_t calls = 0;
    DocPack::ParallelRun(nums.begin(), nums.begin(), [&](decltype(nums.begin()), std::size_t, std::size_t) { ++calls; });
    EXPECT_EQ(calls, 0u);
    DocPack::ParallelRun(
        nums.begin(), nums.end(),
        [&](decltype(nums.begin()), std::size_t groupSize, std::size_t) {
            EXPECT_EQ(groupSize, nums.size());
            ++calls;
        },
        0);
    EXPECT_EQ(calls, 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
