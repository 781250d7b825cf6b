#include "searchlight/decoding/partition.hpp"

#include <gtest/gtest.h>
#include <functional>
#include <stdexcept>
#include <vector>

#include "searchlight/base/errors.h"

namespace searchlight {
namespace decoding {

namespace {

std::vector<int64_t> sizes(const std::vector<Partition>& parts) {
    std::vector<int64_t> out;
    for (const Partition& part : parts) {
        out.push_back(part.size());
    }
    return out;
}

}  // namespace

TEST(PartitionTest, split_axis) {
    std::vector<Partition> parts = split_axis(10, 3);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0].begin, 0);
    EXPECT_EQ(parts[0].end, 4);
    EXPECT_EQ(parts[1].begin, 4);
    EXPECT_EQ(parts[1].end, 7);
    EXPECT_EQ(parts[2].begin, 7);
    EXPECT_EQ(parts[2].end, 10);

    EXPECT_EQ(sizes(split_axis(6, 1)), std::vector<int64_t>({6}));
    EXPECT_EQ(sizes(split_axis(6, 3)), std::vector<int64_t>({2, 2, 2}));
    EXPECT_EQ(sizes(split_axis(7, 4)), std::vector<int64_t>({2, 2, 2, 1}));

    // more jobs than elements => one element per chunk, never an empty chunk
    EXPECT_EQ(sizes(split_axis(2, 5)), std::vector<int64_t>({1, 1}));
    EXPECT_TRUE(split_axis(0, 3).empty());
}

TEST(PartitionTest, coordinator_keeps_partition_order) {
    ThreadPoolRunner runner(4);
    ParallelSplitCoordinator coordinator(&runner, 4);
    EXPECT_EQ(coordinator.n_jobs(), 4);
    EXPECT_EQ(coordinator.partition(3, "slices").size(), 3u);

    std::vector<std::function<int64_t()>> units;
    for (int64_t idx = 0; idx < 12; idx++) {
        units.push_back([idx]() { return idx * idx; });
    }
    std::vector<int64_t> results = coordinator.run(units);
    ASSERT_EQ(results.size(), 12u);
    for (int64_t idx = 0; idx < 12; idx++) {
        EXPECT_EQ(results[idx], idx * idx);
    }
}

TEST(PartitionTest, coordinator_rethrows_first_failure) {
    ThreadPoolRunner runner(3);
    ParallelSplitCoordinator coordinator(&runner, 3);

    std::vector<std::function<int()>> units;
    units.push_back([]() { return 0; });
    units.push_back([]() -> int { throw std::runtime_error("unit 1"); });
    units.push_back([]() -> int { throw std::out_of_range("unit 2"); });

    try {
        coordinator.run(units);
        FAIL() << "expected the unit failure to reach the caller";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "unit 1");
    }

    // the pool survives failing units
    units.erase(units.begin() + 1, units.end());
    EXPECT_EQ(coordinator.run(units), std::vector<int>({0}));
}

TEST(PartitionTest, merge) {
    torch::Tensor chunk = torch::ones({2, 3});
    EXPECT_TRUE(ParallelSplitCoordinator::merge({chunk}, 0).is_same(chunk));

    torch::Tensor merged = ParallelSplitCoordinator::merge({torch::zeros({2, 1}), torch::ones({2, 2})}, 1);
    EXPECT_EQ(merged.sizes(), torch::IntArrayRef({2, 3}));
    EXPECT_EQ(merged.select(1, 0).sum().item<float>(), 0.0f);
    EXPECT_EQ(merged.narrow(1, 1, 2).sum().item<float>(), 4.0f);
}

TEST(PartitionTest, merge_rejects_inconsistent_chunks) {
    // dtype differs => no silent promotion
    std::vector<torch::Tensor> mixed{torch::zeros({3}, torch::kLong), torch::zeros({2}, torch::kDouble)};
    EXPECT_THROW(ParallelSplitCoordinator::merge(mixed, 0), ShapeError);
    // trailing dimension differs
    EXPECT_THROW(ParallelSplitCoordinator::merge({torch::zeros({3, 2}), torch::zeros({2, 1})}, 0), ShapeError);
    // rank differs
    EXPECT_THROW(ParallelSplitCoordinator::merge({torch::zeros({3, 2}), torch::zeros({2})}, 0), ShapeError);
    // only the merged dimension may differ
    EXPECT_EQ(ParallelSplitCoordinator::merge({torch::zeros({2, 3}), torch::zeros({2, 1})}, 1).sizes(),
              torch::IntArrayRef({2, 4}));
    EXPECT_THROW(ParallelSplitCoordinator::merge({torch::zeros({2, 3}), torch::zeros({1, 3})}, 1), ShapeError);
}

}  // namespace decoding
}  // namespace searchlight
