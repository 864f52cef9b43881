#include <limits>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Flowbench.h"

using Flowbench::Metric::AccumulatorState;
using Flowbench::Metric::BucketedErrorAccumulator;
using Flowbench::Metric::CategoryTable;
using Flowbench::Metric::Options;

namespace {
    Options SmallOptions() {
        Options options{};
        options.categories = CategoryTable({{0, "BACKGROUND"}, {1, "CAR"}}, {0});
        options.speed_bucket_splits = {0.0, 5.0, 10.0};
        options.endpoint_error_splits = {0.0, 1.0};
        return options;
    }

    std::int64_t Count(const BucketedErrorAccumulator& acc, std::int64_t p, std::int64_t c, std::int64_t s, std::int64_t e) {
        return acc.snapshot_view().error_count[p][c][s][e].item<std::int64_t>();
    }
}

TEST(Accumulator, StartsZeroedWithConfiguredLayout) {
    const BucketedErrorAccumulator acc(SmallOptions());
    const auto state = acc.snapshot();
    EXPECT_EQ(acc.shape(), (std::vector<std::int64_t>{2, 2, 2, 1}));
    EXPECT_EQ(state.error_sum.scalar_type(), torch::kFloat64);
    EXPECT_EQ(state.error_count.scalar_type(), torch::kInt64);
    EXPECT_EQ(state.error_count.sum().item<std::int64_t>(), 0);
    EXPECT_EQ(state.forward_count(), 0);
}

TEST(Accumulator, ThreePointsLandInThreeCells) {
    BucketedErrorAccumulator acc(SmallOptions());
    const std::vector<std::int64_t> categories{0, 0, 1};
    const std::vector<double> speeds{1.0, 6.0, 1.0};
    for (std::size_t i = 0; i < categories.size(); ++i) {
        acc.update(BucketedErrorAccumulator::kClose, categories[i], speeds[i], 0.1);
    }
    EXPECT_EQ(Count(acc, 0, 0, 0, 0), 1);
    EXPECT_EQ(Count(acc, 0, 0, 1, 0), 1);
    EXPECT_EQ(Count(acc, 0, 1, 0, 0), 1);
    EXPECT_EQ(acc.snapshot_view().error_count.sum().item<std::int64_t>(), 3);
    EXPECT_NEAR(acc.snapshot_view().error_sum.sum().item<double>(), 0.3, 1e-12);
}

TEST(Accumulator, BatchedUpdateMatchesScalarUpdates) {
    BucketedErrorAccumulator scalar(SmallOptions());
    BucketedErrorAccumulator batched(SmallOptions());
    const std::vector<std::int64_t> proximity{0, 1, 1, 0};
    const std::vector<double> speeds{0.5, 7.0, 9.99, 4.99};
    const std::vector<double> errors{0.2, 0.4, 0.6, 0.8};
    for (std::size_t i = 0; i < proximity.size(); ++i) {
        scalar.update(proximity[i], 1, speeds[i], errors[i]);
    }
    batched.update(torch::tensor(proximity), 1, torch::tensor(speeds), torch::tensor(errors));
    EXPECT_TRUE(torch::equal(scalar.snapshot().error_count, batched.snapshot().error_count));
    EXPECT_TRUE(torch::allclose(scalar.snapshot().error_sum, batched.snapshot().error_sum));
}

TEST(Accumulator, OutOfRangePointsAreDroppedByDefault) {
    BucketedErrorAccumulator acc(SmallOptions());
    acc.update(BucketedErrorAccumulator::kFar, 1, 12.0, 0.1);  // speed above the top boundary
    acc.update(BucketedErrorAccumulator::kFar, 1, 1.0, 1.5);   // error above the top boundary
    acc.update(torch::tensor(std::vector<std::int64_t>{1}), 1, torch::tensor(std::vector<double>{-0.1}),
               torch::tensor(std::vector<double>{0.1}));
    EXPECT_EQ(acc.snapshot_view().error_count.sum().item<std::int64_t>(), 0);
}

TEST(Accumulator, StrictModeRaisesOnOutOfRangePoints) {
    auto options = SmallOptions();
    options.strict_bucket_range = true;
    BucketedErrorAccumulator acc(options);
    EXPECT_THROW(acc.update(BucketedErrorAccumulator::kFar, 1, 12.0, 0.1), Flowbench::BucketRangeViolation);
    EXPECT_THROW(acc.update(torch::tensor(std::vector<std::int64_t>{0, 1}), 1,
                            torch::tensor(std::vector<double>{1.0, 1.0}),
                            torch::tensor(std::vector<double>{0.5, 2.0})),
                 Flowbench::BucketRangeViolation);
}

TEST(Accumulator, UnknownCategoryIsReported) {
    BucketedErrorAccumulator acc(SmallOptions());
    try {
        acc.update(BucketedErrorAccumulator::kClose, 99, 1.0, 0.1);
        FAIL() << "expected UnknownCategory";
    } catch (const Flowbench::UnknownCategory& error) {
        EXPECT_EQ(error.category_id(), 99);
    }
}

TEST(Accumulator, RejectsInvalidProximityAndRuntime) {
    BucketedErrorAccumulator acc(SmallOptions());
    EXPECT_THROW(acc.update(2, 0, 1.0, 0.1), std::invalid_argument);
    EXPECT_THROW(acc.update_runtime(-1.0, 1), std::invalid_argument);
    EXPECT_THROW(acc.update_runtime(1.0, -1), std::invalid_argument);
}

TEST(Accumulator, ResetIsIdempotent) {
    BucketedErrorAccumulator acc(SmallOptions());
    acc.update(0, 1, 1.0, 0.5);
    acc.update_runtime(0.25, 2);
    acc.reset();
    const auto once = acc.snapshot();
    acc.reset();
    const auto twice = acc.snapshot();
    EXPECT_EQ(once.error_count.sum().item<std::int64_t>(), 0);
    EXPECT_EQ(once.forward_count(), 0);
    EXPECT_DOUBLE_EQ(once.forward_time(), 0.0);
    EXPECT_TRUE(torch::equal(once.error_sum, twice.error_sum));
}

TEST(Accumulator, SnapshotIsIndependentOfLiveState) {
    BucketedErrorAccumulator acc(SmallOptions());
    acc.update(0, 1, 1.0, 0.5);
    const auto snapshot = acc.snapshot();
    acc.reset();
    EXPECT_EQ(snapshot.error_count.sum().item<std::int64_t>(), 1);
}

TEST(Accumulator, MergeIsCommutativeAndAssociative) {
    BucketedErrorAccumulator a(SmallOptions()), b(SmallOptions()), c(SmallOptions());
    a.update(0, 0, 1.0, 0.1);
    a.update_runtime(0.5, 1);
    b.update(1, 1, 6.0, 0.3);
    b.update_runtime(0.25, 2);
    c.update(0, 1, 2.0, 0.7);
    c.update_runtime(0.125, 4);

    const auto ab = Flowbench::Metric::merge(a.snapshot(), b.snapshot());
    const auto ba = Flowbench::Metric::merge(b.snapshot(), a.snapshot());
    EXPECT_TRUE(torch::equal(ab.error_count, ba.error_count));
    EXPECT_TRUE(torch::allclose(ab.error_sum, ba.error_sum));

    const auto left = Flowbench::Metric::merge(ab, c.snapshot());
    const auto right = Flowbench::Metric::merge(a.snapshot(), Flowbench::Metric::merge(b.snapshot(), c.snapshot()));
    EXPECT_TRUE(torch::equal(left.error_count, right.error_count));
    EXPECT_TRUE(torch::allclose(left.error_sum, right.error_sum));
    EXPECT_EQ(left.forward_count(), 7);
    EXPECT_DOUBLE_EQ(left.forward_time(), 0.875);

    a.merge(b);
    EXPECT_TRUE(torch::equal(a.snapshot().error_count, ab.error_count));
}

TEST(Accumulator, MergeRejectsDifferentLayouts) {
    BucketedErrorAccumulator small(SmallOptions());
    BucketedErrorAccumulator large{};
    EXPECT_THROW(small.merge(large), Flowbench::ShapeMismatch);
}
