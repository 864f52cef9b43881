#include <limits>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Flowbench.h"

using Flowbench::Metric::BucketBounds;
using Flowbench::Metric::CategoryTable;

namespace {
    constexpr double kInf = std::numeric_limits<double>::infinity();
}

TEST(BucketBounds, RejectsMalformedBoundaries) {
    EXPECT_THROW(BucketBounds({0.0}), std::invalid_argument);
    EXPECT_THROW(BucketBounds({0.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(BucketBounds({1.0, 0.5}), std::invalid_argument);
    EXPECT_THROW(BucketBounds({0.0, std::numeric_limits<double>::quiet_NaN()}), std::invalid_argument);
}

TEST(BucketBounds, HalfOpenIntervals) {
    const BucketBounds bounds({0.0, 0.5, 2.0, kInf});
    ASSERT_EQ(bounds.size(), 3u);
    EXPECT_EQ(bounds.index_of(0.0), 0u);
    EXPECT_EQ(bounds.index_of(0.49), 0u);
    EXPECT_EQ(bounds.index_of(0.5), 1u);  // upper bound belongs to the next bucket
    EXPECT_EQ(bounds.index_of(2.0), 2u);
    EXPECT_EQ(bounds.index_of(1e9), 2u);
    EXPECT_FALSE(bounds.index_of(-0.01).has_value());
    EXPECT_FALSE(bounds.index_of(kInf).has_value());
    EXPECT_FALSE(bounds.index_of(std::numeric_limits<double>::quiet_NaN()).has_value());
}

TEST(BucketBounds, TensorIndicesMatchScalarLookup) {
    const BucketBounds bounds({0.0, 0.05, 0.1, kInf});
    const std::vector<double> values{-1.0, 0.0, 0.049, 0.05, 0.0999, 0.1, 12.0};
    const auto indices = bounds.indices(torch::tensor(values, torch::kFloat64));
    ASSERT_EQ(indices.numel(), static_cast<std::int64_t>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) {
        const auto expected = bounds.index_of(values[i]);
        const auto actual = indices[static_cast<std::int64_t>(i)].item<std::int64_t>();
        if (expected) {
            EXPECT_EQ(actual, static_cast<std::int64_t>(*expected)) << "value " << values[i];
        } else {
            EXPECT_EQ(actual, -1) << "value " << values[i];
        }
    }
}

TEST(CategoryTable, LooksUpByIdInInsertionOrder) {
    const CategoryTable table({{-1, "BACKGROUND"}, {0, "CAR"}, {7, "PEDESTRIAN"}});
    EXPECT_EQ(table.size(), 3u);
    EXPECT_EQ(table.index_of(7), 2u);
    EXPECT_EQ(table.name_at(1), "CAR");
    EXPECT_TRUE(table.is_static(-1));
    EXPECT_FALSE(table.is_static(0));
    EXPECT_THROW((void)table.index_of(42), Flowbench::UnknownCategory);
}

TEST(CategoryTable, RejectsDuplicatesAndEmptyTables) {
    EXPECT_THROW(CategoryTable({{0, "A"}, {0, "B"}}), std::invalid_argument);
    EXPECT_THROW(CategoryTable(std::vector<Flowbench::Metric::Category>{}), std::invalid_argument);
}

TEST(CategoryTable, RejectsStaticIdsOutsideTheTable) {
    try {
        const CategoryTable table({{-1, "BACKGROUND"}, {1, "CAR"}}, {7});
        FAIL() << "static id 7 was accepted, static_ids().size()=" << table.static_ids().size();
    } catch (const Flowbench::UnknownCategory& error) {
        EXPECT_EQ(error.category_id(), 7);
    }
    const CategoryTable table({{-1, "BACKGROUND"}, {1, "CAR"}}, {-1, 1});
    EXPECT_TRUE(table.is_static(-1));
    EXPECT_TRUE(table.is_static(1));
}

TEST(CategoryTable, Argoverse2Defaults) {
    const auto table = Flowbench::Metric::Argoverse2Categories();
    EXPECT_EQ(table.id_at(0), -1);
    EXPECT_EQ(table.name_at(0), "BACKGROUND");
    EXPECT_TRUE(table.contains(29));
    EXPECT_EQ(table.static_ids(), std::vector<std::int64_t>{-1});
}
