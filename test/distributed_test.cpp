#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Flowbench.h"

using Flowbench::Metric::AccumulatorState;
using Flowbench::Metric::BucketedErrorAccumulator;
using Flowbench::Metric::CategoryTable;
using Flowbench::Metric::Options;

namespace {
    Options TinyOptions() {
        Options options{};
        options.categories = CategoryTable({{-1, "BACKGROUND"}, {1, "CAR"}});
        options.speed_bucket_splits = {0.0, 5.0, 10.0};
        options.endpoint_error_splits = {0.0, 1.0};
        return options;
    }
}

TEST(SingleProcessGroup, GatherIsTheLocalState) {
    auto group = Flowbench::Distributed::Single();
    BucketedErrorAccumulator acc(TinyOptions());
    acc.update(0, 1, 1.0, 0.5);
    acc.update_runtime(0.1, 1);
    EXPECT_TRUE(Flowbench::Distributed::is_reporting_rank(*group));
    const auto global = Flowbench::Distributed::gather_and_reset(acc, *group);
    EXPECT_EQ(global.error_count.sum().item<std::int64_t>(), 1);
    EXPECT_EQ(global.forward_count(), 1);
    EXPECT_EQ(acc.snapshot_view().error_count.sum().item<std::int64_t>(), 0);
}

TEST(LocalGroup, TwoParticipantsSumAndReset) {
    auto groups = Flowbench::Distributed::Local(2);
    std::vector<AccumulatorState> globals(2);
    std::vector<std::int64_t> local_after_reset(2, -1);

    auto worker = [&](std::size_t rank) {
        BucketedErrorAccumulator acc(TinyOptions());
        for (int i = 0; i < 5; ++i) {
            acc.update(BucketedErrorAccumulator::kClose, 1, 1.0, 0.5);
        }
        acc.update_runtime(0.5, 5);
        globals[rank] = Flowbench::Distributed::gather_and_reset(acc, *groups[rank]);
        local_after_reset[rank] = acc.snapshot_view().error_count.sum().item<std::int64_t>();
    };
    std::thread first(worker, 0);
    std::thread second(worker, 1);
    first.join();
    second.join();

    for (std::size_t rank = 0; rank < 2; ++rank) {
        EXPECT_EQ(globals[rank].error_count[0][1][0][0].item<std::int64_t>(), 10);
        EXPECT_NEAR(globals[rank].error_sum[0][1][0][0].item<double>(), 5.0, 1e-12);
        EXPECT_EQ(globals[rank].forward_count(), 10);
        EXPECT_EQ(local_after_reset[rank], 0);
    }
    EXPECT_EQ(groups[0]->rank(), 0u);
    EXPECT_EQ(groups[1]->world_size(), 2u);
    EXPECT_FALSE(Flowbench::Distributed::is_reporting_rank(*groups[1]));
}

TEST(LocalGroup, MismatchedContributionsFailEveryParticipant) {
    auto groups = Flowbench::Distributed::Local(2);
    std::vector<int> failures(2, 0);
    auto worker = [&](std::size_t rank) {
        try {
            (void)groups[rank]->all_gather(torch::zeros({static_cast<std::int64_t>(rank + 1)}));
        } catch (const Flowbench::ShapeMismatch&) {
            failures[rank] = 1;
        }
    };
    std::thread first(worker, 0);
    std::thread second(worker, 1);
    first.join();
    second.join();
    EXPECT_EQ(failures[0], 1);
    EXPECT_EQ(failures[1], 1);
}

TEST(LocalGroup, AbortReleasesBlockedParticipants) {
    auto groups = Flowbench::Distributed::Local(2);
    std::string message;
    std::thread waiting([&] {
        try {
            (void)groups[0]->all_gather(torch::zeros({1}));
        } catch (const std::runtime_error& error) {
            message = error.what();
        }
    });
    groups[1]->abort("rank 1 failed");
    waiting.join();
    EXPECT_NE(message.find("rank 1 failed"), std::string::npos);
}

TEST(LocalGroup, RepeatedRoundsStayInStep) {
    auto groups = Flowbench::Distributed::Local(3);
    std::vector<double> totals(3, 0.0);
    auto worker = [&](std::size_t rank) {
        for (int round = 0; round < 20; ++round) {
            auto gathered = groups[rank]->all_gather(torch::full({1}, static_cast<double>(rank + round), torch::kFloat64));
            totals[rank] += gathered.sum().item<double>();
        }
        groups[rank]->barrier();
    };
    std::vector<std::thread> threads;
    for (std::size_t rank = 0; rank < 3; ++rank) {
        threads.emplace_back(worker, rank);
    }
    for (auto& thread : threads) {
        thread.join();
    }
    // Each round sums (0 + 1 + 2) + 3 * round.
    const double expected = 20 * 3.0 + 3.0 * (19 * 20 / 2);
    for (const auto total : totals) {
        EXPECT_DOUBLE_EQ(total, expected);
    }
}

TEST(LocalGroup, RequiresParticipants) {
    EXPECT_THROW((void)Flowbench::Distributed::Local(0), std::invalid_argument);
}
