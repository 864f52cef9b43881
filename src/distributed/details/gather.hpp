#ifndef FLOWBENCH_DISTRIBUTED_GATHER_HPP
#define FLOWBENCH_DISTRIBUTED_GATHER_HPP

#include <torch/torch.h>

#include "../../metric/details/accumulator.hpp"
#include "group.hpp"

namespace Flowbench::Distributed::Details {
    // Sum of every participant's state. Every participant computes the same totals.
    [[nodiscard]] inline Metric::Details::AccumulatorState gather(const Metric::Details::BucketedErrorAccumulator& accumulator,
                                                                   ProcessGroup& group) {
        const auto local = accumulator.snapshot_view();
        Metric::Details::AccumulatorState global{};
        global.error_sum = group.all_gather(local.error_sum).sum(0);
        global.error_count = group.all_gather(local.error_count).sum(0);
        global.total_forward_time = group.all_gather(local.total_forward_time).sum(0);
        global.total_forward_count = group.all_gather(local.total_forward_count).sum(0);
        return global;
    }

    // Epoch boundary: gather, then reset the private accumulator. The gathered tensors are
    // copies, so resetting afterwards cannot touch the global view, and no participant
    // resets before its own contribution has been collected.
    [[nodiscard]] inline Metric::Details::AccumulatorState gather_and_reset(Metric::Details::BucketedErrorAccumulator& accumulator,
                                                                             ProcessGroup& group) {
        auto global = gather(accumulator, group);
        accumulator.reset();
        return global;
    }
}

#endif // FLOWBENCH_DISTRIBUTED_GATHER_HPP
