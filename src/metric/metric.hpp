#ifndef FLOWBENCH_METRIC_HPP
#define FLOWBENCH_METRIC_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/accumulator.hpp"
#include "details/buckets.hpp"
#include "details/category.hpp"

namespace Flowbench::Metric {
    using Category = Details::Category;
    using CategoryTable = Details::CategoryTable;
    using BucketBounds = Details::BucketBounds;
    using Options = Details::Options;
    using AccumulatorState = Details::AccumulatorState;
    using BucketedErrorAccumulator = Details::BucketedErrorAccumulator;

    using Details::merge;
    using Details::kInfinity;

    [[nodiscard]] inline auto Argoverse2Categories() -> CategoryTable { return Details::Argoverse2Categories(); }
}

#endif // FLOWBENCH_METRIC_HPP
