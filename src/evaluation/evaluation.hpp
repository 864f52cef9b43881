#ifndef FLOWBENCH_EVALUATION_HPP
#define FLOWBENCH_EVALUATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <filesystem>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../metric/metric.hpp"
#include "details/persist.hpp"
#include "details/report.hpp"
#include "details/sample.hpp"

namespace Flowbench::Evaluation {
    using DistanceRange = Details::Report::DistanceRange;
    using ResultInfo = Details::Report::ResultInfo;
    using ValidationReport = Details::Report::ValidationReport;
    using ReportOptions = Details::Report::Options;

    using Details::Sample::accumulate_class_error;
    using Details::Sample::accumulate_sample;
    using Details::Sample::accumulate_sequence;

    [[nodiscard]] inline auto MakeReport(std::string run_name,
                                         const Metric::AccumulatorState& state,
                                         const Metric::Options& options) -> ValidationReport {
        return Details::Report::Build(std::move(run_name), state, options);
    }

    inline auto SaveReport(const ValidationReport& report, const std::filesystem::path& directory) -> std::filesystem::path {
        return Details::Persist::save(report, directory);
    }

    [[nodiscard]] inline auto LoadReport(const std::filesystem::path& path) -> ValidationReport {
        return Details::Persist::load(path);
    }

    inline void Print(const ValidationReport& report, const ReportOptions& options = ReportOptions{}) {
        Details::Report::Print(report, options);
    }
}

#endif //FLOWBENCH_EVALUATION_HPP
