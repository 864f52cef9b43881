#include <cmath>
#include <filesystem>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Flowbench.h"

using Flowbench::Evaluation::DistanceRange;
using Flowbench::Evaluation::ResultInfo;
using Flowbench::Metric::BucketedErrorAccumulator;
using Flowbench::Metric::CategoryTable;
using Flowbench::Metric::Options;

namespace {
    Options ReportOptions() {
        Options options{};
        options.categories = CategoryTable({{-1, "BACKGROUND"}, {0, "CAR"}, {1, "PEDESTRIAN"}});
        options.speed_bucket_splits = {0.0, 0.5, Flowbench::Metric::kInfinity};
        options.endpoint_error_splits = {0.0, 0.1, Flowbench::Metric::kInfinity};
        return options;
    }

    // Close car 0.2 m, far car 0.4 m, close background 0.02 m.
    BucketedErrorAccumulator Populated() {
        BucketedErrorAccumulator acc(ReportOptions());
        acc.update(BucketedErrorAccumulator::kClose, 0, 3.0, 0.2);
        acc.update(BucketedErrorAccumulator::kFar, 0, 3.0, 0.4);
        acc.update(BucketedErrorAccumulator::kClose, -1, 0.0, 0.02);
        acc.update_runtime(0.5, 2);
        return acc;
    }

    std::filesystem::path ScratchDirectory(const std::string& name) {
        auto path = std::filesystem::temp_directory_path() / ("flowbench_" + name);
        std::filesystem::remove_all(path);
        return path;
    }
}

TEST(ResultInfo, MoverAndNonmoverMeans) {
    const auto acc = Populated();
    const ResultInfo full("run", acc.snapshot(), acc.categories(), DistanceRange::All);
    const ResultInfo close("run", acc.snapshot(), acc.categories(), DistanceRange::Close);
    EXPECT_NEAR(full.mover_epe(), 0.3, 1e-12);
    EXPECT_NEAR(full.nonmover_epe(), 0.02, 1e-12);
    EXPECT_NEAR(close.mover_epe(), 0.2, 1e-12);
    EXPECT_EQ(full.mover_count(), 2);
    EXPECT_EQ(close.mover_count(), 1);
}

TEST(ResultInfo, EmptyCellsYieldZeroNotNaN) {
    const auto acc = Populated();
    const ResultInfo full("run", acc.snapshot(), acc.categories(), DistanceRange::All);
    const auto table = full.per_class_speed_epe();
    EXPECT_FALSE(torch::isnan(table).any().item<bool>());
    EXPECT_DOUBLE_EQ(table[2][0].item<double>(), 0.0);  // no pedestrians at all
    EXPECT_DOUBLE_EQ(full.class_epe(2), 0.0);
}

TEST(ValidationReport, BuildsHeadlineMetrics) {
    const auto acc = Populated();
    const auto report = Flowbench::Evaluation::MakeReport("zeroflow", acc.snapshot(), acc.options());
    EXPECT_EQ(report.run_name, "zeroflow");
    EXPECT_NEAR(report.full_mover_epe, 0.3, 1e-12);
    EXPECT_NEAR(report.full_nonmover_epe, 0.02, 1e-12);
    EXPECT_NEAR(report.close_mover_epe, 0.2, 1e-12);
    EXPECT_NEAR(report.close_nonmover_epe, 0.02, 1e-12);
    EXPECT_DOUBLE_EQ(report.average_forward_time, 0.25);
    EXPECT_FALSE(torch::isnan(report.per_class_bucketed_mean_error).any().item<bool>());
    EXPECT_EQ(report.category_names.at(1), "CAR");
}

TEST(ValidationReport, RefusesEmptyRuns) {
    BucketedErrorAccumulator acc(ReportOptions());
    acc.update(BucketedErrorAccumulator::kClose, 0, 1.0, 0.1);
    EXPECT_THROW((void)Flowbench::Evaluation::MakeReport("empty", acc.snapshot(), acc.options()),
                 Flowbench::NoSamplesProcessed);
}

TEST(ValidationReport, PrintsFramedTables) {
    const auto acc = Populated();
    const auto report = Flowbench::Evaluation::MakeReport("printed", acc.snapshot(), acc.options());
    std::ostringstream out;
    Flowbench::Evaluation::ReportOptions options{};
    options.stream = &out;
    Flowbench::Evaluation::Print(report, options);
    const auto text = out.str();
    EXPECT_NE(text.find("Validation: printed"), std::string::npos);
    EXPECT_NE(text.find("Close Mover EPE"), std::string::npos);
    EXPECT_NE(text.find("CAR"), std::string::npos);
    EXPECT_EQ(text.find("PEDESTRIAN"), std::string::npos);
    EXPECT_NE(text.find("Forward passes: 2"), std::string::npos);
    EXPECT_NE(text.find("┏"), std::string::npos);
    EXPECT_NE(text.find("┛"), std::string::npos);
}

TEST(ValidationReport, RoundedFrameStyle) {
    const auto acc = Populated();
    const auto report = Flowbench::Evaluation::MakeReport("rounded", acc.snapshot(), acc.options());
    std::ostringstream out;
    Flowbench::Evaluation::ReportOptions options{};
    options.stream = &out;
    options.frame_style = Flowbench::Utils::Terminal::FrameStyle::Rounded;
    Flowbench::Evaluation::Print(report, options);
    const auto text = out.str();
    EXPECT_NE(text.find("╭"), std::string::npos);
    EXPECT_NE(text.find("╯"), std::string::npos);
    EXPECT_EQ(text.find("┏"), std::string::npos);
}

TEST(ValidationReport, PersistsAndReloads) {
    const auto acc = Populated();
    const auto report = Flowbench::Evaluation::MakeReport("persisted", acc.snapshot(), acc.options());
    const auto directory = ScratchDirectory("report");
    const auto path = Flowbench::Evaluation::SaveReport(report, directory);
    EXPECT_EQ(path, directory / "persisted.json");
    ASSERT_TRUE(std::filesystem::exists(path));

    const auto loaded = Flowbench::Evaluation::LoadReport(path);
    EXPECT_EQ(loaded.run_name, report.run_name);
    EXPECT_DOUBLE_EQ(loaded.full_mover_epe, report.full_mover_epe);
    EXPECT_DOUBLE_EQ(loaded.close_nonmover_epe, report.close_nonmover_epe);
    EXPECT_EQ(loaded.total_forward_count, 2);
    EXPECT_EQ(loaded.category_ids, report.category_ids);
    EXPECT_TRUE(std::isinf(loaded.speed_bucket_splits.back()));
    EXPECT_TRUE(torch::equal(loaded.per_class_bucketed_error_count, report.per_class_bucketed_error_count));
    EXPECT_TRUE(torch::allclose(loaded.per_class_bucketed_error_sum, report.per_class_bucketed_error_sum));
    std::filesystem::remove_all(directory);
}
