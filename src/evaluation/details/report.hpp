#ifndef FLOWBENCH_EVALUATION_REPORT_HPP
#define FLOWBENCH_EVALUATION_REPORT_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../metric/details/accumulator.hpp"
#include "../../utils/terminal.hpp"

namespace Flowbench::Evaluation::Details::Report {
    enum class DistanceRange { All, Close };

    struct Options {
        bool print_summary{true};
        bool print_per_class{true};
        std::ostream* stream{&std::cout};
        Utils::Terminal::FrameStyle frame_style{Utils::Terminal::FrameStyle::Box};
    };

    namespace detail {
        // Empty selections contribute nothing and yield 0 instead of NaN.
        inline double guarded_mean(double sum, std::int64_t count) {
            return count > 0 ? sum / static_cast<double>(count) : 0.0;
        }

        inline torch::Tensor guarded_cell_mean(const torch::Tensor& sum, const torch::Tensor& count) {
            auto count_double = count.to(torch::kFloat64);
            auto mean = sum.to(torch::kFloat64) / count_double.clamp_min(1.0);
            return torch::where(count > 0, mean, torch::zeros_like(mean));
        }

        inline std::string format_double(double value) {
            if (!std::isfinite(value)) {
                return "nan";
            }
            std::ostringstream out;
            out << std::fixed << std::setprecision(6) << value;
            return out.str();
        }
    }

    // Reads a globally summed accumulator state over one distance range.
    class ResultInfo {
    public:
        ResultInfo(std::string name,
                   const Metric::Details::AccumulatorState& state,
                   const Metric::Details::CategoryTable& categories,
                   DistanceRange range)
            : name_(std::move(name)), range_(range) {
            if (!state.defined()) {
                throw std::invalid_argument("ResultInfo requires a defined accumulator state.");
            }
            if (state.error_sum.dim() != 4 || state.error_sum.size(1) != static_cast<std::int64_t>(categories.size())) {
                throw ShapeMismatch("Accumulator state does not match the category table.");
            }
            auto sum = state.error_sum.to(torch::kCPU, torch::kFloat64);
            auto count = state.error_count.to(torch::kCPU, torch::kInt64);
            if (range == DistanceRange::Close) {
                sum = sum[Metric::Details::BucketedErrorAccumulator::kClose];
                count = count[Metric::Details::BucketedErrorAccumulator::kClose];
            } else {
                sum = sum.sum(0);
                count = count.sum(0);
            }
            // [C, S] after collapsing the error buckets.
            class_speed_sum_ = sum.sum(-1);
            class_speed_count_ = count.sum(-1);

            std::vector<std::int64_t> movers(categories.size(), 0);
            for (std::size_t index = 0; index < categories.size(); ++index) {
                movers[index] = categories.is_static_index(index) ? 0 : 1;
            }
            mover_mask_ = torch::tensor(movers, torch::kInt64).to(torch::kBool);
        }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] DistanceRange range() const noexcept { return range_; }

        [[nodiscard]] double mover_epe() const { return masked_mean(mover_mask_); }
        [[nodiscard]] double nonmover_epe() const { return masked_mean(torch::logical_not(mover_mask_)); }

        [[nodiscard]] std::int64_t mover_count() const { return masked_count(mover_mask_); }
        [[nodiscard]] std::int64_t nonmover_count() const { return masked_count(torch::logical_not(mover_mask_)); }

        // [C, S] mean endpoint error, 0 where a cell saw no points.
        [[nodiscard]] torch::Tensor per_class_speed_epe() const {
            return detail::guarded_cell_mean(class_speed_sum_, class_speed_count_);
        }

        [[nodiscard]] double class_epe(std::size_t category_index) const {
            const auto index = static_cast<std::int64_t>(category_index);
            return detail::guarded_mean(class_speed_sum_[index].sum().item<double>(),
                                        class_speed_count_[index].sum().item<std::int64_t>());
        }

        [[nodiscard]] std::int64_t class_count(std::size_t category_index) const {
            return class_speed_count_[static_cast<std::int64_t>(category_index)].sum().item<std::int64_t>();
        }

    private:
        [[nodiscard]] double masked_mean(const torch::Tensor& class_mask) const {
            return detail::guarded_mean(class_speed_sum_.index({class_mask}).sum().item<double>(),
                                        masked_count(class_mask));
        }

        [[nodiscard]] std::int64_t masked_count(const torch::Tensor& class_mask) const {
            return class_speed_count_.index({class_mask}).sum().item<std::int64_t>();
        }

        std::string name_;
        DistanceRange range_;
        torch::Tensor class_speed_sum_{};
        torch::Tensor class_speed_count_{};
        torch::Tensor mover_mask_{};
    };

    struct ValidationReport {
        std::string run_name{};

        torch::Tensor per_class_bucketed_error_sum{};    // [2, C, S, E]
        torch::Tensor per_class_bucketed_error_count{};  // [2, C, S, E]
        torch::Tensor per_class_bucketed_mean_error{};   // [2, C, S, E], 0 where count == 0

        double total_forward_time{0.0};
        std::int64_t total_forward_count{0};
        double average_forward_time{0.0};

        double full_mover_epe{0.0};
        double full_nonmover_epe{0.0};
        double close_mover_epe{0.0};
        double close_nonmover_epe{0.0};

        std::vector<std::int64_t> category_ids{};
        std::vector<std::string> category_names{};
        std::vector<std::int64_t> static_category_ids{};
        std::vector<double> speed_bucket_splits{};
        std::vector<double> endpoint_error_splits{};
        double close_object_threshold_meters{0.0};

        [[nodiscard]] Metric::Details::AccumulatorState state() const {
            return {per_class_bucketed_error_sum,
                    per_class_bucketed_error_count,
                    torch::scalar_tensor(total_forward_time, torch::TensorOptions().dtype(torch::kFloat64)),
                    torch::scalar_tensor(total_forward_count, torch::TensorOptions().dtype(torch::kInt64))};
        }

        [[nodiscard]] Metric::Details::CategoryTable category_table() const {
            std::vector<Metric::Details::Category> categories;
            categories.reserve(category_ids.size());
            for (std::size_t i = 0; i < category_ids.size() && i < category_names.size(); ++i) {
                categories.push_back({category_ids[i], category_names[i]});
            }
            return Metric::Details::CategoryTable(std::move(categories), static_category_ids);
        }
    };

    [[nodiscard]] inline ValidationReport Build(std::string run_name,
                                                const Metric::Details::AccumulatorState& state,
                                                const Metric::Details::Options& options) {
        if (!state.defined()) {
            throw std::invalid_argument("Cannot build a validation report from an undefined accumulator state.");
        }
        const auto forward_count = state.forward_count();
        if (forward_count == 0) {
            throw NoSamplesProcessed();
        }

        const auto& categories = options.categories;
        ResultInfo full(run_name, state, categories, DistanceRange::All);
        ResultInfo close(run_name, state, categories, DistanceRange::Close);

        ValidationReport report{};
        report.run_name = std::move(run_name);
        report.per_class_bucketed_error_sum = state.error_sum.to(torch::kCPU, torch::kFloat64).clone();
        report.per_class_bucketed_error_count = state.error_count.to(torch::kCPU, torch::kInt64).clone();
        report.per_class_bucketed_mean_error = detail::guarded_cell_mean(report.per_class_bucketed_error_sum,
                                                                         report.per_class_bucketed_error_count);
        report.total_forward_time = state.forward_time();
        report.total_forward_count = forward_count;
        report.average_forward_time = report.total_forward_time / static_cast<double>(forward_count);

        report.full_mover_epe = full.mover_epe();
        report.full_nonmover_epe = full.nonmover_epe();
        report.close_mover_epe = close.mover_epe();
        report.close_nonmover_epe = close.nonmover_epe();

        for (const auto& category : categories.categories()) {
            report.category_ids.push_back(category.id);
            report.category_names.push_back(category.name);
        }
        report.static_category_ids = categories.static_ids();
        report.speed_bucket_splits = options.speed_bucket_splits;
        report.endpoint_error_splits = options.endpoint_error_splits;
        report.close_object_threshold_meters = options.close_object_threshold_meters;
        return report;
    }

    inline void Print(const ValidationReport& report, const Options& options) {
        if (!options.stream || !options.print_summary) {
            return;
        }

        auto& stream = *options.stream;
        using namespace Utils::Terminal;
        const auto color = Colors::kBrightBlue;

        std::vector<std::vector<std::string>> rows{
            {"Validation: " + report.run_name, ""},
            {"Metric", "Value"},
            {"Close Mover EPE", detail::format_double(report.close_mover_epe)},
            {"Close Nonmover EPE", detail::format_double(report.close_nonmover_epe)},
            {"Full Mover EPE", detail::format_double(report.full_mover_epe)},
            {"Full Nonmover EPE", detail::format_double(report.full_nonmover_epe)},
            {"Average forward time (s)", detail::format_double(report.average_forward_time)},
        };
        auto widths = ColumnWidths(rows);
        std::vector<std::size_t> spacings;
        for (auto width : widths) {
            spacings.push_back(width + 2);
        }

        stream << '\n' << HTop(spacings, color, options.frame_style) << '\n';
        stream << Row(rows[0], widths) << '\n' << HMid(spacings, color) << '\n';
        stream << Row(rows[1], widths) << '\n' << HMid(spacings, color) << '\n';
        for (std::size_t i = 2; i < rows.size(); ++i) {
            stream << Row(rows[i], widths) << '\n';
        }
        stream << HBottom(spacings, color, options.frame_style) << '\n';

        if (options.print_per_class && !report.category_ids.empty()) {
            const auto categories = report.category_table();
            ResultInfo full(report.run_name, report.state(), categories, DistanceRange::All);

            std::vector<std::vector<std::string>> class_rows{{"Class", "Points", "EPE"}};
            for (std::size_t index = 0; index < categories.size(); ++index) {
                const auto count = full.class_count(index);
                if (count == 0) {
                    continue;
                }
                class_rows.push_back({categories.name_at(index), std::to_string(count),
                                      detail::format_double(full.class_epe(index))});
            }
            if (class_rows.size() > 1) {
                auto class_widths = ColumnWidths(class_rows);
                std::vector<std::size_t> class_spacings;
                for (auto width : class_widths) {
                    class_spacings.push_back(width + 2);
                }
                stream << HTop(class_spacings, color, options.frame_style) << '\n';
                stream << Row(class_rows[0], class_widths) << '\n' << HMid(class_spacings, color) << '\n';
                for (std::size_t i = 1; i < class_rows.size(); ++i) {
                    stream << Row(class_rows[i], class_widths) << '\n';
                }
                stream << HBottom(class_spacings, color, options.frame_style) << '\n';
            }
        }

        stream << "\nForward passes: " << report.total_forward_count << '\n';
    }
}

#endif // FLOWBENCH_EVALUATION_REPORT_HPP
