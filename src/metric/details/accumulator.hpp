#ifndef FLOWBENCH_METRIC_ACCUMULATOR_HPP
#define FLOWBENCH_METRIC_ACCUMULATOR_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "buckets.hpp"
#include "category.hpp"

namespace Flowbench::Metric::Details {
    inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

    struct Options {
        CategoryTable categories{Argoverse2Categories()};
        std::vector<double> speed_bucket_splits{0.0, 0.5, 2.0, kInfinity};  // m/s
        std::vector<double> endpoint_error_splits{0.0, 0.05, 0.1, kInfinity}; // m
        double close_object_threshold_meters{35.0};
        double per_frame_to_per_second_scale_factor{10.0};  // 10 Hz LiDAR
        bool strict_bucket_range{false};
    };

    // Copy of the four accumulator tensors. Holds no reference to the live accumulator.
    struct AccumulatorState {
        torch::Tensor error_sum{};           // [2, C, S, E] float64
        torch::Tensor error_count{};         // [2, C, S, E] int64
        torch::Tensor total_forward_time{};  // 0-d float64
        torch::Tensor total_forward_count{}; // 0-d int64

        [[nodiscard]] bool defined() const noexcept {
            return error_sum.defined() && error_count.defined() && total_forward_time.defined()
                   && total_forward_count.defined();
        }

        [[nodiscard]] AccumulatorState clone() const {
            return {error_sum.clone(), error_count.clone(), total_forward_time.clone(), total_forward_count.clone()};
        }

        [[nodiscard]] AccumulatorState to(const torch::Device& device) const {
            return {error_sum.to(device), error_count.to(device), total_forward_time.to(device), total_forward_count.to(device)};
        }

        [[nodiscard]] double forward_time() const { return total_forward_time.item<double>(); }
        [[nodiscard]] std::int64_t forward_count() const { return total_forward_count.item<std::int64_t>(); }
    };

    namespace detail {
        inline void require_same_layout(const AccumulatorState& lhs, const AccumulatorState& rhs) {
            if (!lhs.defined() || !rhs.defined()) {
                throw std::invalid_argument("Cannot merge undefined accumulator states.");
            }
            if (lhs.error_sum.sizes() != rhs.error_sum.sizes() || lhs.error_count.sizes() != rhs.error_count.sizes()) {
                std::ostringstream message;
                message << "Accumulator layouts differ: " << lhs.error_sum.sizes() << " vs " << rhs.error_sum.sizes() << '.';
                throw ShapeMismatch(message.str());
            }
        }
    }

    // Element-wise sum. Integer counts and the float64 sums make this commutative and,
    // for the counts, exactly associative.
    [[nodiscard]] inline AccumulatorState merge(const AccumulatorState& lhs, const AccumulatorState& rhs) {
        detail::require_same_layout(lhs, rhs);
        const auto device = lhs.error_sum.device();
        return {lhs.error_sum + rhs.error_sum.to(device),
                lhs.error_count + rhs.error_count.to(device),
                lhs.total_forward_time + rhs.total_forward_time.to(device),
                lhs.total_forward_count + rhs.total_forward_count.to(device)};
    }

    // Buckets endpoint errors by IS_CLOSE x CLASS x SPEED x EPE.
    class BucketedErrorAccumulator {
    public:
        static constexpr std::int64_t kClose = 0;
        static constexpr std::int64_t kFar = 1;

        explicit BucketedErrorAccumulator(Options options = {})
            : options_(std::move(options)),
              speed_buckets_(options_.speed_bucket_splits),
              error_buckets_(options_.endpoint_error_splits) {
            if (options_.categories.empty()) {
                throw std::invalid_argument("BucketedErrorAccumulator requires a non-empty category table.");
            }
            const std::vector<std::int64_t> layout = shape();
            error_sum_ = torch::zeros(layout, torch::TensorOptions().dtype(torch::kFloat64));
            error_count_ = torch::zeros(layout, torch::TensorOptions().dtype(torch::kInt64));
            total_forward_time_ = torch::scalar_tensor(0.0, torch::TensorOptions().dtype(torch::kFloat64));
            total_forward_count_ = torch::scalar_tensor(0, torch::TensorOptions().dtype(torch::kInt64));
        }

        [[nodiscard]] const Options& options() const noexcept { return options_; }
        [[nodiscard]] const CategoryTable& categories() const noexcept { return options_.categories; }
        [[nodiscard]] const BucketBounds& speed_buckets() const noexcept { return speed_buckets_; }
        [[nodiscard]] const BucketBounds& error_buckets() const noexcept { return error_buckets_; }
        [[nodiscard]] torch::Device device() const { return error_sum_.device(); }

        [[nodiscard]] std::vector<std::int64_t> shape() const {
            return {2,
                    static_cast<std::int64_t>(options_.categories.size()),
                    static_cast<std::int64_t>(speed_buckets_.size()),
                    static_cast<std::int64_t>(error_buckets_.size())};
        }

        void to(const torch::Device& device) {
            error_sum_ = error_sum_.to(device);
            error_count_ = error_count_.to(device);
            total_forward_time_ = total_forward_time_.to(device);
            total_forward_count_ = total_forward_count_.to(device);
        }

        void update(std::int64_t proximity_index, std::int64_t category_id, double speed, double error_magnitude) {
            require_proximity(proximity_index);
            const auto category_index = static_cast<std::int64_t>(options_.categories.index_of(category_id));

            const auto speed_index = speed_buckets_.index_of(speed);
            const auto error_index = error_buckets_.index_of(error_magnitude);
            if (!speed_index || !error_index) {
                if (options_.strict_bucket_range) {
                    std::ostringstream message;
                    message << "Point outside configured bucket ranges (speed " << speed << " m/s, error "
                            << error_magnitude << " m).";
                    throw BucketRangeViolation(message.str());
                }
                return;
            }

            const auto s = static_cast<std::int64_t>(*speed_index);
            const auto e = static_cast<std::int64_t>(*error_index);
            error_sum_[proximity_index][category_index][s][e].add_(error_magnitude);
            error_count_[proximity_index][category_index][s][e].add_(1);
        }

        // Batched form of update(): one proximity index, speed and error per point, all of one category.
        void update(const torch::Tensor& proximity, std::int64_t category_id,
                    const torch::Tensor& speeds, const torch::Tensor& errors) {
            if (!proximity.defined() || !speeds.defined() || !errors.defined()) {
                throw std::invalid_argument("Accumulator update requires defined proximity, speed and error tensors.");
            }
            const auto count = proximity.numel();
            if (speeds.numel() != count || errors.numel() != count) {
                std::ostringstream message;
                message << "Accumulator update expects matching point counts (proximity " << count << ", speed "
                        << speeds.numel() << ", error " << errors.numel() << ").";
                throw ShapeMismatch(message.str());
            }
            const auto category_index = static_cast<std::int64_t>(options_.categories.index_of(category_id));
            if (count == 0) {
                return;
            }

            const auto device = error_sum_.device();
            auto proximity_index = proximity.to(device, torch::kInt64).reshape({-1});
            if (((proximity_index < kClose) | (proximity_index > kFar)).any().item<bool>()) {
                throw std::invalid_argument("Proximity index must be 0 (close) or 1 (far).");
            }

            auto error_values = errors.to(device, torch::kFloat64).reshape({-1});
            auto speed_index = speed_buckets_.indices(speeds.to(device).reshape({-1}));
            auto error_index = error_buckets_.indices(error_values);
            auto in_range = (speed_index >= 0) & (error_index >= 0);
            if (options_.strict_bucket_range && !in_range.all().item<bool>()) {
                const auto dropped = count - in_range.sum().item<std::int64_t>();
                throw BucketRangeViolation(std::to_string(dropped) + " point(s) fall outside the configured bucket ranges.");
            }

            const auto layout = shape();
            auto flat = ((proximity_index * layout[1] + category_index) * layout[2] + speed_index) * layout[3] + error_index;
            flat = flat.masked_select(in_range);
            error_values = error_values.masked_select(in_range);

            error_sum_.view({-1}).index_add_(0, flat, error_values);
            error_count_.view({-1}).index_add_(0, flat, torch::ones_like(flat));
        }

        void update_runtime(double run_time_seconds, std::int64_t run_count) {
            if (run_time_seconds < 0.0 || run_count < 0) {
                throw std::invalid_argument("Runtime totals only accept non-negative increments.");
            }
            total_forward_time_.add_(run_time_seconds);
            total_forward_count_.add_(run_count);
        }

        void merge(const AccumulatorState& other) {
            detail::require_same_layout(snapshot_view(), other);
            const auto device = error_sum_.device();
            error_sum_.add_(other.error_sum.to(device));
            error_count_.add_(other.error_count.to(device));
            total_forward_time_.add_(other.total_forward_time.to(device));
            total_forward_count_.add_(other.total_forward_count.to(device));
        }

        void merge(const BucketedErrorAccumulator& other) { merge(other.snapshot_view()); }

        void reset() {
            error_sum_.zero_();
            error_count_.zero_();
            total_forward_time_.zero_();
            total_forward_count_.zero_();
        }

        [[nodiscard]] AccumulatorState snapshot() const { return snapshot_view().clone(); }

        // Live tensors, shared storage. Used by the gather path, which copies them itself.
        [[nodiscard]] AccumulatorState snapshot_view() const {
            return {error_sum_, error_count_, total_forward_time_, total_forward_count_};
        }

    private:
        static void require_proximity(std::int64_t proximity_index) {
            if (proximity_index != kClose && proximity_index != kFar) {
                throw std::invalid_argument("Proximity index must be 0 (close) or 1 (far), got "
                                            + std::to_string(proximity_index) + ".");
            }
        }

        Options options_;
        BucketBounds speed_buckets_;
        BucketBounds error_buckets_;

        torch::Tensor error_sum_{};
        torch::Tensor error_count_{};
        torch::Tensor total_forward_time_{};
        torch::Tensor total_forward_count_{};
    };
}

#endif // FLOWBENCH_METRIC_ACCUMULATOR_HPP
