#ifndef FLOWBENCH_METRIC_BUCKETS_HPP
#define FLOWBENCH_METRIC_BUCKETS_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Flowbench::Metric::Details {
    // N sorted boundaries -> N-1 half-open buckets [b_i, b_{i+1}).
    class BucketBounds {
    public:
        BucketBounds() = default;

        explicit BucketBounds(std::vector<double> splits) : splits_(std::move(splits)) {
            if (splits_.size() < 2) {
                throw std::invalid_argument("Bucket boundaries require at least two values.");
            }
            for (std::size_t i = 0; i < splits_.size(); ++i) {
                if (std::isnan(splits_[i])) {
                    throw std::invalid_argument("Bucket boundaries must not contain NaN.");
                }
                if (i > 0 && !(splits_[i - 1] < splits_[i])) {
                    std::ostringstream message;
                    message << "Bucket boundaries must be strictly increasing (index " << i << ": "
                            << splits_[i - 1] << " >= " << splits_[i] << ").";
                    throw std::invalid_argument(message.str());
                }
            }
        }

        [[nodiscard]] std::size_t size() const noexcept { return splits_.empty() ? 0 : splits_.size() - 1; }
        [[nodiscard]] const std::vector<double>& splits() const noexcept { return splits_; }

        [[nodiscard]] std::vector<std::pair<double, double>> bounds() const {
            std::vector<std::pair<double, double>> result;
            result.reserve(size());
            for (std::size_t i = 0; i + 1 < splits_.size(); ++i) {
                result.emplace_back(splits_[i], splits_[i + 1]);
            }
            return result;
        }

        [[nodiscard]] std::optional<std::size_t> index_of(double value) const {
            if (splits_.size() < 2 || std::isnan(value)) {
                return std::nullopt;
            }
            if (value < splits_.front() || value >= splits_.back()) {
                return std::nullopt;
            }
            // First boundary strictly greater than value closes the bucket, so an exact
            // hit on an upper bound lands in the next bucket.
            const auto upper = std::upper_bound(splits_.begin(), splits_.end(), value);
            return static_cast<std::size_t>(std::distance(splits_.begin(), upper) - 1);
        }

        // Per-value bucket index, -1 where the value falls outside every bucket (NaN included).
        [[nodiscard]] torch::Tensor indices(const torch::Tensor& values) const {
            auto options = torch::TensorOptions().dtype(torch::kFloat64).device(values.device());
            auto boundaries = torch::tensor(splits_, options);
            auto as_double = values.to(torch::kFloat64);
            auto index = torch::bucketize(as_double, boundaries, /*out_int32=*/false, /*right=*/true) - 1;
            const auto last = static_cast<std::int64_t>(size());
            auto outside = (index < 0) | (index >= last) | torch::isnan(as_double);
            return index.masked_fill(outside, -1);
        }

        friend bool operator==(const BucketBounds& lhs, const BucketBounds& rhs) { return lhs.splits_ == rhs.splits_; }

    private:
        std::vector<double> splits_{};
    };
}

#endif // FLOWBENCH_METRIC_BUCKETS_HPP
