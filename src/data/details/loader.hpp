#ifndef FLOWBENCH_DATA_LOADER_HPP
#define FLOWBENCH_DATA_LOADER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "dataset.hpp"

namespace Flowbench::Data::Details {
    struct LoaderOptions {
        std::size_t batch_size{1};
        bool shuffle{false};
        bool drop_last{false};
        std::uint64_t seed{0};
        std::size_t rank{0};
        std::size_t world_size{1};
    };

    // Stride sharding over a (possibly shuffled) global order: rank r owns positions r, r + P, ...
    // Every rank draws the same permutation for a given (seed, epoch), so shards stay disjoint.
    class Loader {
    public:
        Loader(DatasetPtr dataset, LoaderOptions options) : dataset_(std::move(dataset)), options_(options) {
            if (!dataset_) {
                throw std::invalid_argument("Loader requires a dataset.");
            }
            if (options_.batch_size == 0) {
                throw std::invalid_argument("Loader batch_size must be positive.");
            }
            if (options_.world_size == 0 || options_.rank >= options_.world_size) {
                throw std::invalid_argument("Loader rank " + std::to_string(options_.rank) + " is not below world size "
                                            + std::to_string(options_.world_size) + ".");
            }
            set_epoch(0);
        }

        void set_epoch(std::uint64_t epoch) {
            std::vector<std::size_t> order(dataset_->size());
            std::iota(order.begin(), order.end(), std::size_t{0});
            if (options_.shuffle) {
                std::mt19937_64 engine(options_.seed + epoch);
                std::shuffle(order.begin(), order.end(), engine);
            }
            shard_.clear();
            for (std::size_t position = options_.rank; position < order.size(); position += options_.world_size) {
                shard_.push_back(order[position]);
            }
        }

        [[nodiscard]] const std::vector<std::size_t>& shard() const noexcept { return shard_; }
        [[nodiscard]] const LoaderOptions& options() const noexcept { return options_; }

        [[nodiscard]] std::size_t num_batches() const noexcept {
            if (options_.drop_last) {
                return shard_.size() / options_.batch_size;
            }
            return (shard_.size() + options_.batch_size - 1) / options_.batch_size;
        }

        [[nodiscard]] Batch batch(std::size_t index) const {
            if (index >= num_batches()) {
                throw std::out_of_range("Batch index " + std::to_string(index) + " out of range ("
                                        + std::to_string(num_batches()) + " batches).");
            }
            const auto begin = index * options_.batch_size;
            const auto end = std::min(begin + options_.batch_size, shard_.size());
            std::vector<SceneFlowSample> samples;
            samples.reserve(end - begin);
            for (auto position = begin; position < end; ++position) {
                samples.push_back(dataset_->get(shard_[position]));
            }
            return collate(std::move(samples));
        }

    private:
        DatasetPtr dataset_;
        LoaderOptions options_;
        std::vector<std::size_t> shard_{};
    };
}

#endif // FLOWBENCH_DATA_LOADER_HPP
