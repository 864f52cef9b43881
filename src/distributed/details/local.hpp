#ifndef FLOWBENCH_DISTRIBUTED_LOCAL_HPP
#define FLOWBENCH_DISTRIBUTED_LOCAL_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "group.hpp"

namespace Flowbench::Distributed::Details {
    namespace detail {
        // Shared rendezvous for the in-process participants of one LocalGroup.
        class Rendezvous {
        public:
            explicit Rendezvous(std::size_t world_size) : world_size_(world_size), slots_(world_size) {}

            [[nodiscard]] std::size_t world_size() const noexcept { return world_size_; }

            torch::Tensor exchange(std::size_t rank, torch::Tensor contribution) {
                std::unique_lock<std::mutex> lock(mutex_);
                if (aborted_) {
                    throw std::runtime_error("Process group aborted: " + *aborted_);
                }
                const auto generation = generation_;
                slots_[rank] = std::move(contribution);
                ++arrived_;

                if (arrived_ == world_size_) {
                    publish();
                    arrived_ = 0;
                    ++generation_;
                    condition_.notify_all();
                } else {
                    condition_.wait(lock, [&] { return generation_ != generation || aborted_.has_value(); });
                    if (generation_ == generation) {
                        throw std::runtime_error("Process group aborted: " + *aborted_);
                    }
                }

                // The next round cannot complete before this participant joins it, so the
                // published result of this generation is still intact here.
                if (error_) {
                    throw ShapeMismatch(*error_);
                }
                return published_;
            }

            // Wakes every blocked participant with an error. Later exchanges fail immediately.
            void abort(const std::string& reason) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!aborted_) {
                    aborted_ = reason;
                }
                condition_.notify_all();
            }

        private:
            void publish() {
                error_.reset();
                published_ = torch::Tensor{};
                const auto& reference = slots_.front();
                for (std::size_t rank = 1; rank < slots_.size(); ++rank) {
                    const auto& candidate = slots_[rank];
                    if (candidate.sizes() != reference.sizes() || candidate.scalar_type() != reference.scalar_type()) {
                        std::ostringstream message;
                        message << "all_gather contributions disagree: rank 0 " << reference.sizes() << ' '
                                << reference.scalar_type() << " vs rank " << rank << ' ' << candidate.sizes() << ' '
                                << candidate.scalar_type() << '.';
                        error_ = message.str();
                        break;
                    }
                }
                if (!error_) {
                    published_ = torch::stack(slots_, 0);
                }
                for (auto& slot : slots_) {
                    slot = torch::Tensor{};
                }
            }

            std::size_t world_size_;
            std::mutex mutex_{};
            std::condition_variable condition_{};
            std::vector<torch::Tensor> slots_;
            std::size_t arrived_{0};
            std::uint64_t generation_{0};
            torch::Tensor published_{};
            std::optional<std::string> error_{};
            std::optional<std::string> aborted_{};
        };
    }

    // P participants living in one process, one per worker thread. Each handle is owned
    // by exactly one worker; the rendezvous is shared.
    class LocalGroup final : public ProcessGroup {
    public:
        [[nodiscard]] static std::vector<ProcessGroupPtr> create(std::size_t world_size) {
            if (world_size == 0) {
                throw std::invalid_argument("LocalGroup requires at least one participant.");
            }
            auto rendezvous = std::make_shared<detail::Rendezvous>(world_size);
            std::vector<ProcessGroupPtr> handles;
            handles.reserve(world_size);
            for (std::size_t rank = 0; rank < world_size; ++rank) {
                handles.push_back(std::shared_ptr<LocalGroup>(new LocalGroup(rank, rendezvous)));
            }
            return handles;
        }

        [[nodiscard]] std::size_t rank() const override { return rank_; }
        [[nodiscard]] std::size_t world_size() const override { return rendezvous_->world_size(); }

        [[nodiscard]] torch::Tensor all_gather(const torch::Tensor& local) override {
            if (!local.defined()) {
                throw std::invalid_argument("all_gather requires a defined tensor.");
            }
            const auto device = local.device();
            auto contribution = local.detach().to(torch::kCPU).clone();
            auto stacked = rendezvous_->exchange(rank_, std::move(contribution));
            return stacked.to(device);
        }

        void barrier() override {
            (void)rendezvous_->exchange(rank_, torch::zeros({1}, torch::kInt8));
        }

        void abort(const std::string& reason) override { rendezvous_->abort(reason); }

    private:
        LocalGroup(std::size_t rank, std::shared_ptr<detail::Rendezvous> rendezvous)
            : rank_(rank), rendezvous_(std::move(rendezvous)) {}

        std::size_t rank_;
        std::shared_ptr<detail::Rendezvous> rendezvous_;
    };
}

#endif // FLOWBENCH_DISTRIBUTED_LOCAL_HPP
