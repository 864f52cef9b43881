#ifndef FLOWBENCH_DISTRIBUTED_GROUP_HPP
#define FLOWBENCH_DISTRIBUTED_GROUP_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Flowbench::Distributed::Details {
    // The one collective the validation pipeline depends on.
    class ProcessGroup {
    public:
        virtual ~ProcessGroup() = default;

        [[nodiscard]] virtual std::size_t rank() const = 0;
        [[nodiscard]] virtual std::size_t world_size() const = 0;

        // Blocks until every participant has contributed. Returns [world_size, ...] on the caller's device.
        [[nodiscard]] virtual torch::Tensor all_gather(const torch::Tensor& local) = 0;

        virtual void barrier() = 0;

        // Releases peers blocked in a collective after this participant failed.
        virtual void abort(const std::string& reason) { (void)reason; }
    };

    using ProcessGroupPtr = std::shared_ptr<ProcessGroup>;

    class SingleProcessGroup final : public ProcessGroup {
    public:
        [[nodiscard]] std::size_t rank() const override { return 0; }
        [[nodiscard]] std::size_t world_size() const override { return 1; }

        [[nodiscard]] torch::Tensor all_gather(const torch::Tensor& local) override {
            if (!local.defined()) {
                throw std::invalid_argument("all_gather requires a defined tensor.");
            }
            return local.detach().clone().unsqueeze(0);
        }

        void barrier() override {}
    };

    [[nodiscard]] inline bool is_reporting_rank(const ProcessGroup& group) { return group.rank() == 0; }
}

#endif // FLOWBENCH_DISTRIBUTED_GROUP_HPP
