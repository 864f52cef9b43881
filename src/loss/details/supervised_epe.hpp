#ifndef FLOWBENCH_LOSS_SUPERVISED_EPE_HPP
#define FLOWBENCH_LOSS_SUPERVISED_EPE_HPP

#include <string>
#include <vector>

#include <torch/torch.h>

#include "loss_function.hpp"
#include "reduction.hpp"

namespace Flowbench::Loss::Details {
    struct SupervisedEPEOptions {
        Reduction reduction{Reduction::Mean};
        double background_weight{1.0};  // weight of points whose category is -1
    };

    // Mean endpoint error against ground-truth flow (flowed_pc - pc on the source frame).
    class SupervisedEPE final : public LossFunction {
    public:
        explicit SupervisedEPE(const SupervisedEPEOptions& options = {}) : options_(options) {}

        [[nodiscard]] LossTerms operator()(const Data::Details::Batch& batch, const Model::Details::FlowOutput& output) const override {
            require_aligned(batch, output);
            std::vector<torch::Tensor> per_sample;
            per_sample.reserve(batch.size());
            for (std::size_t i = 0; i < batch.size(); ++i) {
                const auto& sample = batch.samples[i];
                const auto length = sample.sequence_length();
                if (length < 2) {
                    throw ShapeMismatch("Supervised EPE loss needs at least two frames per sample.");
                }
                const auto source_index = length - 2;
                const auto& flowed = sample.flowed_pc_array_stack[source_index];
                if (!flowed.defined()) {
                    throw ShapeMismatch("Supervised EPE loss needs ground-truth flowed points for the source frame.");
                }
                const auto& flow = output.flow[i];
                const auto valid = output.pc0_valid_point_idxes[i].to(flowed.device());
                const auto points = sample.pc_array_stack[source_index].index_select(0, valid);
                const auto ground_truth = (flowed.index_select(0, valid) - points).to(flow.device(), flow.scalar_type());
                if (flow.sizes() != ground_truth.sizes()) {
                    throw ShapeMismatch("Predicted flow does not match the valid source points.");
                }
                if (flow.size(0) == 0) {
                    per_sample.push_back(torch::scalar_tensor(0.0, flow.options()));
                    continue;
                }
                auto error = (flow - ground_truth).norm(2, 1);
                const auto& classes = sample.pc_class_mask_stack[source_index];
                if (options_.background_weight != 1.0 && classes.defined()) {
                    auto background = classes.index_select(0, valid.to(classes.device())).eq(-1).to(flow.device());
                    auto weights = torch::where(background,
                                                torch::full_like(error, options_.background_weight),
                                                torch::ones_like(error));
                    per_sample.push_back((error * weights).sum() / weights.sum().clamp_min(1e-12));
                } else {
                    per_sample.push_back(error.mean());
                }
            }
            auto loss = apply_reduction(per_sample, options_.reduction);
            return {{"loss", loss}, {"epe", loss.detach()}};
        }

        [[nodiscard]] std::string name() const override { return "SupervisedEPE"; }

    private:
        SupervisedEPEOptions options_;
    };
}

#endif // FLOWBENCH_LOSS_SUPERVISED_EPE_HPP
