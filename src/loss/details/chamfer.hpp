#ifndef FLOWBENCH_LOSS_CHAMFER_HPP
#define FLOWBENCH_LOSS_CHAMFER_HPP

#include <string>
#include <vector>

#include <torch/torch.h>

#include "loss_function.hpp"
#include "reduction.hpp"

namespace Flowbench::Loss::Details {
    struct ChamferOptions {
        Reduction reduction{Reduction::Mean};
    };

    // Self-supervised: warped source frame against the target frame. Needs no labels.
    class Chamfer final : public LossFunction {
    public:
        explicit Chamfer(const ChamferOptions& options = {}) : options_(options) {}

        [[nodiscard]] LossTerms operator()(const Data::Details::Batch& batch, const Model::Details::FlowOutput& output) const override {
            require_aligned(batch, output);
            std::vector<torch::Tensor> per_sample;
            per_sample.reserve(batch.size());
            for (std::size_t i = 0; i < batch.size(); ++i) {
                const auto& sample = batch.samples[i];
                const auto length = sample.sequence_length();
                if (length < 2) {
                    throw ShapeMismatch("Chamfer loss needs at least two frames per sample.");
                }
                const auto& flow = output.flow[i];
                const auto source = sample.pc_array_stack[length - 2]
                                        .index_select(0, output.pc0_valid_point_idxes[i].to(sample.pc_array_stack[length - 2].device()))
                                        .to(flow.device(), flow.scalar_type());
                const auto target = sample.pc_array_stack[length - 1]
                                        .index_select(0, output.pc1_valid_point_idxes[i].to(sample.pc_array_stack[length - 1].device()))
                                        .to(flow.device(), flow.scalar_type());
                if (flow.sizes() != source.sizes()) {
                    throw ShapeMismatch("Predicted flow does not match the valid source points.");
                }
                per_sample.push_back(Model::Details::chamfer_distance(source + flow, target));
            }
            auto loss = apply_reduction(per_sample, options_.reduction);
            return {{"loss", loss}, {"chamfer", loss.detach()}};
        }

        [[nodiscard]] std::string name() const override { return "Chamfer"; }

    private:
        ChamferOptions options_;
    };
}

#endif // FLOWBENCH_LOSS_CHAMFER_HPP
