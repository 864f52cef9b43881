#ifndef FLOWBENCH_DATA_BATCH_HPP
#define FLOWBENCH_DATA_BATCH_HPP

#include <cstddef>
#include <sstream>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"

namespace Flowbench::Data::Details {
    // One sequence of LiDAR sweeps. Timestep t holds N_t points.
    struct SceneFlowSample {
        std::vector<torch::Tensor> pc_array_stack{};         // [N_t, 3] float
        std::vector<torch::Tensor> flowed_pc_array_stack{};  // [N_t, 3] float, points moved by ground-truth flow t -> t+1
        std::vector<torch::Tensor> pc_class_mask_stack{};    // [N_t] int64 category ids

        [[nodiscard]] std::size_t sequence_length() const noexcept { return pc_array_stack.size(); }

        [[nodiscard]] SceneFlowSample to(const torch::Device& device) const {
            SceneFlowSample moved{};
            auto move_all = [&](const std::vector<torch::Tensor>& source, std::vector<torch::Tensor>& target) {
                target.reserve(source.size());
                for (const auto& tensor : source) {
                    target.push_back(tensor.defined() ? tensor.to(device) : tensor);
                }
            };
            move_all(pc_array_stack, moved.pc_array_stack);
            move_all(flowed_pc_array_stack, moved.flowed_pc_array_stack);
            move_all(pc_class_mask_stack, moved.pc_class_mask_stack);
            return moved;
        }

        void validate() const {
            const auto length = pc_array_stack.size();
            if (flowed_pc_array_stack.size() != length || pc_class_mask_stack.size() != length) {
                std::ostringstream message;
                message << "Sample stacks disagree on sequence length (points " << length << ", flowed "
                        << flowed_pc_array_stack.size() << ", classes " << pc_class_mask_stack.size() << ").";
                throw ShapeMismatch(message.str());
            }
            for (std::size_t t = 0; t < length; ++t) {
                const auto& points = pc_array_stack[t];
                if (!points.defined() || points.dim() != 2 || points.size(1) != 3) {
                    throw ShapeMismatch("Timestep " + std::to_string(t) + " point array must have shape [N, 3].");
                }
                const auto& flowed = flowed_pc_array_stack[t];
                if (flowed.defined() && flowed.sizes() != points.sizes()) {
                    throw ShapeMismatch("Timestep " + std::to_string(t) + " flowed point array does not match the point array.");
                }
                const auto& classes = pc_class_mask_stack[t];
                if (classes.defined() && (classes.dim() != 1 || classes.size(0) != points.size(0))) {
                    throw ShapeMismatch("Timestep " + std::to_string(t) + " class mask must have one id per point.");
                }
            }
        }
    };

    struct Batch {
        std::vector<SceneFlowSample> samples{};

        [[nodiscard]] std::size_t size() const noexcept { return samples.size(); }
        [[nodiscard]] bool empty() const noexcept { return samples.empty(); }

        [[nodiscard]] Batch to(const torch::Device& device) const {
            Batch moved{};
            moved.samples.reserve(samples.size());
            for (const auto& sample : samples) {
                moved.samples.push_back(sample.to(device));
            }
            return moved;
        }
    };

    // Point counts differ between samples, so collation keeps a list instead of stacking.
    [[nodiscard]] inline Batch collate(std::vector<SceneFlowSample> samples) {
        Batch batch{};
        batch.samples = std::move(samples);
        return batch;
    }
}

#endif // FLOWBENCH_DATA_BATCH_HPP
