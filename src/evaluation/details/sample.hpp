#ifndef FLOWBENCH_EVALUATION_SAMPLE_HPP
#define FLOWBENCH_EVALUATION_SAMPLE_HPP

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../data/details/batch.hpp"
#include "../../metric/details/accumulator.hpp"

namespace Flowbench::Evaluation::Details::Sample {
    namespace detail {
        inline std::string shape_string(const torch::Tensor& tensor) {
            if (!tensor.defined()) {
                return "(undefined)";
            }
            std::ostringstream stream;
            stream << tensor.sizes();
            return stream.str();
        }

        inline void require_points(const torch::Tensor& tensor, const char* what) {
            if (!tensor.defined() || tensor.dim() != 2 || tensor.size(1) != 3) {
                throw ShapeMismatch(std::string(what) + " must have shape [N, 3], got " + shape_string(tensor) + ".");
            }
        }
    }

    // 0 for points whose XY L-infinity distance is within the threshold, 1 otherwise.
    [[nodiscard]] inline torch::Tensor proximity_index(const torch::Tensor& points, double close_threshold_meters) {
        detail::require_points(points, "Point array");
        auto xy = points.narrow(1, 0, 2).to(torch::kFloat64);
        auto distance = std::get<0>(xy.abs().max(1));
        auto is_close = distance <= close_threshold_meters;
        return torch::logical_not(is_close).to(torch::kInt64);
    }

    [[nodiscard]] inline torch::Tensor endpoint_error(const torch::Tensor& regressed_flow, const torch::Tensor& gt_flow) {
        return (regressed_flow.to(torch::kFloat64) - gt_flow.to(torch::kFloat64)).norm(2, {1});
    }

    [[nodiscard]] inline torch::Tensor ground_truth_speed(const torch::Tensor& gt_flow, double per_frame_to_per_second) {
        return gt_flow.to(torch::kFloat64).norm(2, {1}) * per_frame_to_per_second;
    }

    // All points belong to class_id.
    inline void accumulate_class_error(Metric::Details::BucketedErrorAccumulator& accumulator,
                                       const torch::Tensor& points,
                                       std::int64_t class_id,
                                       const torch::Tensor& regressed_flow,
                                       const torch::Tensor& gt_flow) {
        detail::require_points(points, "Point array");
        detail::require_points(regressed_flow, "Regressed flow");
        detail::require_points(gt_flow, "Ground truth flow");
        if (regressed_flow.sizes() != gt_flow.sizes()) {
            throw ShapeMismatch("Shapes do not match: regressed flow " + detail::shape_string(regressed_flow)
                                + " vs ground truth flow " + detail::shape_string(gt_flow) + ".");
        }
        if (regressed_flow.size(0) != points.size(0)) {
            throw ShapeMismatch("Shapes do not match: flow " + detail::shape_string(regressed_flow) + " vs points "
                                + detail::shape_string(points) + ".");
        }

        const auto& options = accumulator.options();
        auto proximity = proximity_index(points, options.close_object_threshold_meters);
        auto errors = endpoint_error(regressed_flow, gt_flow);
        auto speeds = ground_truth_speed(gt_flow, options.per_frame_to_per_second_scale_factor);
        accumulator.update(proximity, class_id, speeds, errors);
    }

    // Splits the frame by category id and dispatches one batched update per category.
    inline void accumulate_sample(Metric::Details::BucketedErrorAccumulator& accumulator,
                                  const torch::Tensor& points,
                                  const torch::Tensor& regressed_flow,
                                  const torch::Tensor& gt_flow,
                                  const torch::Tensor& class_ids) {
        detail::require_points(points, "Point array");
        if (!class_ids.defined() || class_ids.dim() != 1 || class_ids.size(0) != points.size(0)) {
            throw ShapeMismatch("Class ids " + detail::shape_string(class_ids) + " do not match points "
                                + detail::shape_string(points) + ".");
        }
        if (!regressed_flow.defined() || regressed_flow.sizes() != points.sizes()) {
            throw ShapeMismatch("The input pc and output flow are not the same shape. " + detail::shape_string(points)
                                + " != " + detail::shape_string(regressed_flow));
        }
        if (!gt_flow.defined() || gt_flow.sizes() != points.sizes()) {
            throw ShapeMismatch("The input pc and ground truth flow are not the same shape. " + detail::shape_string(points)
                                + " != " + detail::shape_string(gt_flow));
        }

        auto ids = class_ids.to(torch::kInt64);
        auto unique_ids = std::get<0>(torch::_unique(ids, /*sorted=*/true)).to(torch::kCPU);
        const auto* id_ptr = unique_ids.data_ptr<std::int64_t>();
        for (std::int64_t i = 0; i < unique_ids.numel(); ++i) {
            const auto class_id = id_ptr[i];
            auto mask = ids == class_id;
            accumulate_class_error(accumulator,
                                   points.index({mask}),
                                   class_id,
                                   regressed_flow.index({mask}),
                                   gt_flow.index({mask}));
        }
    }

    // Evaluates only the last frame pair of the sequence: frame N-1 is the source, N the target.
    inline void accumulate_sequence(Metric::Details::BucketedErrorAccumulator& accumulator,
                                    const Data::Details::SceneFlowSample& sample,
                                    const torch::Tensor& regressed_flow,
                                    const torch::Tensor& pc0_valid_point_idxes,
                                    const torch::Tensor& pc1_valid_point_idxes) {
        sample.validate();
        const auto length = sample.sequence_length();
        if (length < 2) {
            throw ShapeMismatch("Scene flow evaluation requires at least two frames, got " + std::to_string(length) + ".");
        }
        const auto source = length - 2;
        const auto& flowed = sample.flowed_pc_array_stack[source];
        const auto& classes = sample.pc_class_mask_stack[source];
        if (!flowed.defined() || !classes.defined()) {
            throw ShapeMismatch("Labelled evaluation requires ground truth flow and class masks for the source frame.");
        }

        if (!pc0_valid_point_idxes.defined() || pc0_valid_point_idxes.dim() != 1) {
            throw ShapeMismatch("Source frame valid point indices must have shape [M], got "
                                + detail::shape_string(pc0_valid_point_idxes) + ".");
        }
        if (pc1_valid_point_idxes.defined() && pc1_valid_point_idxes.dim() != 1) {
            throw ShapeMismatch("Target frame valid point indices must have shape [K], got "
                                + detail::shape_string(pc1_valid_point_idxes) + ".");
        }
        auto valid0 = pc0_valid_point_idxes.to(sample.pc_array_stack[source].device(), torch::kInt64);
        auto pc0_pc = sample.pc_array_stack[source].index_select(0, valid0);
        auto ground_truth_flowed_pc0_to_pc1 = flowed.index_select(0, valid0);
        auto pc0_pc_class_info = classes.index_select(0, valid0);
        auto ground_truth_flow = ground_truth_flowed_pc0_to_pc1 - pc0_pc;

        if (pc1_valid_point_idxes.defined()) {
            const auto target_points = sample.pc_array_stack[length - 1].size(0);
            if (pc1_valid_point_idxes.numel() > 0
                && pc1_valid_point_idxes.max().item<std::int64_t>() >= target_points) {
                throw ShapeMismatch("Target frame valid point indices exceed the target frame size.");
            }
        }

        accumulate_sample(accumulator, pc0_pc, regressed_flow.to(pc0_pc.device()), ground_truth_flow, pc0_pc_class_info);
    }
}

#endif // FLOWBENCH_EVALUATION_SAMPLE_HPP
