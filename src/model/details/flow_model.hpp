#ifndef FLOWBENCH_MODEL_FLOW_MODEL_HPP
#define FLOWBENCH_MODEL_FLOW_MODEL_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../common/save_load.hpp"
#include "../../data/details/batch.hpp"

namespace Flowbench::Model::Details {
    using PropertyTree = Common::SaveLoad::PropertyTree;

    // Per-sample predictions for the last frame pair of each sequence in the batch.
    struct FlowOutput {
        std::vector<torch::Tensor> flow{};                   // [M_i, 3], one row per valid source point
        std::vector<torch::Tensor> pc0_valid_point_idxes{};  // [M_i] int64 into pc[-2]
        std::vector<torch::Tensor> pc1_valid_point_idxes{};  // [K_i] int64 into pc[-1]
        double batch_delta_time{0.0};                        // seconds spent in forward for the whole batch

        [[nodiscard]] std::size_t size() const noexcept { return flow.size(); }
    };

    // xmin, ymin, zmin, xmax, ymax, zmax
    using PointCloudRange = std::array<double, 6>;

    inline constexpr PointCloudRange kDefaultPointCloudRange{-51.2, -51.2, -3.0, 51.2, 51.2, 3.0};

    inline PointCloudRange point_cloud_range_from_tree(const PropertyTree& args, const std::string& context) {
        const auto node = args.get_child_optional("point_cloud_range");
        if (!node) {
            return kDefaultPointCloudRange;
        }
        const auto values = Common::SaveLoad::Detail::read_array<double>(*node, context + ".point_cloud_range");
        if (values.size() != 6) {
            std::ostringstream message;
            message << context << ".point_cloud_range needs 6 values, got " << values.size() << '.';
            throw std::runtime_error(message.str());
        }
        PointCloudRange range{};
        for (std::size_t i = 0; i < 6; ++i) {
            range[i] = values[i];
            if (i >= 3 && !(range[i] > range[i - 3])) {
                throw std::runtime_error(context + ".point_cloud_range has an empty extent.");
            }
        }
        return range;
    }

    // Indices of points inside the half-open box [min, max).
    [[nodiscard]] inline torch::Tensor points_in_range(const torch::Tensor& points, const PointCloudRange& range) {
        if (points.dim() != 2 || points.size(1) != 3) {
            throw ShapeMismatch("Range filtering expects points of shape [N, 3].");
        }
        auto mask = torch::ones({points.size(0)}, torch::TensorOptions().dtype(torch::kBool).device(points.device()));
        for (std::int64_t axis = 0; axis < 3; ++axis) {
            const auto column = points.select(1, axis);
            mask = mask.logical_and(column.ge(range[axis])).logical_and(column.lt(range[axis + 3]));
        }
        return torch::nonzero(mask).squeeze(1);
    }

    struct FramePair {
        torch::Tensor source{};        // pc[-2][valid0]
        torch::Tensor target{};        // pc[-1][valid1]
        torch::Tensor source_valid{};  // valid0
        torch::Tensor target_valid{};  // valid1
    };

    [[nodiscard]] inline FramePair last_frame_pair(const Data::Details::SceneFlowSample& sample, const PointCloudRange& range) {
        const auto length = sample.sequence_length();
        if (length < 2) {
            throw ShapeMismatch("Scene flow models need at least two frames, got " + std::to_string(length) + ".");
        }
        FramePair pair{};
        const auto& pc0 = sample.pc_array_stack[length - 2];
        const auto& pc1 = sample.pc_array_stack[length - 1];
        pair.source_valid = points_in_range(pc0, range);
        pair.target_valid = points_in_range(pc1, range);
        pair.source = pc0.index_select(0, pair.source_valid).to(torch::kFloat32);
        pair.target = pc1.index_select(0, pair.target_valid).to(torch::kFloat32);
        return pair;
    }

    class FlowModel : public torch::nn::Module {
    public:
        explicit FlowModel(PointCloudRange range) : range_(range) {}
        ~FlowModel() override = default;

        [[nodiscard]] virtual bool trainable() const = 0;
        [[nodiscard]] virtual std::string name() const = 0;

        // Times the per-sample work and fills batch_delta_time.
        [[nodiscard]] FlowOutput forward(const Data::Details::Batch& batch, const PropertyTree& args) {
            FlowOutput output{};
            const auto start = std::chrono::steady_clock::now();
            for (const auto& sample : batch.samples) {
                const auto pair = last_frame_pair(sample, range_);
                output.flow.push_back(predict(pair, args));
                output.pc0_valid_point_idxes.push_back(pair.source_valid);
                output.pc1_valid_point_idxes.push_back(pair.target_valid);
            }
            const auto stop = std::chrono::steady_clock::now();
            output.batch_delta_time = std::chrono::duration<double>(stop - start).count();
            return output;
        }

        [[nodiscard]] const PointCloudRange& point_cloud_range() const noexcept { return range_; }

    protected:
        // Flow for every point of pair.source, shape [M, 3].
        [[nodiscard]] virtual torch::Tensor predict(const FramePair& pair, const PropertyTree& args) = 0;

    private:
        PointCloudRange range_;
    };

    using FlowModelPtr = std::shared_ptr<FlowModel>;

    // Symmetric Chamfer distance between [N, 3] and [M, 3], mean of squared nearest distances.
    [[nodiscard]] inline torch::Tensor chamfer_distance(const torch::Tensor& lhs, const torch::Tensor& rhs) {
        if (lhs.size(0) == 0 || rhs.size(0) == 0) {
            return torch::scalar_tensor(0.0, lhs.options());
        }
        const auto distances = torch::cdist(lhs.unsqueeze(0), rhs.unsqueeze(0)).squeeze(0).pow(2);
        const auto forward = std::get<0>(distances.min(1)).mean();
        const auto backward = std::get<0>(distances.min(0)).mean();
        return forward + backward;
    }
}

#endif // FLOWBENCH_MODEL_FLOW_MODEL_HPP
