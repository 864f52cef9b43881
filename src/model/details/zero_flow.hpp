#ifndef FLOWBENCH_MODEL_ZERO_FLOW_HPP
#define FLOWBENCH_MODEL_ZERO_FLOW_HPP

#include <string>

#include <torch/torch.h>

#include "flow_model.hpp"

namespace Flowbench::Model::Details {
    struct ZeroFlowOptions {
        PointCloudRange point_cloud_range{kDefaultPointCloudRange};
    };

    // Predicts no motion. Every point's error equals its ground-truth displacement.
    class ZeroFlow final : public FlowModel {
    public:
        explicit ZeroFlow(const ZeroFlowOptions& options = {}) : FlowModel(options.point_cloud_range) {}

        [[nodiscard]] bool trainable() const override { return false; }
        [[nodiscard]] std::string name() const override { return "ZeroFlow"; }

    protected:
        [[nodiscard]] torch::Tensor predict(const FramePair& pair, const PropertyTree&) override {
            return torch::zeros_like(pair.source);
        }
    };
}

#endif // FLOWBENCH_MODEL_ZERO_FLOW_HPP
