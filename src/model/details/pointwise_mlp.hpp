#ifndef FLOWBENCH_MODEL_POINTWISE_MLP_HPP
#define FLOWBENCH_MODEL_POINTWISE_MLP_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>

#include <torch/torch.h>

#include "flow_model.hpp"

namespace Flowbench::Model::Details {
    struct PointwiseMLPOptions {
        PointCloudRange point_cloud_range{kDefaultPointCloudRange};
        std::size_t hidden_units{64};
        std::size_t hidden_layers{3};
    };

    // Trainable per-point regressor. Input per source point: its position and the offset to its
    // nearest target point. The network predicts a residual on top of that offset.
    class PointwiseMLP final : public FlowModel {
    public:
        explicit PointwiseMLP(const PointwiseMLPOptions& options = {}) : FlowModel(options.point_cloud_range), options_(options) {
            if (options_.hidden_layers == 0 || options_.hidden_units == 0) {
                throw std::invalid_argument("PointwiseMLP requires at least one hidden layer with a positive width.");
            }
            const auto width = static_cast<std::int64_t>(options_.hidden_units);
            torch::nn::Sequential body;
            body->push_back(torch::nn::Linear(6, width));
            body->push_back(torch::nn::ReLU());
            for (std::size_t layer = 1; layer < options_.hidden_layers; ++layer) {
                body->push_back(torch::nn::Linear(width, width));
                body->push_back(torch::nn::ReLU());
            }
            body->push_back(torch::nn::Linear(width, 3));
            body_ = register_module("body", body);
        }

        [[nodiscard]] bool trainable() const override { return true; }
        [[nodiscard]] std::string name() const override { return "PointwiseMLP"; }

    protected:
        [[nodiscard]] torch::Tensor predict(const FramePair& pair, const PropertyTree&) override {
            const auto& source = pair.source;
            if (source.size(0) == 0) {
                return torch::zeros_like(source);
            }
            torch::Tensor offset = torch::zeros_like(source);
            if (pair.target.size(0) > 0) {
                torch::NoGradGuard no_grad;
                const auto distances = torch::cdist(source.unsqueeze(0), pair.target.unsqueeze(0)).squeeze(0);
                const auto nearest = std::get<1>(distances.min(1));
                offset = pair.target.index_select(0, nearest) - source;
            }
            const auto device = parameters().front().device();
            auto features = torch::cat({source, offset}, 1).to(device);
            return (offset.to(device) + body_->forward(features)).to(source.device());
        }

    private:
        PointwiseMLPOptions options_;
        torch::nn::Sequential body_{nullptr};
    };
}

#endif // FLOWBENCH_MODEL_POINTWISE_MLP_HPP
