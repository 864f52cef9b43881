#ifndef FLOWBENCH_MODEL_NSFP_HPP
#define FLOWBENCH_MODEL_NSFP_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

#include "../../common/save_load.hpp"
#include "../../optimizer/details/adam.hpp"
#include "flow_model.hpp"

namespace Flowbench::Model::Details {
    struct NSFPOptions {
        PointCloudRange point_cloud_range{kDefaultPointCloudRange};
        std::size_t hidden_units{128};
        std::size_t hidden_layers{8};
        std::size_t iterations{500};
        std::size_t early_stopping_patience{50};
        double early_stopping_min_delta{1e-4};
        double learning_rate{8e-3};
        std::uint64_t seed{0};
    };

    namespace detail {
        inline torch::nn::Sequential make_prior(std::size_t hidden_units, std::size_t hidden_layers) {
            torch::nn::Sequential prior;
            auto width = static_cast<std::int64_t>(hidden_units);
            prior->push_back(torch::nn::Linear(3, width));
            prior->push_back(torch::nn::ReLU());
            for (std::size_t layer = 1; layer < hidden_layers; ++layer) {
                prior->push_back(torch::nn::Linear(width, width));
                prior->push_back(torch::nn::ReLU());
            }
            prior->push_back(torch::nn::Linear(width, 3));
            return prior;
        }

        // Default Linear init, U(-1/sqrt(fan_in), 1/sqrt(fan_in)), drawn from a private generator so
        // concurrent workers and the process-wide seed do not interfere.
        inline void initialise_prior(torch::nn::Sequential& prior, std::uint64_t seed) {
            auto generator = at::make_generator<at::CPUGeneratorImpl>(seed);
            torch::NoGradGuard no_grad;
            for (const auto& child : prior->children()) {
                auto* linear = child->as<torch::nn::Linear>();
                if (linear == nullptr) {
                    continue;
                }
                const auto bound = 1.0 / std::sqrt(static_cast<double>(linear->options.in_features()));
                linear->weight.uniform_(-bound, bound, generator);
                linear->bias.uniform_(-bound, bound, generator);
            }
        }
    }

    // Neural scene flow prior: a fresh coordinate MLP is fit to every frame pair at inference
    // time by minimising the Chamfer distance between the warped source and the target.
    class NSFP final : public FlowModel {
    public:
        explicit NSFP(const NSFPOptions& options = {}) : FlowModel(options.point_cloud_range), options_(options) {
            if (options_.hidden_layers == 0 || options_.hidden_units == 0) {
                throw std::invalid_argument("NSFP requires at least one hidden layer with a positive width.");
            }
            if (options_.iterations == 0) {
                throw std::invalid_argument("NSFP requires at least one optimisation iteration.");
            }
        }

        [[nodiscard]] bool trainable() const override { return false; }
        [[nodiscard]] std::string name() const override { return "NSFP"; }
        [[nodiscard]] const NSFPOptions& options() const noexcept { return options_; }

        // Iterations run by the last predict() call.
        [[nodiscard]] std::size_t last_iterations() const noexcept { return last_iterations_; }

    protected:
        [[nodiscard]] torch::Tensor predict(const FramePair& pair, const PropertyTree& args) override {
            const auto iterations = Common::SaveLoad::Detail::get_numeric_or<std::size_t>(
                args, "iterations", options_.iterations, "forward_args");
            const auto patience = Common::SaveLoad::Detail::get_numeric_or<std::size_t>(
                args, "early_stopping_patience", options_.early_stopping_patience, "forward_args");

            if (pair.source.size(0) == 0 || pair.target.size(0) == 0) {
                last_iterations_ = 0;
                return torch::zeros_like(pair.source);
            }

            torch::AutoGradMode enable_grad(true);
            auto prior = detail::make_prior(options_.hidden_units, options_.hidden_layers);
            detail::initialise_prior(prior, options_.seed);
            prior->to(pair.source.device());
            Optimizer::Details::AdamOptions adam{};
            adam.learning_rate = options_.learning_rate;
            auto optimizer = Optimizer::Details::make_adam(prior->parameters(), adam);

            const auto source = pair.source.detach();
            const auto target = pair.target.detach();
            double best_loss = std::numeric_limits<double>::infinity();
            torch::Tensor best_flow = torch::zeros_like(source);
            std::size_t since_best = 0;
            last_iterations_ = 0;

            for (std::size_t step = 0; step < iterations; ++step) {
                optimizer->zero_grad();
                auto flow = prior->forward(source);
                auto loss = chamfer_distance(source + flow, target);
                loss.backward();
                optimizer->step();
                ++last_iterations_;

                const auto value = loss.item<double>();
                if (value < best_loss - options_.early_stopping_min_delta) {
                    best_loss = value;
                    best_flow = flow.detach().clone();
                    since_best = 0;
                } else if (++since_best >= patience) {
                    break;
                }
            }
            return best_flow;
        }

    private:
        NSFPOptions options_;
        std::size_t last_iterations_{0};
    };
}

#endif // FLOWBENCH_MODEL_NSFP_HPP
