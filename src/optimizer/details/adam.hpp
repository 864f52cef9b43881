#ifndef FLOWBENCH_OPTIMIZER_ADAM_HPP
#define FLOWBENCH_OPTIMIZER_ADAM_HPP

#include <memory>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Flowbench::Optimizer::Details {
    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        if (!(options.learning_rate > 0.0)) {
            throw std::invalid_argument("Adam learning rate must be positive.");
        }
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    inline std::unique_ptr<torch::optim::Adam> make_adam(std::vector<torch::Tensor> parameters, const AdamOptions& options) {
        return std::make_unique<torch::optim::Adam>(std::move(parameters), to_torch_options(options));
    }
}

#endif // FLOWBENCH_OPTIMIZER_ADAM_HPP
