#ifndef FLOWBENCH_OPTIMIZER_HPP
#define FLOWBENCH_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/adam.hpp"

namespace Flowbench::Optimizer {
    using AdamOptions = Details::AdamOptions;

    [[nodiscard]] inline auto Adam(std::vector<torch::Tensor> parameters, const AdamOptions& options = {})
        -> std::unique_ptr<torch::optim::Adam> {
        return Details::make_adam(std::move(parameters), options);
    }
}

#endif // FLOWBENCH_OPTIMIZER_HPP
