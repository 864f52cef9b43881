#ifndef FLOWBENCH_LOSS_REDUCTION_HPP
#define FLOWBENCH_LOSS_REDUCTION_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Flowbench::Loss::Details {

    enum class Reduction { Mean, Sum };

    inline Reduction reduction_from_string(const std::string& name) {
        if (name == "mean") {
            return Reduction::Mean;
        }
        if (name == "sum") {
            return Reduction::Sum;
        }
        throw std::invalid_argument("Unknown loss reduction '" + name + "' (expected 'mean' or 'sum').");
    }

    // Reduces the per-sample terms of a batch to one scalar.
    inline torch::Tensor apply_reduction(const std::vector<torch::Tensor>& per_sample, Reduction reduction) {
        if (per_sample.empty()) {
            throw std::invalid_argument("Cannot reduce a loss over an empty batch.");
        }
        auto stacked = torch::stack(per_sample);
        switch (reduction) {
            case Reduction::Sum:
                return stacked.sum();
            case Reduction::Mean:
            default:
                return stacked.mean();
        }
    }

}

#endif // FLOWBENCH_LOSS_REDUCTION_HPP
