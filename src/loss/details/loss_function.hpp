#ifndef FLOWBENCH_LOSS_FUNCTION_HPP
#define FLOWBENCH_LOSS_FUNCTION_HPP

#include <map>
#include <memory>
#include <sstream>
#include <string>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../data/details/batch.hpp"
#include "../../model/details/flow_model.hpp"

namespace Flowbench::Loss::Details {
    // Named scalar terms. "loss" is the one that is backpropagated.
    using LossTerms = std::map<std::string, torch::Tensor>;

    class LossFunction {
    public:
        virtual ~LossFunction() = default;

        [[nodiscard]] virtual LossTerms operator()(const Data::Details::Batch& batch, const Model::Details::FlowOutput& output) const = 0;
        [[nodiscard]] virtual std::string name() const = 0;
    };

    using LossFunctionPtr = std::shared_ptr<const LossFunction>;

    inline void require_aligned(const Data::Details::Batch& batch, const Model::Details::FlowOutput& output) {
        if (batch.size() != output.size() || output.pc0_valid_point_idxes.size() != output.size()
            || output.pc1_valid_point_idxes.size() != output.size()) {
            std::ostringstream message;
            message << "Model output covers " << output.size() << " samples but the batch holds " << batch.size() << '.';
            throw ShapeMismatch(message.str());
        }
    }
}

#endif // FLOWBENCH_LOSS_FUNCTION_HPP
