#ifndef FLOWBENCH_LOSS_HPP
#define FLOWBENCH_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <string>

#include "../common/registry.hpp"
#include "../common/save_load.hpp"
#include "details/chamfer.hpp"
#include "details/loss_function.hpp"
#include "details/reduction.hpp"
#include "details/supervised_epe.hpp"

namespace Flowbench::Loss {
    using Reduction = Details::Reduction;
    using LossTerms = Details::LossTerms;
    using LossFunction = Details::LossFunction;
    using LossFunctionPtr = Details::LossFunctionPtr;
    using Chamfer = Details::Chamfer;
    using ChamferOptions = Details::ChamferOptions;
    using SupervisedEPE = Details::SupervisedEPE;
    using SupervisedEPEOptions = Details::SupervisedEPEOptions;

    using LossRegistry = Common::Registry<LossFunctionPtr(const Common::SaveLoad::PropertyTree&)>;

    [[nodiscard]] inline auto Losses() -> const LossRegistry& {
        static const LossRegistry registry = [] {
            LossRegistry table{"loss"};
            table.add("Chamfer", [](const Common::SaveLoad::PropertyTree& args) -> LossFunctionPtr {
                ChamferOptions options{};
                options.reduction = Details::reduction_from_string(args.get<std::string>("reduction", "mean"));
                return std::make_shared<Chamfer>(options);
            });
            table.add("SupervisedEPE", [](const Common::SaveLoad::PropertyTree& args) -> LossFunctionPtr {
                SupervisedEPEOptions options{};
                options.reduction = Details::reduction_from_string(args.get<std::string>("reduction", "mean"));
                options.background_weight = Common::SaveLoad::Detail::get_numeric_or<double>(
                    args, "background_weight", options.background_weight, "loss_fn.args");
                return std::make_shared<SupervisedEPE>(options);
            });
            return table;
        }();
        return registry;
    }
}

#endif // FLOWBENCH_LOSS_HPP
