#ifndef FLOWBENCH_MODEL_HPP
#define FLOWBENCH_MODEL_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <string>

#include "../common/registry.hpp"
#include "../common/save_load.hpp"
#include "details/flow_model.hpp"
#include "details/nsfp.hpp"
#include "details/pointwise_mlp.hpp"
#include "details/zero_flow.hpp"

namespace Flowbench::Model {
    using FlowOutput = Details::FlowOutput;
    using FlowModel = Details::FlowModel;
    using FlowModelPtr = Details::FlowModelPtr;
    using PointCloudRange = Details::PointCloudRange;
    using ZeroFlow = Details::ZeroFlow;
    using ZeroFlowOptions = Details::ZeroFlowOptions;
    using NSFP = Details::NSFP;
    using NSFPOptions = Details::NSFPOptions;
    using PointwiseMLP = Details::PointwiseMLP;
    using PointwiseMLPOptions = Details::PointwiseMLPOptions;

    using Details::chamfer_distance;
    using Details::points_in_range;

    using ModelRegistry = Common::Registry<FlowModelPtr(const Common::SaveLoad::PropertyTree&)>;

    [[nodiscard]] inline auto Models() -> const ModelRegistry& {
        namespace SL = Common::SaveLoad::Detail;
        static const ModelRegistry registry = [] {
            ModelRegistry table{"model"};
            table.add("ZeroFlow", [](const Common::SaveLoad::PropertyTree& args) -> FlowModelPtr {
                ZeroFlowOptions options{};
                options.point_cloud_range = Details::point_cloud_range_from_tree(args, "model.args");
                return std::make_shared<ZeroFlow>(options);
            });
            table.add("NSFP", [](const Common::SaveLoad::PropertyTree& args) -> FlowModelPtr {
                const std::string context{"model.args"};
                NSFPOptions options{};
                options.point_cloud_range = Details::point_cloud_range_from_tree(args, context);
                options.hidden_units = SL::get_numeric_or<std::size_t>(args, "hidden_units", options.hidden_units, context);
                options.hidden_layers = SL::get_numeric_or<std::size_t>(args, "hidden_layers", options.hidden_layers, context);
                options.iterations = SL::get_numeric_or<std::size_t>(args, "iterations", options.iterations, context);
                options.early_stopping_patience = SL::get_numeric_or<std::size_t>(args, "early_stopping_patience", options.early_stopping_patience, context);
                options.early_stopping_min_delta = SL::get_numeric_or<double>(args, "early_stopping_min_delta", options.early_stopping_min_delta, context);
                options.learning_rate = SL::get_numeric_or<double>(args, "learning_rate", options.learning_rate, context);
                options.seed = SL::get_numeric_or<std::uint64_t>(args, "seed", options.seed, context);
                return std::make_shared<NSFP>(options);
            });
            table.add("PointwiseMLP", [](const Common::SaveLoad::PropertyTree& args) -> FlowModelPtr {
                const std::string context{"model.args"};
                PointwiseMLPOptions options{};
                options.point_cloud_range = Details::point_cloud_range_from_tree(args, context);
                options.hidden_units = SL::get_numeric_or<std::size_t>(args, "hidden_units", options.hidden_units, context);
                options.hidden_layers = SL::get_numeric_or<std::size_t>(args, "hidden_layers", options.hidden_layers, context);
                return std::make_shared<PointwiseMLP>(options);
            });
            return table;
        }();
        return registry;
    }
}

#endif // FLOWBENCH_MODEL_HPP
