#ifndef FLOWBENCH_DATA_HPP
#define FLOWBENCH_DATA_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>
#include <memory>

#include "../common/registry.hpp"
#include "../common/save_load.hpp"
#include "details/batch.hpp"
#include "details/dataset.hpp"
#include "details/loader.hpp"
#include "details/saved.hpp"
#include "details/synthetic.hpp"

namespace Flowbench::Data {
    using SceneFlowSample = Details::SceneFlowSample;
    using Batch = Details::Batch;
    using Dataset = Details::Dataset;
    using DatasetPtr = Details::DatasetPtr;
    using SyntheticRigid = Details::SyntheticRigid;
    using SyntheticRigidOptions = Details::SyntheticRigidOptions;
    using SavedSequence = Details::SavedSequence;
    using SavedSequenceOptions = Details::SavedSequenceOptions;
    using Loader = Details::Loader;
    using LoaderOptions = Details::LoaderOptions;

    using Details::collate;
    using Details::read_saved_sequence;
    using Details::write_saved_sequence;

    using DatasetRegistry = Common::Registry<DatasetPtr(const Common::SaveLoad::PropertyTree&)>;

    [[nodiscard]] inline auto SyntheticRigidFromTree(const Common::SaveLoad::PropertyTree& args) -> SyntheticRigidOptions {
        namespace SL = Common::SaveLoad::Detail;
        const std::string context{"dataset.args"};
        SyntheticRigidOptions options{};
        options.sequences = SL::get_numeric_or<std::size_t>(args, "sequences", options.sequences, context);
        options.sequence_length = SL::get_numeric_or<std::size_t>(args, "sequence_length", options.sequence_length, context);
        options.background_points = SL::get_numeric_or<std::size_t>(args, "background_points", options.background_points, context);
        options.objects_per_scene = SL::get_numeric_or<std::size_t>(args, "objects_per_scene", options.objects_per_scene, context);
        options.points_per_object = SL::get_numeric_or<std::size_t>(args, "points_per_object", options.points_per_object, context);
        if (const auto categories = args.get_child_optional("object_categories")) {
            options.object_categories = SL::read_array<std::int64_t>(*categories, context + ".object_categories");
        }
        options.scene_half_extent_meters = SL::get_numeric_or<double>(args, "scene_half_extent_meters", options.scene_half_extent_meters, context);
        options.object_half_extent_meters = SL::get_numeric_or<double>(args, "object_half_extent_meters", options.object_half_extent_meters, context);
        options.max_speed_meters_per_second = SL::get_numeric_or<double>(args, "max_speed_meters_per_second", options.max_speed_meters_per_second, context);
        options.frame_rate_hz = SL::get_numeric_or<double>(args, "frame_rate_hz", options.frame_rate_hz, context);
        options.background_category = SL::get_numeric_or<std::int64_t>(args, "background_category", options.background_category, context);
        options.seed = SL::get_numeric_or<std::uint64_t>(args, "seed", options.seed, context);
        return options;
    }

    [[nodiscard]] inline auto LoaderFromTree(const Common::SaveLoad::PropertyTree& args) -> LoaderOptions {
        namespace SL = Common::SaveLoad::Detail;
        const std::string context{"dataloader.args"};
        LoaderOptions options{};
        options.batch_size = SL::get_numeric_or<std::size_t>(args, "batch_size", options.batch_size, context);
        options.shuffle = SL::get_boolean_or(args, "shuffle", options.shuffle, context);
        options.drop_last = SL::get_boolean_or(args, "drop_last", options.drop_last, context);
        options.seed = SL::get_numeric_or<std::uint64_t>(args, "seed", options.seed, context);
        return options;
    }

    [[nodiscard]] inline auto Datasets() -> const DatasetRegistry& {
        static const DatasetRegistry registry = [] {
            DatasetRegistry table{"dataset"};
            table.add("SyntheticRigid", [](const Common::SaveLoad::PropertyTree& args) -> DatasetPtr {
                return std::make_shared<SyntheticRigid>(SyntheticRigidFromTree(args));
            });
            table.add("SavedSequence", [](const Common::SaveLoad::PropertyTree& args) -> DatasetPtr {
                SavedSequenceOptions options{};
                options.root = Common::SaveLoad::Detail::get_string(args, "root", "dataset.args");
                options.extension = args.get<std::string>("extension", options.extension);
                return std::make_shared<SavedSequence>(options);
            });
            return table;
        }();
        return registry;
    }
}

#endif //FLOWBENCH_DATA_HPP
