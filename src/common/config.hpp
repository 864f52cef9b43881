#ifndef FLOWBENCH_COMMON_CONFIG_HPP
#define FLOWBENCH_COMMON_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../metric/details/accumulator.hpp"
#include "save_load.hpp"

namespace Flowbench::Common::Config {
    using PropertyTree = SaveLoad::PropertyTree;

    // A registry name plus the free-form arguments handed to its factory.
    struct ComponentConfig {
        std::string name{};
        PropertyTree args{};
    };

    struct RunConfig {
        std::string filename{};
        bool is_trainable{false};
        bool has_labels{true};
        double learning_rate{1e-3};
        std::size_t epochs{1};
        std::size_t save_every{0};      // optimizer steps, 0 disables
        std::size_t validate_every{0};  // optimizer steps, 0 = once per epoch
        std::uint64_t seed{42069};

        ComponentConfig model{};
        std::optional<ComponentConfig> loss_fn{};
        PropertyTree train_forward_args{};
        PropertyTree val_forward_args{};

        std::optional<ComponentConfig> dataset{};
        PropertyTree dataloader{};
        ComponentConfig test_dataset{};
        PropertyTree test_dataloader{};

        Metric::Details::Options metric{};
        std::filesystem::path validation_results_dir{"validation_results"};

        // Stem of the config file name; keys the persisted results.
        [[nodiscard]] std::string run_name() const { return std::filesystem::path(filename).stem().string(); }
    };

    namespace Detail {
        inline PropertyTree child_or_empty(const PropertyTree& tree, const std::string& key) {
            if (const auto child = tree.get_child_optional(key)) {
                return *child;
            }
            return PropertyTree{};
        }

        inline ComponentConfig parse_component(const PropertyTree& tree, const std::string& key, const std::string& context) {
            const auto node = tree.get_child_optional(key);
            if (!node) {
                std::ostringstream message;
                message << "Missing section '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            ComponentConfig component{};
            component.name = SaveLoad::Detail::get_string(*node, "name", context + "." + key);
            component.args = child_or_empty(*node, "args");
            return component;
        }

        inline std::optional<ComponentConfig> parse_optional_component(const PropertyTree& tree, const std::string& key,
                                                                       const std::string& context) {
            if (!tree.get_child_optional(key)) {
                return std::nullopt;
            }
            return parse_component(tree, key, context);
        }

        inline std::size_t get_count_or(const PropertyTree& tree, const std::string& key, std::size_t fallback,
                                        const std::string& context) {
            const auto value = SaveLoad::Detail::get_numeric_or<std::int64_t>(tree, key, static_cast<std::int64_t>(fallback), context);
            if (value < 0) {
                throw std::runtime_error("Field '" + key + "' in " + context + " must be non-negative.");
            }
            return static_cast<std::size_t>(value);
        }
    }

    inline Metric::Details::Options parse_metric_options(const PropertyTree& tree, const std::string& context) {
        Metric::Details::Options options{};
        if (const auto categories = tree.get_child_optional("categories")) {
            std::vector<Metric::Details::Category> entries;
            for (const auto& entry : *categories) {
                const auto id = SaveLoad::Detail::get_numeric<std::int64_t>(entry.second, "id", context + ".categories");
                const auto name = SaveLoad::Detail::get_string(entry.second, "name", context + ".categories");
                entries.push_back({id, name});
            }
            std::vector<std::int64_t> static_ids{};
            for (const auto& entry : entries) {
                if (entry.id == -1) {
                    static_ids.push_back(-1);
                }
            }
            if (const auto statics = tree.get_child_optional("static_categories")) {
                static_ids = SaveLoad::Detail::read_array<std::int64_t>(*statics, context + ".static_categories");
            }
            options.categories = Metric::Details::CategoryTable(std::move(entries), std::move(static_ids));
        } else if (const auto statics = tree.get_child_optional("static_categories")) {
            options.categories = Metric::Details::CategoryTable(
                options.categories.categories(),
                SaveLoad::Detail::read_array<std::int64_t>(*statics, context + ".static_categories"));
        }
        if (const auto splits = tree.get_child_optional("speed_bucket_splits")) {
            options.speed_bucket_splits = SaveLoad::Detail::read_array<double>(*splits, context + ".speed_bucket_splits");
        }
        if (const auto splits = tree.get_child_optional("endpoint_error_splits")) {
            options.endpoint_error_splits = SaveLoad::Detail::read_array<double>(*splits, context + ".endpoint_error_splits");
        }
        options.close_object_threshold_meters = SaveLoad::Detail::get_numeric_or<double>(
            tree, "close_object_threshold_meters", options.close_object_threshold_meters, context);
        options.per_frame_to_per_second_scale_factor = SaveLoad::Detail::get_numeric_or<double>(
            tree, "per_frame_to_per_second_scale_factor", options.per_frame_to_per_second_scale_factor, context);
        options.strict_bucket_range = SaveLoad::Detail::get_boolean_or(tree, "strict_bucket_range", options.strict_bucket_range, context);
        return options;
    }

    inline RunConfig parse_run_config(const PropertyTree& tree, const std::string& context) {
        RunConfig config{};
        config.filename = tree.get<std::string>("filename", context);
        config.is_trainable = SaveLoad::Detail::get_boolean_or(tree, "is_trainable", config.is_trainable, context);
        config.has_labels = SaveLoad::Detail::get_boolean_or(tree, "has_labels", config.has_labels, context);
        config.learning_rate = SaveLoad::Detail::get_numeric_or<double>(tree, "learning_rate", config.learning_rate, context);
        config.epochs = Detail::get_count_or(tree, "epochs", config.epochs, context);
        config.save_every = Detail::get_count_or(tree, "save_every", config.save_every, context);
        config.validate_every = Detail::get_count_or(tree, "validate_every", config.validate_every, context);
        config.seed = static_cast<std::uint64_t>(
            SaveLoad::Detail::get_numeric_or<std::int64_t>(tree, "seed", static_cast<std::int64_t>(config.seed), context));

        config.model = Detail::parse_component(tree, "model", context);
        config.loss_fn = Detail::parse_optional_component(tree, "loss_fn", context);
        config.train_forward_args = Detail::child_or_empty(tree, "train_forward_args");
        config.val_forward_args = Detail::child_or_empty(tree, "val_forward_args");

        config.dataset = Detail::parse_optional_component(tree, "dataset", context);
        config.dataloader = Detail::child_or_empty(Detail::child_or_empty(tree, "dataloader"), "args");
        config.test_dataset = Detail::parse_component(tree, "test_dataset", context);
        config.test_dataloader = Detail::child_or_empty(Detail::child_or_empty(tree, "test_dataloader"), "args");

        if (const auto metric = tree.get_child_optional("metric")) {
            config.metric = parse_metric_options(*metric, context + ".metric");
        }
        config.validation_results_dir = tree.get<std::string>("validation_results_dir", "validation_results");

        if (config.is_trainable && !config.loss_fn) {
            throw std::runtime_error("Missing section 'loss_fn' in " + context + " (required when is_trainable is true)");
        }
        if (config.is_trainable && !config.dataset) {
            throw std::runtime_error("Missing section 'dataset' in " + context + " (required when is_trainable is true)");
        }
        return config;
    }

    // Missing "filename" defaults to the config file's own name.
    inline RunConfig load_run_config(const std::filesystem::path& path) {
        return parse_run_config(SaveLoad::read_json_file(path), path.string());
    }
}

#endif // FLOWBENCH_COMMON_CONFIG_HPP
