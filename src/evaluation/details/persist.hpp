#ifndef FLOWBENCH_EVALUATION_PERSIST_HPP
#define FLOWBENCH_EVALUATION_PERSIST_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/save_load.hpp"
#include "report.hpp"

namespace Flowbench::Evaluation::Details::Persist {
    using PropertyTree = Common::SaveLoad::PropertyTree;

    inline PropertyTree to_tree(const Report::ValidationReport& report) {
        namespace SL = Common::SaveLoad;
        PropertyTree tree;
        tree.put("run_name", report.run_name);

        PropertyTree metrics;
        metrics.put("full.mover_epe", SL::Detail::format_double(report.full_mover_epe));
        metrics.put("full.nonmover_epe", SL::Detail::format_double(report.full_nonmover_epe));
        metrics.put("close.mover_epe", SL::Detail::format_double(report.close_mover_epe));
        metrics.put("close.nonmover_epe", SL::Detail::format_double(report.close_nonmover_epe));
        tree.add_child("metrics", metrics);

        tree.put("total_forward_time", SL::Detail::format_double(report.total_forward_time));
        tree.put("total_forward_count", report.total_forward_count);
        tree.put("average_forward_time", SL::Detail::format_double(report.average_forward_time));

        PropertyTree categories;
        for (std::size_t i = 0; i < report.category_ids.size(); ++i) {
            PropertyTree entry;
            entry.put("id", report.category_ids[i]);
            entry.put("name", report.category_names.at(i));
            categories.push_back({"", entry});
        }
        tree.add_child("categories", categories);
        tree.add_child("static_categories", SL::Detail::write_array(report.static_category_ids));
        tree.add_child("speed_bucket_splits", SL::Detail::write_array(report.speed_bucket_splits));
        tree.add_child("endpoint_error_splits", SL::Detail::write_array(report.endpoint_error_splits));
        tree.put("close_object_threshold_meters", SL::Detail::format_double(report.close_object_threshold_meters));

        tree.add_child("per_class_bucketed_error_sum", SL::write_tensor(report.per_class_bucketed_error_sum));
        tree.add_child("per_class_bucketed_error_count", SL::write_tensor(report.per_class_bucketed_error_count));
        tree.add_child("per_class_bucketed_mean_error", SL::write_tensor(report.per_class_bucketed_mean_error));
        return tree;
    }

    inline Report::ValidationReport from_tree(const PropertyTree& tree, const std::string& context) {
        namespace SL = Common::SaveLoad;
        Report::ValidationReport report{};
        report.run_name = SL::Detail::get_string(tree, "run_name", context);
        report.full_mover_epe = SL::Detail::get_numeric<double>(tree, "metrics.full.mover_epe", context);
        report.full_nonmover_epe = SL::Detail::get_numeric<double>(tree, "metrics.full.nonmover_epe", context);
        report.close_mover_epe = SL::Detail::get_numeric<double>(tree, "metrics.close.mover_epe", context);
        report.close_nonmover_epe = SL::Detail::get_numeric<double>(tree, "metrics.close.nonmover_epe", context);
        report.total_forward_time = SL::Detail::get_numeric<double>(tree, "total_forward_time", context);
        report.total_forward_count = SL::Detail::get_numeric<std::int64_t>(tree, "total_forward_count", context);
        report.average_forward_time = SL::Detail::get_numeric<double>(tree, "average_forward_time", context);

        const auto categories = tree.get_child_optional("categories");
        if (!categories) {
            throw std::runtime_error("Missing array 'categories' in " + context);
        }
        for (const auto& entry : *categories) {
            report.category_ids.push_back(SL::Detail::get_numeric<std::int64_t>(entry.second, "id", context + ".categories"));
            report.category_names.push_back(SL::Detail::get_string(entry.second, "name", context + ".categories"));
        }
        auto array = [&](const std::string& key) -> const PropertyTree& {
            const auto node = tree.get_child_optional(key);
            if (!node) {
                throw std::runtime_error("Missing array '" + key + "' in " + context);
            }
            return *node;
        };
        report.static_category_ids = SL::Detail::read_array<std::int64_t>(array("static_categories"), context);
        report.speed_bucket_splits = SL::Detail::read_array<double>(array("speed_bucket_splits"), context);
        report.endpoint_error_splits = SL::Detail::read_array<double>(array("endpoint_error_splits"), context);
        report.close_object_threshold_meters = SL::Detail::get_numeric<double>(tree, "close_object_threshold_meters", context);

        report.per_class_bucketed_error_sum = SL::read_tensor(array("per_class_bucketed_error_sum"), torch::kFloat64,
                                                              context + ".per_class_bucketed_error_sum");
        report.per_class_bucketed_error_count = SL::read_tensor(array("per_class_bucketed_error_count"), torch::kInt64,
                                                                context + ".per_class_bucketed_error_count");
        report.per_class_bucketed_mean_error = SL::read_tensor(array("per_class_bucketed_mean_error"), torch::kFloat64,
                                                               context + ".per_class_bucketed_mean_error");
        return report;
    }

    // Writes <directory>/<run_name>.json and returns the path.
    inline std::filesystem::path save(const Report::ValidationReport& report, const std::filesystem::path& directory) {
        if (report.run_name.empty()) {
            throw std::invalid_argument("Cannot persist a validation report without a run name.");
        }
        const auto path = directory / (report.run_name + ".json");
        try {
            Common::SaveLoad::write_json_file(path, to_tree(report));
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to write validation report to '" + path.string() + "': " + error.what());
        }
        return path;
    }

    inline Report::ValidationReport load(const std::filesystem::path& path) {
        PropertyTree tree;
        try {
            tree = Common::SaveLoad::read_json_file(path);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to read validation report from '" + path.string() + "': " + error.what());
        }
        return from_tree(tree, path.string());
    }
}

#endif // FLOWBENCH_EVALUATION_PERSIST_HPP
