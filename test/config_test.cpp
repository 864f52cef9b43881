#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <gtest/gtest.h>

#include "../include/Flowbench.h"

using Flowbench::Common::Config::parse_run_config;
using Flowbench::Common::SaveLoad::PropertyTree;

namespace {
    PropertyTree Parse(const std::string& json) {
        std::istringstream stream(json);
        PropertyTree tree;
        boost::property_tree::read_json(stream, tree);
        return tree;
    }

    const char* kValidationConfig = R"({
        "filename": "configs/zeroflow_argo.json",
        "is_trainable": false,
        "model": {"name": "ZeroFlow", "args": {"point_cloud_range": [-10, -10, -2, 10, 10, 2]}},
        "test_dataset": {"name": "SyntheticRigid", "args": {"sequences": 4}},
        "test_dataloader": {"args": {"batch_size": 2}},
        "metric": {
            "categories": [{"id": -1, "name": "BACKGROUND"}, {"id": 0, "name": "CAR"}, {"id": 5, "name": "SIGN"}],
            "static_categories": [-1, 5],
            "speed_bucket_splits": [0, 0.5, "inf"],
            "endpoint_error_splits": [0, 0.05, 0.1, "inf"],
            "close_object_threshold_meters": 20,
            "strict_bucket_range": true
        },
        "validation_results_dir": "out/results"
    })";
}

TEST(RunConfig, ParsesValidationConfig) {
    const auto config = parse_run_config(Parse(kValidationConfig), "test");
    EXPECT_EQ(config.run_name(), "zeroflow_argo");
    EXPECT_FALSE(config.is_trainable);
    EXPECT_TRUE(config.has_labels);
    EXPECT_EQ(config.model.name, "ZeroFlow");
    EXPECT_EQ(config.test_dataset.name, "SyntheticRigid");
    EXPECT_EQ(config.test_dataloader.get<int>("batch_size"), 2);
    EXPECT_FALSE(config.loss_fn.has_value());

    const auto& metric = config.metric;
    EXPECT_EQ(metric.categories.size(), 3u);
    EXPECT_TRUE(metric.categories.is_static(5));
    EXPECT_FALSE(metric.categories.is_static(0));
    ASSERT_EQ(metric.speed_bucket_splits.size(), 3u);
    EXPECT_TRUE(std::isinf(metric.speed_bucket_splits.back()));
    EXPECT_DOUBLE_EQ(metric.close_object_threshold_meters, 20.0);
    EXPECT_DOUBLE_EQ(metric.per_frame_to_per_second_scale_factor, 10.0);
    EXPECT_TRUE(metric.strict_bucket_range);
    EXPECT_EQ(config.validation_results_dir, std::filesystem::path("out/results"));
}

TEST(RunConfig, UnknownStaticCategoryFailsAtLoad) {
    auto tree = Parse(kValidationConfig);
    PropertyTree statics;
    PropertyTree element;
    element.put("", -2);
    statics.push_back({"", element});
    tree.put_child("metric.static_categories", statics);
    EXPECT_THROW((void)parse_run_config(tree, "test"), Flowbench::UnknownCategory);

    // Default table, typo in the static list.
    tree.get_child("metric").erase("categories");
    EXPECT_THROW((void)parse_run_config(tree, "test"), Flowbench::UnknownCategory);
}

TEST(RunConfig, CustomTableWithoutBackgroundHasNoDefaultStatics) {
    auto tree = Parse(kValidationConfig);
    tree.get_child("metric").erase("static_categories");
    PropertyTree categories;
    for (const auto& [id, name] : std::vector<std::pair<int, std::string>>{{0, "CAR"}, {1, "PEDESTRIAN"}}) {
        PropertyTree entry;
        entry.put("id", id);
        entry.put("name", name);
        categories.push_back({"", entry});
    }
    tree.put_child("metric.categories", categories);
    const auto config = parse_run_config(tree, "test");
    EXPECT_TRUE(config.metric.categories.static_ids().empty());
}

TEST(RunConfig, MissingSectionsAreNamed) {
    try {
        (void)parse_run_config(Parse(R"({"test_dataset": {"name": "SyntheticRigid"}})"), "broken.json");
        FAIL() << "expected a missing model section";
    } catch (const std::runtime_error& error) {
        EXPECT_NE(std::string(error.what()).find("'model'"), std::string::npos);
    }
    EXPECT_THROW((void)parse_run_config(Parse(R"({"model": {"args": {}}, "test_dataset": {"name": "X"}})"), "broken.json"),
                 std::runtime_error);
}

TEST(RunConfig, TrainableRunsNeedLossAndDataset) {
    const auto json = R"({"is_trainable": true, "model": {"name": "PointwiseMLP"}, "test_dataset": {"name": "SyntheticRigid"}})";
    EXPECT_THROW((void)parse_run_config(Parse(json), "train.json"), std::runtime_error);
}

TEST(RunConfig, FilenameDefaultsToConfigPath) {
    const auto config = parse_run_config(Parse(R"({"model": {"name": "ZeroFlow"}, "test_dataset": {"name": "SyntheticRigid"}})"),
                                         "configs/nsfp_av2.json");
    EXPECT_EQ(config.run_name(), "nsfp_av2");
}

TEST(SaveLoad, ParsesInfinityAndRejectsGarbage) {
    using Flowbench::Common::SaveLoad::Detail::parse_double;
    EXPECT_TRUE(std::isinf(parse_double("inf", "test")));
    EXPECT_TRUE(std::isinf(parse_double("Infinity", "test")));
    EXPECT_LT(parse_double("-inf", "test"), 0.0);
    EXPECT_DOUBLE_EQ(parse_double("0.125", "test"), 0.125);
    EXPECT_THROW((void)parse_double("fast", "test"), std::runtime_error);
    EXPECT_THROW((void)parse_double("1.5m", "test"), std::runtime_error);
}

TEST(SaveLoad, NestedTensorArraysKeepShapeAndValues) {
    const auto tensor = torch::arange(24, torch::kFloat64).reshape({2, 3, 4}) / 3.0;
    const auto tree = Flowbench::Common::SaveLoad::write_tensor(tensor);
    const auto back = Flowbench::Common::SaveLoad::read_tensor(tree, torch::kFloat64, "test");
    EXPECT_EQ(back.sizes(), tensor.sizes());
    EXPECT_TRUE(torch::equal(back, tensor));
}

TEST(Registry, RejectsDuplicatesAndListsKnownNames) {
    Flowbench::Common::Registry<int(int)> registry{"doubler"};
    registry.add("twice", [](int value) { return 2 * value; });
    EXPECT_EQ(registry.create("twice", 21), 42);
    EXPECT_THROW(registry.add("twice", [](int value) { return value; }), std::invalid_argument);
    try {
        (void)registry.create("thrice", 1);
        FAIL() << "expected UnknownComponent";
    } catch (const Flowbench::UnknownComponent& error) {
        EXPECT_NE(std::string(error.what()).find("twice"), std::string::npos);
    }
}

TEST(Registry, ComponentNamesAreValidatedUpFront) {
    auto config = parse_run_config(Parse(kValidationConfig), "test");
    EXPECT_NO_THROW(Flowbench::Training::require_components(config));
    config.model.name = "FastFlow3D";
    EXPECT_THROW(Flowbench::Training::require_components(config), Flowbench::UnknownComponent);
}
