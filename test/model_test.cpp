#include <memory>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Flowbench.h"

using Flowbench::Common::SaveLoad::PropertyTree;
using Flowbench::Data::Batch;
using Flowbench::Data::SceneFlowSample;

namespace {
    // Two frames, every point translated by `shift`.
    SceneFlowSample Translated(std::int64_t points, std::vector<float> shift, std::uint64_t seed = 3) {
        torch::manual_seed(seed);
        auto pc0 = torch::rand({points, 3}) * 10.0 - 5.0;
        auto offset = torch::tensor(shift).reshape({1, 3});
        SceneFlowSample sample{};
        sample.pc_array_stack = {pc0, pc0 + offset};
        sample.flowed_pc_array_stack = {pc0 + offset, pc0 + offset};
        sample.pc_class_mask_stack = {torch::zeros({points}, torch::kInt64), torch::zeros({points}, torch::kInt64)};
        return sample;
    }

    Batch Single(SceneFlowSample sample) { return Flowbench::Data::collate({std::move(sample)}); }
}

TEST(PointCloudRange, FiltersHalfOpenBox) {
    const auto points = torch::tensor(std::vector<float>{0, 0, 0, 10, 0, 0, -10, 0, 0, 0, 0, 5}).reshape({4, 3});
    const auto kept = Flowbench::Model::points_in_range(points, {-10.0, -10.0, -3.0, 10.0, 10.0, 3.0});
    EXPECT_TRUE(torch::equal(kept, torch::tensor(std::vector<std::int64_t>{0, 2})));
}

TEST(ZeroFlow, PredictsZeroForEveryValidPoint) {
    Flowbench::Model::ZeroFlowOptions options{};
    options.point_cloud_range = {-4.0, -4.0, -4.0, 4.0, 4.0, 4.0};
    Flowbench::Model::ZeroFlow model(options);
    const auto output = model.forward(Single(Translated(200, {0.1F, 0.0F, 0.0F})), PropertyTree{});
    ASSERT_EQ(output.size(), 1u);
    EXPECT_FALSE(model.trainable());
    EXPECT_EQ(output.flow[0].size(0), output.pc0_valid_point_idxes[0].size(0));
    EXPECT_LT(output.flow[0].size(0), 200);
    EXPECT_EQ(output.flow[0].abs().sum().item<float>(), 0.0F);
    EXPECT_GE(output.batch_delta_time, 0.0);
}

TEST(NSFP, FitsARigidTranslation) {
    Flowbench::Model::NSFPOptions options{};
    options.hidden_units = 32;
    options.hidden_layers = 3;
    options.iterations = 300;
    Flowbench::Model::NSFP model(options);
    const auto batch = Single(Translated(256, {0.3F, -0.2F, 0.0F}));

    const auto output = model.forward(batch, PropertyTree{});
    const auto& sample = batch.samples.front();
    const auto source = sample.pc_array_stack[0].index_select(0, output.pc0_valid_point_idxes[0]);
    const auto target = sample.pc_array_stack[1].index_select(0, output.pc1_valid_point_idxes[0]);
    const auto before = Flowbench::Model::chamfer_distance(source, target).item<double>();
    const auto after = Flowbench::Model::chamfer_distance(source + output.flow[0], target).item<double>();
    EXPECT_LT(after, 0.5 * before);
    EXPECT_GT(model.last_iterations(), 0u);
}

TEST(NSFP, PredictionIgnoresTheGlobalSeed) {
    Flowbench::Model::NSFPOptions options{};
    options.hidden_units = 16;
    options.hidden_layers = 2;
    options.iterations = 20;
    options.seed = 11;
    Flowbench::Model::NSFP model(options);
    const auto batch = Single(Translated(64, {0.2F, 0.1F, 0.0F}));

    torch::manual_seed(1);
    const auto first = model.forward(batch, PropertyTree{});
    torch::manual_seed(2);
    (void)torch::rand({128});
    const auto second = model.forward(batch, PropertyTree{});
    EXPECT_TRUE(torch::equal(first.flow[0], second.flow[0]));
}

TEST(NSFP, ForwardArgumentsOverrideIterations) {
    Flowbench::Model::NSFPOptions options{};
    options.hidden_units = 8;
    options.hidden_layers = 1;
    Flowbench::Model::NSFP model(options);
    PropertyTree args;
    args.put("iterations", 2);
    (void)model.forward(Single(Translated(32, {0.1F, 0.0F, 0.0F})), args);
    EXPECT_LE(model.last_iterations(), 2u);
}

TEST(PointwiseMLP, IsTrainableAndReceivesGradients) {
    Flowbench::Model::PointwiseMLP model{};
    EXPECT_TRUE(model.trainable());
    const auto batch = Single(Translated(64, {0.2F, 0.0F, 0.0F}));
    const auto output = model.forward(batch, PropertyTree{});
    const Flowbench::Loss::SupervisedEPE loss{};
    const auto terms = loss(batch, output);
    ASSERT_EQ(terms.count("loss"), 1u);
    ASSERT_EQ(terms.count("epe"), 1u);
    terms.at("loss").backward();
    bool any_gradient = false;
    for (const auto& parameter : model.parameters()) {
        any_gradient = any_gradient || (parameter.grad().defined() && parameter.grad().abs().sum().item<float>() > 0.0F);
    }
    EXPECT_TRUE(any_gradient);
}

TEST(Losses, SupervisedEPEOfZeroFlowIsTheMotionMagnitude) {
    Flowbench::Model::ZeroFlow model{};
    const auto batch = Single(Translated(50, {0.3F, 0.4F, 0.0F}));
    const auto terms = Flowbench::Loss::SupervisedEPE{}(batch, model.forward(batch, PropertyTree{}));
    EXPECT_NEAR(terms.at("loss").item<double>(), 0.5, 1e-5);
}

TEST(Losses, ChamferVanishesForExactFlow) {
    const auto batch = Single(Translated(40, {0.5F, 0.0F, 0.0F}));
    Flowbench::Model::FlowOutput output{};
    const auto valid = torch::arange(40, torch::kInt64);
    output.flow = {torch::tensor(std::vector<float>{0.5F, 0.0F, 0.0F}).reshape({1, 3}).expand({40, 3}).contiguous()};
    output.pc0_valid_point_idxes = {valid};
    output.pc1_valid_point_idxes = {valid};
    const auto terms = Flowbench::Loss::Chamfer{}(batch, output);
    EXPECT_NEAR(terms.at("loss").item<double>(), 0.0, 1e-8);
}

TEST(Losses, MisalignedOutputIsRejected) {
    const auto batch = Single(Translated(10, {0.0F, 0.0F, 0.0F}));
    const Flowbench::Model::FlowOutput empty{};
    EXPECT_THROW((void)Flowbench::Loss::Chamfer{}(batch, empty), Flowbench::ShapeMismatch);
}

TEST(ModelRegistry, BuildsConfiguredModels) {
    PropertyTree args;
    args.put("hidden_units", 16);
    const auto model = Flowbench::Model::Models().create("PointwiseMLP", args);
    EXPECT_EQ(model->name(), "PointwiseMLP");
    EXPECT_THROW((void)Flowbench::Model::Models().create("DeFlow", args), Flowbench::UnknownComponent);

    PropertyTree bad_range;
    PropertyTree values;
    for (double value : {1.0, 2.0, 3.0}) {
        PropertyTree element;
        element.put("", value);
        values.push_back({"", element});
    }
    bad_range.add_child("point_cloud_range", values);
    EXPECT_THROW((void)Flowbench::Model::Models().create("ZeroFlow", bad_range), std::runtime_error);
    EXPECT_THROW((void)Flowbench::Loss::Losses().create("Hinge", PropertyTree{}), Flowbench::UnknownComponent);
}
