#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "support.hpp"

namespace SaveLoad = Shear::Common::SaveLoad;

namespace {
    Shear::PruningConfig quiet_config(std::ostream& sink)
    {
        Shear::PruningConfig config{};
        config.start_step = 0;
        config.end_step = 10;
        config.max_sparsity = 0.5;
        config.recompute_interval = 5;
        config.power = 1.0;
        config.probe_shape = {2, 3, 6, 6};
        config.trials = 2;
        config.seed = 7;
        config.stream = &sink;
        return config;
    }

    std::filesystem::path scratch(const std::string& name)
    {
        return std::filesystem::temp_directory_path() / ("shear_" + name + ".json");
    }
}

TEST(pruner, config_validation)
{
    std::ostringstream sink;
    EXPECT_NO_THROW(quiet_config(sink).validate());

    auto config = quiet_config(sink);
    config.end_step = -1;
    EXPECT_THROW(config.validate(), Shear::ScheduleConfigError);

    config = quiet_config(sink);
    config.max_sparsity = 1.5;
    EXPECT_THROW(config.validate(), Shear::ScheduleConfigError);

    config = quiet_config(sink);
    config.recompute_interval = 0;
    EXPECT_THROW(config.validate(), Shear::ScheduleConfigError);

    config = quiet_config(sink);
    config.probe_shape.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = quiet_config(sink);
    config.probe_shape = {2, 0, 4, 4};
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = quiet_config(sink);
    config.atol = -1e-3;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = quiet_config(sink);
    config.trials = 0;
    EXPECT_THROW(Shear::Pruner{config}, std::invalid_argument);
}

TEST(pruner, config_survives_a_json_file)
{
    std::ostringstream sink;
    auto config = quiet_config(sink);
    config.importance_metric = Shear::Mask::Importance::L2;
    config.depthwise = Shear::Dependency::DepthwisePolicy::Stop;
    config.layers = {"A"};
    config.strict = true;
    config.rtol = 1e-4;

    const auto path = scratch("config");
    Shear::Config::save(config, path);
    const auto loaded = Shear::Config::load(path);
    std::filesystem::remove(path);

    EXPECT_EQ(loaded.start_step, 0);
    EXPECT_EQ(loaded.end_step, 10);
    EXPECT_DOUBLE_EQ(loaded.max_sparsity, 0.5);
    EXPECT_EQ(loaded.recompute_interval, 5);
    EXPECT_EQ(loaded.importance_metric, Shear::Mask::Importance::L2);
    EXPECT_EQ(loaded.depthwise, Shear::Dependency::DepthwisePolicy::Stop);
    EXPECT_EQ(loaded.layers, (std::vector<std::string>{"A"}));
    EXPECT_EQ(loaded.probe_shape, (std::vector<std::int64_t>{2, 3, 6, 6}));
    EXPECT_EQ(loaded.trials, 2U);
    EXPECT_EQ(loaded.seed, 7U);
    EXPECT_TRUE(loaded.strict);
    EXPECT_DOUBLE_EQ(loaded.rtol, 1e-4);
}

TEST(pruner, config_requires_the_schedule_fields)
{
    SaveLoad::PropertyTree tree;
    tree.put("start_step", 0);
    tree.put("max_sparsity", 0.5);
    tree.put("recompute_interval", 10);
    tree.add_child("probe_shape", SaveLoad::Detail::write_array(std::vector<std::int64_t>{1, 3, 4, 4}));
    EXPECT_THROW(Shear::Config::deserialize(tree), std::runtime_error);

    tree.put("end_step", 100);
    const auto config = Shear::Config::deserialize(tree);
    EXPECT_EQ(config.end_step, 100);
    EXPECT_EQ(config.importance_metric, Shear::Mask::Importance::L1);
    EXPECT_DOUBLE_EQ(config.power, 3.0);

    tree.put("importance_metric", "entropy");
    EXPECT_THROW(Shear::Config::deserialize(tree), std::invalid_argument);

    tree.put("importance_metric", "L2");
    tree.put("max_sparsity", 2.0);
    EXPECT_THROW(Shear::Config::deserialize(tree), Shear::ScheduleConfigError);
}

TEST(pruner, requires_attach_before_training)
{
    std::ostringstream sink;
    Shear::Pruner pruner(quiet_config(sink));
    EXPECT_FALSE(pruner.attached());
    EXPECT_THROW(pruner.step(0), std::logic_error);
    EXPECT_THROW(pruner.finalize(), std::logic_error);

    const auto graph = ShearTest::make_chain();
    pruner.attach(*graph);
    EXPECT_TRUE(pruner.attached());
    EXPECT_THROW(pruner.attach(*graph), std::logic_error);
}

TEST(pruner, trains_cuts_and_validates_end_to_end)
{
    torch::manual_seed(3);
    const auto graph = ShearTest::make_chain();
    ShearTest::randomize_normalization(*graph, "bn");
    std::ostringstream sink;
    Shear::Pruner pruner(quiet_config(sink));
    pruner.attach(*graph);

    torch::optim::SGD optimizer(graph->parameters(), torch::optim::SGDOptions(1e-2));
    for (std::int64_t step = 0; step <= 15; ++step) {
        pruner.step(step);
        optimizer.zero_grad();
        const auto output = pruner.forward(torch::randn({4, 3, 6, 6}));
        const auto loss = (output - 1.0).pow(2).mean();
        loss.backward();
        optimizer.step();
    }
    EXPECT_EQ(pruner.phase(15), Shear::Training::Phase::Stable);

    const auto result = pruner.finalize();
    EXPECT_TRUE(pruner.controller().frozen());
    ASSERT_EQ(result.masks.count("A"), 1U);
    EXPECT_EQ(result.masks.at("A").kept(), 4);

    EXPECT_EQ(result.graph->layer("A").channels.out_channels.value_or(0), 4);
    EXPECT_EQ(result.graph->layer("bn").parameter(ShearTest::Slot::Weight).size(0), 4);
    EXPECT_EQ(result.graph->layer("B").parameter(ShearTest::Slot::Weight).size(1), 4);
    EXPECT_EQ(result.reference->layer("A").channels.out_channels.value_or(0), 8);
    EXPECT_EQ(graph->layer("A").channels.out_channels.value_or(0), 8);

    EXPECT_TRUE(result.equivalence.ok);
    EXPECT_EQ(result.equivalence.trials, 2U);
    EXPECT_LT(result.surgery.parameters_after, result.surgery.parameters_before);
    EXPECT_NE(sink.str().find("Pruning finished"), std::string::npos);
}

TEST(pruner, saves_the_run_artifacts)
{
    const auto graph = ShearTest::make_chain();
    ShearTest::set_channel_scores(*graph, "A", ShearTest::kScenarioScores);
    std::ostringstream sink;
    auto config = quiet_config(sink);
    config.monitor = false;
    Shear::Pruner pruner(config);
    pruner.attach(*graph);
    pruner.step(10);
    const auto result = pruner.finalize();

    const auto path = scratch("result");
    Shear::Pruner::save(result, path);
    const auto tree = SaveLoad::read_json_file(path);
    std::filesystem::remove(path);

    EXPECT_TRUE(tree.get<bool>("equivalence.ok"));
    EXPECT_EQ(tree.get<std::int64_t>("surgery.parameters_after"), result.surgery.parameters_after);

    const auto masks = SaveLoad::deserialize_masks(tree.get_child("masks"), "saved masks");
    ASSERT_EQ(masks.count("A"), 1U);
    EXPECT_EQ(masks.at("A").to_string(), "[0,1,0,1,1,0,1,1]");

    const auto rebuilt = SaveLoad::deserialize_architecture(tree.get_child("architecture"), "saved architecture");
    ASSERT_EQ(rebuilt->size(), result.graph->size());
    for (std::size_t index = 0; index < rebuilt->size(); ++index) {
        EXPECT_EQ(rebuilt->name(index), result.graph->name(index));
        EXPECT_EQ(rebuilt->layer(index).kind, result.graph->layer(index).kind);
        EXPECT_EQ(rebuilt->layer(index).channels.out_channels.value_or(-1), result.graph->layer(index).channels.out_channels.value_or(-1));
    }
    EXPECT_EQ(rebuilt->parameter_count(), result.graph->parameter_count());
    EXPECT_EQ(rebuilt->forward(torch::randn({1, 3, 5, 5})).sizes(), (std::vector<std::int64_t>{1, 4, 5, 5}));
}

TEST(save_load, architecture_keeps_explicit_routing)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d({.in_channels = 3, .out_channels = 6, .kernel_size = {1, 1}}, Shear::Activation::SiLU), "A");
    graph.add(Shear::Layer::AdaptiveAvgPool2d({.output_size = {1, 1}}), "pool");
    graph.add(Shear::Layer::Reduce({.op = Shear::Layer::ReduceOp::Mean, .dims = {2, 3}}), "reduce");
    graph.add(Shear::Layer::FC({6, 2, true}), "head");
    graph.links({
        Shear::LinkSpec{Shear::Port::Input(), Shear::Port::Module("A")},
        Shear::LinkSpec{Shear::Port::Module("A"), Shear::Port::Module("pool")},
        Shear::LinkSpec{Shear::Port::Module("pool"), Shear::Port::Module("reduce")},
        Shear::LinkSpec{Shear::Port::Module("reduce"), Shear::Port::Module("head")},
        Shear::LinkSpec{Shear::Port::Module("head"), Shear::Port::Output()},
    });

    const auto rebuilt = SaveLoad::deserialize_architecture(SaveLoad::serialize_architecture(graph), "routed");
    EXPECT_TRUE(rebuilt->has_explicit_routing());
    EXPECT_EQ(rebuilt->layer("A").kind, Shear::Layer::Kind::PointwiseConvolution);
    EXPECT_EQ(rebuilt->layer("head").kind, Shear::Layer::Kind::Dense);
    EXPECT_EQ(rebuilt->forward(torch::randn({2, 3, 4, 4})).sizes(), (std::vector<std::int64_t>{2, 2}));
}

TEST(save_load, masks_reject_malformed_entries)
{
    SaveLoad::PropertyTree entry;
    entry.put("name", "A");
    entry.add_child("keep", SaveLoad::Detail::write_array(std::vector<int>{1, 2, 0}));
    SaveLoad::PropertyTree tree;
    tree.push_back({"", entry});
    EXPECT_THROW((void)SaveLoad::deserialize_masks(tree, "masks"), std::runtime_error);

    SaveLoad::PropertyTree valid;
    valid.put("name", "A");
    valid.add_child("keep", SaveLoad::Detail::write_array(std::vector<int>{1, 0, 1}));
    SaveLoad::PropertyTree duplicated;
    duplicated.push_back({"", valid});
    duplicated.push_back({"", valid});
    EXPECT_THROW((void)SaveLoad::deserialize_masks(duplicated, "masks"), std::runtime_error);
}
