#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "support.hpp"

using Shear::Surgery::LayerStatus;
using ShearTest::Slot;

namespace {
    Shear::Surgery::SurgeryOptions quiet(std::ostringstream& sink)
    {
        Shear::Surgery::SurgeryOptions options{};
        options.stream = &sink;
        options.monitor = false;
        return options;
    }

    const torch::Tensor& tensor(const Shear::LayerGraph& graph, const std::string& name, Slot slot)
    {
        return graph.layer(name).parameter(slot);
    }

    // expand (pw 3->8) -> dw (3x3, 8 groups) -> bn -> project (pw 8->4) -> head (3x3 conv 4->2)
    std::shared_ptr<Shear::LayerGraph> make_inverted_residual()
    {
        auto graph = std::make_shared<Shear::LayerGraph>();
        graph->add(Shear::Layer::Conv2d({.in_channels = 3, .out_channels = 8, .kernel_size = {1, 1}}, Shear::Activation::ReLU6), "expand");
        graph->add(Shear::Layer::Conv2d({.in_channels = 8, .out_channels = 8, .kernel_size = {3, 3}, .padding = {1, 1}, .groups = 8}), "dw");
        graph->add(Shear::Layer::BatchNorm2d({.num_features = 8}, Shear::Activation::ReLU), "bn");
        graph->add(Shear::Layer::Conv2d({.in_channels = 8, .out_channels = 4, .kernel_size = {1, 1}}), "project");
        graph->add(Shear::Layer::Conv2d({.in_channels = 4, .out_channels = 2, .kernel_size = {3, 3}, .padding = {1, 1}}), "head");
        return graph;
    }

    void expect_contracts_hold(const Shear::LayerGraph& graph)
    {
        EXPECT_NO_THROW(graph.validate_shapes());
        for (const auto index : graph.topological_order()) {
            const auto& consumer = graph.layer(index);
            auto upstream = graph.producer(index);
            while (upstream && !graph.layer(*upstream).channels.out_channels) {
                upstream = graph.producer(*upstream);
            }
            if (upstream && consumer.channels.in_channels) {
                EXPECT_EQ(*graph.layer(*upstream).channels.out_channels, *consumer.channels.in_channels)
                    << graph.name(*upstream) << " -> " << consumer.name;
            }
        }
    }
}

TEST(surgery, chain_scenario_keeps_indices_one_three_four_six)
{
    const auto graph = ShearTest::make_chain();
    ShearTest::set_channel_scores(*graph, "A", ShearTest::kScenarioScores);
    ShearTest::randomize_normalization(*graph, "bn");
    const auto mask = Shear::Mask::compute_mask(tensor(*graph, "A", Slot::Weight), 0.5);
    ASSERT_EQ(mask.to_string(), "[0,1,0,1,1,0,1,1]");

    std::ostringstream sink;
    const auto result = Shear::Surgery::apply_surgery(*graph, {{"A", mask}}, quiet(sink));
    const auto& reduced = *result.graph;
    const auto kept = ShearTest::indices({1, 3, 4, 6});

    EXPECT_EQ(reduced.layer("A").channels.out_channels, 4);
    EXPECT_EQ(reduced.layer("bn").channels.out_channels, 4);
    EXPECT_EQ(reduced.layer("B").channels.in_channels, 4);
    EXPECT_EQ(reduced.layer("B").channels.out_channels, 4);

    EXPECT_TRUE(torch::equal(tensor(reduced, "A", Slot::Weight), tensor(*graph, "A", Slot::Weight).index_select(0, kept)));
    EXPECT_TRUE(torch::equal(tensor(reduced, "A", Slot::Bias), tensor(*graph, "A", Slot::Bias).index_select(0, kept)));
    for (const auto slot : {Slot::Weight, Slot::Bias, Slot::RunningMean, Slot::RunningVar}) {
        EXPECT_TRUE(torch::equal(tensor(reduced, "bn", slot), tensor(*graph, "bn", slot).index_select(0, kept)))
            << Shear::Layer::Details::to_string(slot);
    }
    EXPECT_TRUE(torch::equal(tensor(reduced, "B", Slot::Weight), tensor(*graph, "B", Slot::Weight).index_select(1, kept)));
    EXPECT_TRUE(torch::equal(tensor(reduced, "B", Slot::Bias), tensor(*graph, "B", Slot::Bias)));

    ASSERT_EQ(result.report.layers.size(), 1U);
    const auto& entry = result.report.layers.front();
    EXPECT_EQ(entry.status, LayerStatus::Reduced);
    EXPECT_EQ(entry.channels_before, 8);
    EXPECT_EQ(entry.channels_after, 4);
    EXPECT_EQ(entry.consumers, (std::vector<std::string>{"bn", "B"}));
    EXPECT_LT(result.report.parameters_after, result.report.parameters_before);
    EXPECT_EQ(result.report.parameters_after, reduced.parameter_count());

    expect_contracts_hold(reduced);
}

TEST(surgery, original_graph_is_left_intact)
{
    const auto graph = ShearTest::make_chain();
    const auto before = tensor(*graph, "A", Slot::Weight).clone();

    std::ostringstream sink;
    const auto result = Shear::Surgery::apply_surgery(*graph, {{"A", ShearTest::mask_of({1, 0, 1, 0, 1, 0, 1, 0})}}, quiet(sink));

    EXPECT_EQ(graph->layer("A").channels.out_channels, 8);
    EXPECT_TRUE(torch::equal(tensor(*graph, "A", Slot::Weight), before));
    {
        torch::NoGradGuard no_grad{};
        tensor(*result.graph, "A", Slot::Weight).zero_();
    }
    EXPECT_TRUE(torch::equal(tensor(*graph, "A", Slot::Weight), before));
}

TEST(surgery, shape_contracts_hold_for_random_masks)
{
    const auto graph = make_inverted_residual();
    torch::manual_seed(7);
    for (int trial = 0; trial < 10; ++trial) {
        const auto expand = Shear::Mask::compute_mask(torch::randn({8, 3, 1, 1}), 0.1 * trial);
        const auto project = Shear::Mask::compute_mask(torch::randn({4, 8, 1, 1}), 0.08 * trial);

        std::ostringstream sink;
        const auto result = Shear::Surgery::apply_surgery(*graph, {{"expand", expand}, {"project", project}}, quiet(sink));
        const auto& reduced = *result.graph;

        EXPECT_EQ(reduced.layer("expand").channels.out_channels, expand.kept());
        EXPECT_EQ(reduced.layer("dw").channels.groups, expand.kept());
        if (expand.kept() > 1) {
            EXPECT_EQ(reduced.layer("dw").kind, Shear::Layer::Kind::DepthwiseConvolution);
        }
        EXPECT_EQ(reduced.layer("project").channels.in_channels, expand.kept());
        EXPECT_EQ(reduced.layer("project").channels.out_channels, project.kept());
        EXPECT_EQ(reduced.layer("head").channels.in_channels, project.kept());
        expect_contracts_hold(reduced);
        EXPECT_NO_THROW((void)reduced.forward(torch::randn({1, 3, 6, 6})));
    }
}

TEST(surgery, all_keep_mask_is_unchanged)
{
    const auto graph = ShearTest::make_chain();
    std::ostringstream sink;
    const auto result = Shear::Surgery::apply_surgery(*graph, {{"A", Shear::Mask::ChannelMask::all_keep(8)}}, quiet(sink));

    ASSERT_EQ(result.report.layers.size(), 1U);
    EXPECT_EQ(result.report.layers.front().status, LayerStatus::Unchanged);
    EXPECT_EQ(result.report.parameters_after, result.report.parameters_before);
    EXPECT_TRUE(torch::equal(tensor(*result.graph, "B", Slot::Weight), tensor(*graph, "B", Slot::Weight)));
}

TEST(surgery, unresolved_layer_is_skipped_and_masked_in_place)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d({.in_channels = 3, .out_channels = 4, .kernel_size = {1, 1}}), "A");
    graph.add(Shear::Layer::Flatten(), "flatten");
    graph.add(Shear::Layer::FC({4 * 2 * 2, 3, true}), "head");
    const auto mask = ShearTest::mask_of({1, 0, 1, 0});

    std::ostringstream sink;
    const auto result = Shear::Surgery::apply_surgery(graph, {{"A", mask}}, quiet(sink));

    ASSERT_EQ(result.report.layers.size(), 1U);
    EXPECT_EQ(result.report.layers.front().status, LayerStatus::Skipped);
    EXPECT_FALSE(result.report.layers.front().reason.empty());
    EXPECT_EQ(result.report.skipped(), 1U);
    EXPECT_EQ(result.graph->layer("A").channels.out_channels, 4);

    const auto& weight = tensor(*result.graph, "A", Slot::Weight);
    EXPECT_EQ(weight[1].abs().sum().item<double>(), 0.0);
    EXPECT_EQ(weight[3].abs().sum().item<double>(), 0.0);
    EXPECT_TRUE(torch::equal(weight[0], tensor(graph, "A", Slot::Weight)[0]));
    EXPECT_EQ(tensor(*result.graph, "A", Slot::Bias)[1].item<double>(), 0.0);
    EXPECT_NE(sink.str().find("skipped"), std::string::npos);

    auto strict = quiet(sink);
    strict.strict = true;
    EXPECT_THROW((void)Shear::Surgery::apply_surgery(graph, {{"A", mask}}, strict), Shear::DependencyUnresolvedError);
}

TEST(surgery, rejects_invalid_masks)
{
    const auto graph = ShearTest::make_chain();
    std::ostringstream sink;
    EXPECT_THROW((void)Shear::Surgery::apply_surgery(*graph, {{"missing", Shear::Mask::ChannelMask::all_keep(8)}}, quiet(sink)),
                 std::invalid_argument);
    EXPECT_THROW((void)Shear::Surgery::apply_surgery(*graph, {{"B", Shear::Mask::ChannelMask::all_keep(4)}}, quiet(sink)),
                 std::invalid_argument);
    EXPECT_THROW((void)Shear::Surgery::apply_surgery(*graph, {{"A", Shear::Mask::ChannelMask::all_keep(6)}}, quiet(sink)),
                 Shear::ShapeMismatchError);
}

TEST(surgery, all_drop_mask_is_rejected_with_the_layer_name)
{
    const auto graph = ShearTest::make_chain();
    std::ostringstream sink;
    const Shear::Mask::ChannelMask empty(std::vector<bool>(8, false));
    try {
        (void)Shear::Surgery::apply_surgery(*graph, {{"A", empty}}, quiet(sink));
        FAIL() << "expected MaskDegenerateError";
    } catch (const Shear::MaskDegenerateError& error) {
        EXPECT_EQ(error.layer(), "A");
        EXPECT_EQ(error.channels(), 8);
        EXPECT_EQ(error.requested_drop(), 8);
        EXPECT_NE(std::string(error.what()).find("'A'"), std::string::npos);
    }
    EXPECT_THROW((void)Shear::Mask::apply_masks(*graph, {{"A", empty}}), Shear::MaskDegenerateError);

    namespace SaveLoad = Shear::Common::SaveLoad;
    SaveLoad::PropertyTree entry;
    entry.put("name", "A");
    entry.add_child("keep", SaveLoad::Detail::write_array(std::vector<int>(8, 0)));
    SaveLoad::PropertyTree stored;
    stored.push_back({"", entry});
    const auto loaded = SaveLoad::deserialize_masks(stored, "stored masks");
    ASSERT_EQ(loaded.at("A").kept(), 0);
    EXPECT_THROW((void)Shear::Surgery::apply_surgery(*graph, loaded, quiet(sink)), Shear::MaskDegenerateError);
}

TEST(surgery, inconsistent_input_graph_aborts)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d({.in_channels = 3, .out_channels = 8, .kernel_size = {1, 1}}), "A");
    graph.add(Shear::Layer::Conv2d({.in_channels = 6, .out_channels = 4, .kernel_size = {1, 1}}), "B");

    std::ostringstream sink;
    EXPECT_THROW((void)Shear::Surgery::apply_surgery(graph, {{"A", ShearTest::mask_of({1, 1, 0, 1, 1, 0, 1, 1})}}, quiet(sink)),
                 Shear::ShapeMismatchError);
}

TEST(surgery, report_lists_counts)
{
    const auto graph = ShearTest::make_chain();
    std::ostringstream sink;
    auto options = quiet(sink);
    options.monitor = true;
    const auto result = Shear::Surgery::apply_surgery(*graph, {{"A", ShearTest::mask_of({1, 1, 1, 1, 0, 0, 0, 0})}}, options);

    const auto text = result.report.to_string();
    EXPECT_NE(text.find("reduced"), std::string::npos);
    EXPECT_NE(text.find("8 ->"), std::string::npos);
    EXPECT_GT(result.report.reduction(), 0.0);
    EXPECT_NE(sink.str().find("Surgery report"), std::string::npos);
}
