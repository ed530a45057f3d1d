#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "support.hpp"

using Shear::Dependency::DependencyEdge;
using Shear::Dependency::DepthwisePolicy;
using ShearTest::Slot;

namespace {
    Shear::Layer::Conv2dOptions pointwise(std::int64_t in, std::int64_t out)
    {
        return {.in_channels = in, .out_channels = out, .kernel_size = {1, 1}};
    }

    bool has_edge(const Shear::LayerGraph& graph,
                  const std::vector<DependencyEdge>& edges,
                  const std::string& consumer,
                  Slot slot,
                  std::int64_t axis)
    {
        const auto index = graph.index_of(consumer);
        return std::any_of(edges.begin(), edges.end(), [&](const DependencyEdge& edge) {
            return edge.consumer == index && edge.slot == slot && edge.axis == axis;
        });
    }

    Shear::LinkSpec link(const Shear::Port& source, const Shear::Port& target) { return Shear::LinkSpec{source, target}; }
}

TEST(dependency, chain_couples_normalization_and_next_convolution)
{
    const auto graph = ShearTest::make_chain();
    const auto edges = Shear::Dependency::extract_dependencies(*graph, "A");

    ASSERT_EQ(edges.size(), 5U);
    EXPECT_TRUE(has_edge(*graph, edges, "bn", Slot::Weight, 0));
    EXPECT_TRUE(has_edge(*graph, edges, "bn", Slot::Bias, 0));
    EXPECT_TRUE(has_edge(*graph, edges, "bn", Slot::RunningMean, 0));
    EXPECT_TRUE(has_edge(*graph, edges, "bn", Slot::RunningVar, 0));
    EXPECT_TRUE(has_edge(*graph, edges, "B", Slot::Weight, 1));
    for (const auto& edge : edges) {
        EXPECT_EQ(edge.producer, graph->index_of("A"));
        EXPECT_EQ(edge.channels, 8);
    }
}

TEST(dependency, walk_passes_through_pooling)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8), Shear::Activation::ReLU), "A");
    graph.add(Shear::Layer::MaxPool2d({.kernel_size = {2, 2}}), "pool");
    graph.add(Shear::Layer::Conv2d({.in_channels = 8, .out_channels = 4, .kernel_size = {3, 3}}), "B");

    const auto edges = Shear::Dependency::extract_dependencies(graph, "A");
    ASSERT_EQ(edges.size(), 1U);
    EXPECT_TRUE(has_edge(graph, edges, "B", Slot::Weight, 1));
}

TEST(dependency, depthwise_convolution_propagates_channel_identity)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "expand");
    graph.add(Shear::Layer::Conv2d({.in_channels = 8, .out_channels = 8, .kernel_size = {3, 3}, .padding = {1, 1}, .groups = 8}), "dw");
    graph.add(Shear::Layer::BatchNorm2d({.num_features = 8}, Shear::Activation::ReLU6), "bn");
    graph.add(Shear::Layer::Conv2d(pointwise(8, 4)), "project");

    EXPECT_EQ(graph.layer("dw").kind, Shear::Layer::Kind::DepthwiseConvolution);

    const auto edges = Shear::Dependency::extract_dependencies(graph, "expand");
    ASSERT_EQ(edges.size(), 7U);
    EXPECT_TRUE(has_edge(graph, edges, "dw", Slot::Weight, 0));
    EXPECT_TRUE(has_edge(graph, edges, "dw", Slot::Bias, 0));
    EXPECT_TRUE(has_edge(graph, edges, "bn", Slot::RunningVar, 0));
    EXPECT_TRUE(has_edge(graph, edges, "project", Slot::Weight, 1));

    EXPECT_THROW((void)Shear::Dependency::extract_dependencies(graph, "expand", {.depthwise = DepthwisePolicy::Stop}),
                 Shear::DependencyUnresolvedError);
}

TEST(dependency, spatial_reduce_reaches_dense_input_features)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
    graph.add(Shear::Layer::Reduce({.op = Shear::Layer::ReduceOp::Mean, .dims = {2, 3}}), "gap");
    graph.add(Shear::Layer::FC({8, 10, true}), "head");

    const auto edges = Shear::Dependency::extract_dependencies(graph, "A");
    ASSERT_EQ(edges.size(), 1U);
    EXPECT_TRUE(has_edge(graph, edges, "head", Slot::Weight, 1));
}

TEST(dependency, channel_reducing_layers_are_unresolved)
{
    {
        Shear::LayerGraph graph;
        graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
        graph.add(Shear::Layer::Flatten(), "flatten");
        graph.add(Shear::Layer::FC({8 * 4 * 4, 10, true}), "head");
        EXPECT_THROW((void)Shear::Dependency::extract_dependencies(graph, "A"), Shear::DependencyUnresolvedError);
    }
    {
        Shear::LayerGraph graph;
        graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
        graph.add(Shear::Layer::Reduce({.op = Shear::Layer::ReduceOp::Sum, .dims = {1}, .keep_dim = true}), "collapse");
        graph.add(Shear::Layer::Conv2d(pointwise(1, 4)), "B");
        EXPECT_THROW((void)Shear::Dependency::extract_dependencies(graph, "A"), Shear::DependencyUnresolvedError);
    }
}

TEST(dependency, grouped_convolution_is_unresolved)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
    graph.add(Shear::Layer::Conv2d({.in_channels = 8, .out_channels = 8, .kernel_size = {3, 3}, .groups = 2}), "grouped");

    EXPECT_EQ(graph.layer("grouped").kind, Shear::Layer::Kind::Convolution);
    try {
        (void)Shear::Dependency::extract_dependencies(graph, "A");
        FAIL() << "expected DependencyUnresolvedError";
    } catch (const Shear::DependencyUnresolvedError& error) {
        EXPECT_EQ(error.layer(), "A");
        EXPECT_NE(std::string(error.what()).find("grouped"), std::string::npos);
    }
}

TEST(dependency, graph_output_before_consumer_is_unresolved)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
    graph.add(Shear::Layer::BatchNorm2d({.num_features = 8}), "bn");
    EXPECT_THROW((void)Shear::Dependency::extract_dependencies(graph, "A"), Shear::DependencyUnresolvedError);
}

TEST(dependency, fan_out_records_every_consumer)
{
    using Shear::Port;
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
    graph.add(Shear::Layer::Conv2d(pointwise(8, 4)), "left");
    graph.add(Shear::Layer::Conv2d(pointwise(8, 2)), "right");
    graph.links({
        link(Port::Input(), Port::Module("A")),
        link(Port::Module("A"), Port::Module("left")),
        link(Port::Module("A"), Port::Module("right")),
        link(Port::Module("left"), Port::Output("@output[0]")),
        link(Port::Module("right"), Port::Output("@output[1]")),
    });

    const auto edges = Shear::Dependency::extract_dependencies(graph, "A");
    ASSERT_EQ(edges.size(), 2U);
    EXPECT_TRUE(has_edge(graph, edges, "left", Slot::Weight, 1));
    EXPECT_TRUE(has_edge(graph, edges, "right", Slot::Weight, 1));
}

TEST(dependency, inconsistent_consumer_is_a_shape_mismatch)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
    graph.add(Shear::Layer::Conv2d({.in_channels = 6, .out_channels = 4, .kernel_size = {3, 3}}), "B");

    try {
        (void)Shear::Dependency::extract_dependencies(graph, "A");
        FAIL() << "expected ShapeMismatchError";
    } catch (const Shear::ShapeMismatchError& error) {
        EXPECT_EQ(error.producer(), "A");
        EXPECT_EQ(error.consumer(), "B");
        EXPECT_EQ(error.expected(), 8);
        EXPECT_EQ(error.actual(), 6);
    }
}

TEST(dependency, only_pointwise_roots_are_accepted)
{
    const auto graph = ShearTest::make_chain();
    EXPECT_THROW((void)Shear::Dependency::extract_dependencies(*graph, "B"), std::invalid_argument);
    EXPECT_THROW((void)Shear::Dependency::extract_dependencies(*graph, "missing"), std::invalid_argument);
}

TEST(dependency, extract_all_reports_failures_per_root)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
    graph.add(Shear::Layer::Conv2d(pointwise(8, 8)), "B");
    graph.add(Shear::Layer::Conv2d(pointwise(8, 4)), "C");
    graph.add(Shear::Layer::Conv2d(pointwise(4, 4)), "D");

    const auto results = Shear::Dependency::extract_all(graph, {"A", "B", "D"});
    ASSERT_EQ(results.size(), 3U);
    EXPECT_TRUE(results[0].ok());
    EXPECT_TRUE(results[1].ok());
    EXPECT_FALSE(results[2].ok());
    EXPECT_EQ(results[0].layer, "A");
    EXPECT_TRUE(has_edge(graph, results[0].edges, "B", Slot::Weight, 1));
    EXPECT_TRUE(has_edge(graph, results[1].edges, "C", Slot::Weight, 1));
    EXPECT_NE(results[2].message.find("'D'"), std::string::npos);
    EXPECT_THROW(results[2].rethrow(), Shear::DependencyUnresolvedError);
}

TEST(dependency, extract_all_matches_serial_walks_on_many_roots)
{
    Shear::LayerGraph graph;
    std::vector<std::string> roots{};
    std::int64_t channels = 3;
    for (int index = 0; index < 12; ++index) {
        const auto name = "pw" + std::to_string(index);
        graph.add(Shear::Layer::Conv2d(pointwise(channels, 6)), name);
        channels = 6;
        roots.push_back(name);
    }
    graph.add(Shear::Layer::Conv2d({.in_channels = 6, .out_channels = 2, .kernel_size = {3, 3}}), "head");

    Shear::Dependency::ExtractOptions pooled{};
    pooled.max_workers = 3;
    Shear::Dependency::ExtractOptions serial{};
    serial.max_workers = 1;

    const auto concurrent = Shear::Dependency::extract_all(graph, roots, pooled);
    const auto sequential = Shear::Dependency::extract_all(graph, roots, serial);
    ASSERT_EQ(concurrent.size(), roots.size());
    for (std::size_t index = 0; index < roots.size(); ++index) {
        EXPECT_EQ(concurrent[index].layer, roots[index]);
        EXPECT_TRUE(concurrent[index].ok()) << concurrent[index].message;
        ASSERT_EQ(concurrent[index].edges.size(), sequential[index].edges.size());
        ASSERT_EQ(concurrent[index].edges.size(), 1U);
        EXPECT_EQ(concurrent[index].edges.front().consumer, sequential[index].edges.front().consumer);
        EXPECT_EQ(concurrent[index].edges.front().consumer, index + 1);
    }

    auto with_unknown = roots;
    with_unknown.push_back("missing");
    EXPECT_THROW((void)Shear::Dependency::extract_all(graph, with_unknown, pooled), std::invalid_argument);
}

TEST(dependency, extract_all_requires_current_routing)
{
    Shear::LayerGraph graph;
    graph.add(Shear::Layer::Conv2d(pointwise(3, 8)), "A");
    graph.add(Shear::Layer::Conv2d(pointwise(8, 4)), "B");
    graph.links({
        link(Shear::Port::Input(), Shear::Port::Module("A")),
        link(Shear::Port::Module("A"), Shear::Port::Module("B")),
        link(Shear::Port::Module("B"), Shear::Port::Output()),
    });
    EXPECT_NO_THROW(graph.require_routing());

    graph.add(Shear::Layer::Conv2d(pointwise(4, 4)), "C");
    EXPECT_THROW(graph.require_routing(), std::logic_error);
    EXPECT_THROW((void)Shear::Dependency::extract_all(graph, {"A"}), std::logic_error);
}
