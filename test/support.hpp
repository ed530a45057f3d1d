#ifndef SHEAR_TEST_SUPPORT_HPP
#define SHEAR_TEST_SUPPORT_HPP

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../include/Shear.h"

namespace ShearTest {
    using Slot = Shear::Layer::Details::Slot;

    inline const std::vector<double> kScenarioScores{0.1, 0.9, 0.05, 0.3, 0.7, 0.01, 0.5, 0.2};

    // A (pointwise 3->8) -> bn (8) -> B (3x3 conv 8->4)
    inline std::shared_ptr<Shear::LayerGraph> make_chain(Shear::Activation::Descriptor activation = Shear::Activation::ReLU)
    {
        auto graph = std::make_shared<Shear::LayerGraph>();
        graph->add(Shear::Layer::Conv2d({.in_channels = 3, .out_channels = 8, .kernel_size = {1, 1}}), "A");
        graph->add(Shear::Layer::BatchNorm2d({.num_features = 8}, activation), "bn");
        graph->add(Shear::Layer::Conv2d({.in_channels = 8, .out_channels = 4, .kernel_size = {3, 3}, .padding = {1, 1}}), "B");
        return graph;
    }

    // Channel c of a 1x1 convolution gets a single non-zero weight equal to scores[c], so its L1 norm is scores[c].
    inline void set_channel_scores(const Shear::LayerGraph& graph, const std::string& name, const std::vector<double>& scores)
    {
        torch::NoGradGuard no_grad{};
        const auto& weight = graph.layer(name).parameter(Slot::Weight);
        weight.zero_();
        for (std::size_t channel = 0; channel < scores.size(); ++channel) {
            weight.index_put_({static_cast<std::int64_t>(channel), 0, 0, 0}, scores[channel]);
        }
    }

    // Non-trivial statistics so eval-mode normalization is not the identity.
    inline void randomize_normalization(const Shear::LayerGraph& graph, const std::string& name)
    {
        torch::NoGradGuard no_grad{};
        const auto& layer = graph.layer(name);
        layer.parameter(Slot::Weight).uniform_(0.5, 1.5);
        layer.parameter(Slot::Bias).uniform_(-0.2, 0.2);
        layer.parameter(Slot::RunningMean).uniform_(-0.5, 0.5);
        layer.parameter(Slot::RunningVar).uniform_(0.5, 1.5);
    }

    inline Shear::Mask::ChannelMask mask_of(const std::vector<int>& values)
    {
        std::vector<bool> keep{};
        keep.reserve(values.size());
        for (const int value : values) {
            keep.push_back(value != 0);
        }
        return Shear::Mask::ChannelMask(std::move(keep));
    }

    inline torch::Tensor indices(const std::vector<std::int64_t>& values)
    {
        return torch::tensor(values, torch::TensorOptions().dtype(torch::kLong));
    }
}

#endif // SHEAR_TEST_SUPPORT_HPP
