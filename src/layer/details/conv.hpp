#ifndef SHEAR_CONV_HPP
#define SHEAR_CONV_HPP
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"

namespace Shear::Layer::Details {

    struct Conv2dOptions {
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::vector<std::int64_t> kernel_size{3, 3};
        std::vector<std::int64_t> stride{1, 1};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        std::int64_t groups{1};
        bool bias{true};
    };

    struct Conv2dDescriptor {
        Conv2dOptions options{};
        ::Shear::Activation::Descriptor activation{::Shear::Activation::Identity};
        ::Shear::Initialization::Descriptor initialization{::Shear::Initialization::Default};
    };

    // A 1x1 kernel over ungrouped channels mixes channels per pixel; a kernel with one group per channel never mixes them.
    [[nodiscard]] inline ::Shear::Layer::Kind classify(const Conv2dOptions& options) noexcept
    {
        const bool unit_kernel = !options.kernel_size.empty()
            && std::all_of(options.kernel_size.begin(), options.kernel_size.end(), [](std::int64_t extent) { return extent == 1; });
        if (unit_kernel && options.groups == 1) {
            return ::Shear::Layer::Kind::PointwiseConvolution;
        }
        if (options.groups > 1 && options.groups == options.in_channels && options.groups == options.out_channels) {
            return ::Shear::Layer::Kind::DepthwiseConvolution;
        }
        return ::Shear::Layer::Kind::Convolution;
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const Conv2dDescriptor& descriptor, std::size_t index)
    {
        const auto& options = descriptor.options;
        if (options.in_channels <= 0 || options.out_channels <= 0) {
            throw std::invalid_argument("Conv2d layers require positive channel counts.");
        }
        if (options.groups <= 0 || options.in_channels % options.groups != 0 || options.out_channels % options.groups != 0) {
            throw std::invalid_argument("Conv2d groups must divide both in_channels and out_channels.");
        }
        if (options.kernel_size.size() != 2) {
            throw std::invalid_argument("Conv2d kernel_size must list exactly two extents.");
        }

        auto torch_options = torch::nn::Conv2dOptions(options.in_channels, options.out_channels, options.kernel_size)
                                 .stride(options.stride)
                                 .padding(options.padding)
                                 .dilation(options.dilation)
                                 .groups(options.groups)
                                 .bias(options.bias);

        auto module = owner.register_module("conv2d_" + std::to_string(index), torch::nn::Conv2d(torch_options));
        ::Shear::Initialization::Details::apply_module_initialization(module, descriptor);

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.kind = classify(options);
        registered_layer.channels = {options.in_channels, options.out_channels, false, options.groups};
        registered_layer.parameters[static_cast<std::size_t>(Slot::Weight)] = module->weight;
        registered_layer.parameters[static_cast<std::size_t>(Slot::Bias)] = module->bias;
        registered_layer.forward = [module, options](torch::Tensor input, const EffectiveParameters& effective) {
            const auto& weight = effective.weight.defined() ? effective.weight : module->weight;
            const auto& bias = effective.bias.defined() ? effective.bias : module->bias;
            return torch::conv2d(input, weight, bias, options.stride, options.padding, options.dilation, options.groups);
        };
        return registered_layer;
    }

}

#endif //SHEAR_CONV_HPP
