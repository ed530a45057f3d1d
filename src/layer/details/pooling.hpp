#ifndef SHEAR_POOLING_HPP
#define SHEAR_POOLING_HPP
#include <cstdint>
#include <variant>
#include <vector>
#include <stdexcept>
#include <string>
#include <utility>
#include <type_traits>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Shear::Layer::Details {

    struct MaxPool2dOptions {
        std::vector<std::int64_t> kernel_size{2, 2};
        std::vector<std::int64_t> stride{};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        bool ceil_mode{false};
    };

    struct AvgPool2dOptions {
        std::vector<std::int64_t> kernel_size{2, 2};
        std::vector<std::int64_t> stride{};
        std::vector<std::int64_t> padding{0, 0};
        bool ceil_mode{false};
        bool count_include_pad{false};
    };

    struct AdaptiveAvgPool2dOptions {
        std::vector<std::int64_t> output_size{1, 1};
    };

    struct AdaptiveMaxPool2dOptions {
        std::vector<std::int64_t> output_size{1, 1};
    };

    using PoolingOptions = std::variant<MaxPool2dOptions,
                                        AvgPool2dOptions,
                                        AdaptiveAvgPool2dOptions,
                                        AdaptiveMaxPool2dOptions>;

    struct PoolingDescriptor {
        PoolingOptions options{};
        ::Shear::Activation::Descriptor activation{::Shear::Activation::Identity};
    };

    namespace Detail {
        template <class Holder>
        RegisteredLayer::ForwardFunction bind_holder_forward(Holder module)
        {
            return [module](torch::Tensor input, const EffectiveParameters&) mutable {
                return module->forward(std::move(input));
            };
        }
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const PoolingDescriptor& descriptor, std::size_t index)
    {
        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.kind = ::Shear::Layer::Kind::Other;
        registered_layer.channels.preserves_channels = true;

        std::visit(
            [&](const auto& options) {
                using OptionType = std::decay_t<decltype(options)>;

                if constexpr (std::is_same_v<OptionType, MaxPool2dOptions>) {
                    auto torch_options = torch::nn::MaxPool2dOptions(options.kernel_size).ceil_mode(options.ceil_mode);
                    if (!options.stride.empty()) {
                        torch_options.stride(options.stride);
                    }
                    if (!options.padding.empty()) {
                        torch_options.padding(options.padding);
                    }
                    if (!options.dilation.empty()) {
                        torch_options.dilation(options.dilation);
                    }

                    auto module = owner.register_module("maxpool2d_" + std::to_string(index),
                                                        torch::nn::MaxPool2d(torch_options));
                    registered_layer.module = to_shared_module_ptr(module);
                    registered_layer.forward = Detail::bind_holder_forward(module);
                } else if constexpr (std::is_same_v<OptionType, AvgPool2dOptions>) {
                    auto torch_options = torch::nn::AvgPool2dOptions(options.kernel_size)
                                              .ceil_mode(options.ceil_mode)
                                              .count_include_pad(options.count_include_pad);
                    if (!options.stride.empty()) {
                        torch_options.stride(options.stride);
                    }
                    if (!options.padding.empty()) {
                        torch_options.padding(options.padding);
                    }

                    auto module = owner.register_module("avgpool2d_" + std::to_string(index),
                                                        torch::nn::AvgPool2d(torch_options));
                    registered_layer.module = to_shared_module_ptr(module);
                    registered_layer.forward = Detail::bind_holder_forward(module);
                } else if constexpr (std::is_same_v<OptionType, AdaptiveAvgPool2dOptions>) {
                    auto module = owner.register_module("adaptive_avgpool2d_" + std::to_string(index),
                                                        torch::nn::AdaptiveAvgPool2d(options.output_size));
                    registered_layer.module = to_shared_module_ptr(module);
                    registered_layer.forward = Detail::bind_holder_forward(module);
                } else if constexpr (std::is_same_v<OptionType, AdaptiveMaxPool2dOptions>) {
                    auto module = owner.register_module("adaptive_maxpool2d_" + std::to_string(index),
                                                        torch::nn::AdaptiveMaxPool2d(options.output_size));
                    registered_layer.module = to_shared_module_ptr(module);
                    registered_layer.forward = Detail::bind_holder_forward(module);
                }
            },
            descriptor.options);

        if (!registered_layer.forward) {
            throw std::invalid_argument("Unsupported pooling descriptor provided.");
        }

        return registered_layer;
    }

}

#endif //SHEAR_POOLING_HPP
