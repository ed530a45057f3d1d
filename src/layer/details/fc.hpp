#ifndef SHEAR_FC_HPP
#define SHEAR_FC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"


namespace Shear::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Shear::Activation::Descriptor activation{::Shear::Activation::Identity};
        ::Shear::Initialization::Descriptor initialization{::Shear::Initialization::Default};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FCDescriptor& descriptor, std::size_t index)
    {
        if (descriptor.options.in_features <= 0 || descriptor.options.out_features <= 0) {
            throw std::invalid_argument("Fully connected layers require positive in/out features.");
        }

        auto options = torch::nn::LinearOptions(descriptor.options.in_features, descriptor.options.out_features)
                            .bias(descriptor.options.bias);
        auto module = owner.register_module("fc_" + std::to_string(index), torch::nn::Linear(options));
        ::Shear::Initialization::Details::apply_module_initialization(module, descriptor);

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.kind = ::Shear::Layer::Kind::Dense;
        registered_layer.channels = {descriptor.options.in_features, descriptor.options.out_features, false};
        registered_layer.parameters[static_cast<std::size_t>(Slot::Weight)] = module->weight;
        registered_layer.parameters[static_cast<std::size_t>(Slot::Bias)] = module->bias;
        registered_layer.forward = [module](torch::Tensor input, const EffectiveParameters& effective) {
            const auto& weight = effective.weight.defined() ? effective.weight : module->weight;
            const auto& bias = effective.bias.defined() ? effective.bias : module->bias;
            return torch::linear(input, weight, bias);
        };
        return registered_layer;
    }
}

#endif //SHEAR_FC_HPP
