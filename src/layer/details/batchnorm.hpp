#ifndef SHEAR_BATCHNORM_HPP
#define SHEAR_BATCHNORM_HPP
#include <cstdint>

#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"

namespace Shear::Layer::Details {

    struct BatchNorm2dOptions {
        std::int64_t num_features{};
        double eps{1e-5};
        double momentum{0.1};
        bool affine{true};
        bool track_running_stats{true};
    };

    struct BatchNorm2dDescriptor {
        BatchNorm2dOptions options{};
        ::Shear::Activation::Descriptor activation{::Shear::Activation::Identity};
        ::Shear::Initialization::Descriptor initialization{::Shear::Initialization::Default};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const BatchNorm2dDescriptor& descriptor, std::size_t index)
    {
        const auto& options = descriptor.options;
        if (options.num_features <= 0) {
            throw std::invalid_argument("BatchNorm2d requires a positive number of features.");
        }

        auto torch_options = torch::nn::BatchNorm2dOptions(options.num_features)
                                 .eps(options.eps)
                                 .momentum(options.momentum)
                                 .affine(options.affine)
                                 .track_running_stats(options.track_running_stats);

        auto module = owner.register_module("batchnorm2d_" + std::to_string(index), torch::nn::BatchNorm2d(torch_options));

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.kind = ::Shear::Layer::Kind::Normalization;
        registered_layer.channels = {options.num_features, options.num_features, true};
        registered_layer.parameters[static_cast<std::size_t>(Slot::Weight)] = module->weight;
        registered_layer.parameters[static_cast<std::size_t>(Slot::Bias)] = module->bias;
        registered_layer.parameters[static_cast<std::size_t>(Slot::RunningMean)] = module->running_mean;
        registered_layer.parameters[static_cast<std::size_t>(Slot::RunningVar)] = module->running_var;
        registered_layer.forward = [module, options](torch::Tensor input, const EffectiveParameters& effective) {
            const auto& weight = effective.weight.defined() ? effective.weight : module->weight;
            const auto& bias = effective.bias.defined() ? effective.bias : module->bias;
            const bool use_batch_statistics = module->is_training() || !options.track_running_stats;
            return torch::batch_norm(input, weight, bias, module->running_mean, module->running_var,
                                     use_batch_statistics, options.momentum, options.eps,
                                     /*cudnn_enabled=*/true);
        };
        return registered_layer;
    }

}

#endif //SHEAR_BATCHNORM_HPP
