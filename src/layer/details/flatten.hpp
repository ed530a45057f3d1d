#ifndef SHEAR_FLATTEN_HPP
#define SHEAR_FLATTEN_HPP
#include <cstdint>
#include <utility>


#include <torch/torch.h>
#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Shear::Layer::Details {

    struct FlattenOptions {
        std::int64_t start_dim{1};
        std::int64_t end_dim{-1};
    };

    struct FlattenDescriptor {
        FlattenOptions options{};
        ::Shear::Activation::Descriptor activation{::Shear::Activation::Identity};
    };

    // Flatten interleaves channels with spatial positions, so channel indices do not survive it.
    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FlattenDescriptor& descriptor, std::size_t index)
    {
        const auto torch_options = torch::nn::FlattenOptions()
                                      .start_dim(descriptor.options.start_dim)
                                      .end_dim(descriptor.options.end_dim);
        auto module = owner.register_module("flatten_" + std::to_string(index), torch::nn::Flatten(torch_options));

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.kind = ::Shear::Layer::Kind::Other;
        registered_layer.channels.preserves_channels = false;
        registered_layer.forward = [module](torch::Tensor input, const EffectiveParameters&) mutable {
            return module->forward(std::move(input));
        };
        return registered_layer;
    }

}

#endif //SHEAR_FLATTEN_HPP
