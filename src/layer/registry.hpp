#ifndef SHEAR_LAYER_REGISTRY_HPP
#define SHEAR_LAYER_REGISTRY_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"

namespace Shear::Layer {
    // Structural category of a layer. Decided from kernel shape and grouping, never from names.
    enum class Kind {
        PointwiseConvolution,
        DepthwiseConvolution,
        Convolution,
        Normalization,
        Dense,
        Other,
    };

    [[nodiscard]] inline const char* to_string(Kind kind) noexcept
    {
        switch (kind) {
            case Kind::PointwiseConvolution: return "pointwise_conv";
            case Kind::DepthwiseConvolution: return "depthwise_conv";
            case Kind::Convolution: return "conv";
            case Kind::Normalization: return "normalization";
            case Kind::Dense: return "dense";
            case Kind::Other:
            default: return "other";
        }
    }
}

namespace Shear::Layer::Details {
    template <class Impl>
    [[nodiscard]] inline std::shared_ptr<torch::nn::Module>
    to_shared_module_ptr(const torch::nn::ModuleHolder<Impl>& holder)
    {
        static_assert(std::is_base_of_v<torch::nn::Module, Impl>, "ModuleHolder implementation must derive from torch::nn::Module.");
        return std::static_pointer_cast<torch::nn::Module>(holder.ptr());
    }

    enum class Slot : std::uint8_t {
        Weight,
        Bias,
        RunningMean,
        RunningVar,
    };

    inline constexpr std::size_t kSlotCount = 4;

    [[nodiscard]] inline const char* to_string(Slot slot) noexcept
    {
        switch (slot) {
            case Slot::Weight: return "weight";
            case Slot::Bias: return "bias";
            case Slot::RunningMean: return "running_mean";
            case Slot::RunningVar: return "running_var";
        }
        return "unknown";
    }

    // Tensors used in place of the stored weight/bias for one forward call. Undefined means "use stored".
    struct EffectiveParameters {
        torch::Tensor weight{};
        torch::Tensor bias{};

        [[nodiscard]] bool empty() const noexcept { return !weight.defined() && !bias.defined(); }
    };

    struct ChannelContract {
        std::optional<std::int64_t> in_channels{};
        std::optional<std::int64_t> out_channels{};
        bool preserves_channels{false};
        std::int64_t groups{1};
    };

    struct RegisteredLayer {
        using ForwardFunction = std::function<torch::Tensor(torch::Tensor, const EffectiveParameters&)>;

        ForwardFunction forward{};
        ::Shear::Activation::Type activation{::Shear::Activation::Type::Identity};
        std::shared_ptr<torch::nn::Module> module{};
        std::string name{};
        ::Shear::Layer::Kind kind{::Shear::Layer::Kind::Other};
        ChannelContract channels{};
        // Handles share their TensorImpl with the module members, so set_data() on either is visible to both.
        std::array<torch::Tensor, kSlotCount> parameters{};

        [[nodiscard]] bool has_parameter(Slot slot) const noexcept
        {
            return parameters[static_cast<std::size_t>(slot)].defined();
        }

        [[nodiscard]] const torch::Tensor& parameter(Slot slot) const
        {
            const auto& tensor = parameters[static_cast<std::size_t>(slot)];
            if (!tensor.defined()) {
                throw std::out_of_range("Layer '" + name + "' has no '" + to_string(slot) + "' tensor.");
            }
            return tensor;
        }

        [[nodiscard]] torch::Tensor run(torch::Tensor input, const EffectiveParameters& effective = {}) const
        {
            if (!forward) {
                throw std::logic_error("Attempted to invoke an empty forward binding on layer '" + name + "'.");
            }
            return ::Shear::Activation::Details::apply(activation, forward(std::move(input), effective));
        }

        [[nodiscard]] std::int64_t parameter_count() const
        {
            std::int64_t total = 0;
            if (module) {
                for (const auto& tensor : module->parameters()) {
                    total += tensor.numel();
                }
            }
            return total;
        }
    };

    template <class Owner, class Descriptor>
    RegisteredLayer build_registered_layer(Owner&, const Descriptor&, std::size_t) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported layer descriptor provided to build_registered_layer.");
        return {};
    }

    template <class Owner, class... DescriptorTypes>
    RegisteredLayer build_registered_layer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor, std::size_t index) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_registered_layer(owner, concrete_descriptor, index);
            },
            descriptor);
    }
}
#endif // SHEAR_LAYER_REGISTRY_HPP
