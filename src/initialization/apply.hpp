#ifndef SHEAR_INITIALIZATION_APPLY_HPP
#define SHEAR_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include <stdexcept>
#include <string>

#include "initialization.hpp"

namespace Shear::Initialization::Details {
    namespace detail {
        template <class Module>
        inline void zero_bias_if_present(const Module& module) {
            if constexpr (requires { module->bias; }) {
                if (module->bias.defined()) {
                    torch::nn::init::zeros_(module->bias);
                }
            }
        }
    }  // namespace detail

    template <class Module, class Descriptor>
    inline void apply_module_initialization(const Module& module, const Descriptor& descriptor) {
        torch::NoGradGuard no_grad{};
        switch (descriptor.initialization.type) {
            case ::Shear::Initialization::Type::XavierNormal:
                torch::nn::init::xavier_normal_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Shear::Initialization::Type::XavierUniform:
                torch::nn::init::xavier_uniform_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Shear::Initialization::Type::KaimingNormal:
                torch::nn::init::kaiming_normal_(module->weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                detail::zero_bias_if_present(module);
                break;
            case ::Shear::Initialization::Type::KaimingUniform:
                torch::nn::init::kaiming_uniform_(module->weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                detail::zero_bias_if_present(module);
                break;
            case ::Shear::Initialization::Type::ZeroBias:
                detail::zero_bias_if_present(module);
                break;
            case ::Shear::Initialization::Type::Default:
            default:
                break;
        }
    }

    inline std::string to_string(::Shear::Initialization::Type type) {
        switch (type) {
            case ::Shear::Initialization::Type::XavierNormal: return "xavier_normal";
            case ::Shear::Initialization::Type::XavierUniform: return "xavier_uniform";
            case ::Shear::Initialization::Type::KaimingNormal: return "kaiming_normal";
            case ::Shear::Initialization::Type::KaimingUniform: return "kaiming_uniform";
            case ::Shear::Initialization::Type::ZeroBias: return "zero_bias";
            case ::Shear::Initialization::Type::Default:
            default: return "default";
        }
    }

    inline ::Shear::Initialization::Type from_string(const std::string& value) {
        if (value == "default") return ::Shear::Initialization::Type::Default;
        if (value == "xavier_normal") return ::Shear::Initialization::Type::XavierNormal;
        if (value == "xavier_uniform") return ::Shear::Initialization::Type::XavierUniform;
        if (value == "kaiming_normal") return ::Shear::Initialization::Type::KaimingNormal;
        if (value == "kaiming_uniform") return ::Shear::Initialization::Type::KaimingUniform;
        if (value == "zero_bias") return ::Shear::Initialization::Type::ZeroBias;
        throw std::invalid_argument("Unknown initialization '" + value + "'.");
    }
}
#endif // SHEAR_INITIALIZATION_APPLY_HPP
