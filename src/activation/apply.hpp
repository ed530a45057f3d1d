#ifndef SHEAR_ACTIVATION_APPLY_HPP
#define SHEAR_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "activation.hpp"

namespace Shear::Activation::Details {
    inline torch::Tensor apply(::Shear::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Shear::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Shear::Activation::Type::ReLU6:
                return torch::clamp(std::move(input), 0.0, 6.0);
            case ::Shear::Activation::Type::LeakyReLU:
                return torch::leaky_relu(std::move(input));
            case ::Shear::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Shear::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Shear::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Shear::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Shear::Activation::Type::Identity:
            default:
                return input;
        }
    }

    inline std::string to_string(::Shear::Activation::Type type) {
        switch (type) {
            case ::Shear::Activation::Type::ReLU: return "relu";
            case ::Shear::Activation::Type::ReLU6: return "relu6";
            case ::Shear::Activation::Type::LeakyReLU: return "leaky_relu";
            case ::Shear::Activation::Type::Sigmoid: return "sigmoid";
            case ::Shear::Activation::Type::Tanh: return "tanh";
            case ::Shear::Activation::Type::SiLU: return "silu";
            case ::Shear::Activation::Type::GeLU: return "gelu";
            case ::Shear::Activation::Type::Identity:
            default: return "identity";
        }
    }

    inline ::Shear::Activation::Type from_string(const std::string& value) {
        if (value == "identity") return ::Shear::Activation::Type::Identity;
        if (value == "relu") return ::Shear::Activation::Type::ReLU;
        if (value == "relu6") return ::Shear::Activation::Type::ReLU6;
        if (value == "leaky_relu") return ::Shear::Activation::Type::LeakyReLU;
        if (value == "sigmoid") return ::Shear::Activation::Type::Sigmoid;
        if (value == "tanh") return ::Shear::Activation::Type::Tanh;
        if (value == "silu") return ::Shear::Activation::Type::SiLU;
        if (value == "gelu") return ::Shear::Activation::Type::GeLU;
        throw std::invalid_argument("Unknown activation '" + value + "'.");
    }
}
#endif // SHEAR_ACTIVATION_APPLY_HPP
