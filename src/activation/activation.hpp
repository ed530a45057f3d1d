#ifndef SHEAR_ACTIVATION_HPP
#define SHEAR_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Shear::Activation {
    enum class Type {
        Identity,
        ReLU,
        ReLU6,
        LeakyReLU,
        Sigmoid,
        Tanh,
        SiLU,
        GeLU,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor ReLU6{Type::ReLU6};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor SiLU{Type::SiLU};
    inline constexpr Descriptor GeLU{Type::GeLU};
}

#endif //SHEAR_ACTIVATION_HPP
