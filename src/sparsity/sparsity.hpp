#ifndef SHEAR_SPARSITY_HPP
#define SHEAR_SPARSITY_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/constant.hpp"
#include "details/polynomial_decay.hpp"
#include "registry.hpp"

namespace Shear::Sparsity {
    using Schedule = Details::Schedule;

    using PolynomialDecayOptions = Details::PolynomialDecayOptions;
    using PolynomialDecayDescriptor = Details::PolynomialDecayDescriptor;

    using ConstantSparsityOptions = Details::ConstantSparsityOptions;
    using ConstantSparsityDescriptor = Details::ConstantSparsityDescriptor;

    using Descriptor = std::variant<PolynomialDecayDescriptor, ConstantSparsityDescriptor>;

    [[nodiscard]] constexpr auto PolynomialDecay(const PolynomialDecayOptions& options = {}) noexcept
        -> PolynomialDecayDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto ConstantSparsity(const ConstantSparsityOptions& options = {}) noexcept
        -> ConstantSparsityDescriptor {
        return {options};
    }
}

#endif //SHEAR_SPARSITY_HPP
