#ifndef SHEAR_SPARSITY_REGISTRY_HPP
#define SHEAR_SPARSITY_REGISTRY_HPP

#include <memory>
#include <variant>

#include "details/common.hpp"
#include "details/constant.hpp"
#include "details/polynomial_decay.hpp"

namespace Shear::Sparsity::Details {
    template <class Descriptor>
    std::unique_ptr<Schedule> build_schedule(const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported schedule descriptor provided to build_schedule.");
        return nullptr;
    }

    inline std::unique_ptr<Schedule> build_schedule(const PolynomialDecayDescriptor& descriptor) {
        return std::make_unique<PolynomialDecaySchedule>(descriptor.options);
    }

    inline std::unique_ptr<Schedule> build_schedule(const ConstantSparsityDescriptor& descriptor) {
        return std::make_unique<ConstantSparsitySchedule>(descriptor.options);
    }

    template <class... DescriptorTypes>
    std::unique_ptr<Schedule> build_schedule(const std::variant<DescriptorTypes...>& descriptor) {
        return std::visit([](const auto& concrete) { return build_schedule(concrete); }, descriptor);
    }
}

#endif //SHEAR_SPARSITY_REGISTRY_HPP
