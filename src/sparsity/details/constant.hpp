#ifndef SHEAR_SPARSITY_CONSTANT_HPP
#define SHEAR_SPARSITY_CONSTANT_HPP
#include <cstdint>
#include <utility>

#include "common.hpp"

namespace Shear::Sparsity::Details {
    struct ConstantSparsityOptions {
        std::int64_t begin_step{0};
        double target_sparsity{0.5};
    };

    struct ConstantSparsityDescriptor {
        ConstantSparsityOptions options{};
    };

    inline void validate(const ConstantSparsityOptions& options)
    {
        if (options.begin_step < 0) {
            throw ::Shear::ScheduleConfigError("ConstantSparsity begin_step must be non-negative.");
        }
        require_fraction(options.target_sparsity, "ConstantSparsity target_sparsity");
    }

    // Step function: 0 before begin_step, target_sparsity from begin_step on.
    class ConstantSparsitySchedule final : public Schedule {
    public:
        explicit ConstantSparsitySchedule(ConstantSparsityOptions options) : options_(std::move(options))
        {
            validate(options_);
        }

        [[nodiscard]] double target(std::int64_t step) const override
        {
            return step < options_.begin_step ? 0.0 : options_.target_sparsity;
        }

        [[nodiscard]] std::int64_t begin_step() const noexcept override { return options_.begin_step; }
        [[nodiscard]] std::int64_t end_step() const noexcept override { return options_.begin_step; }
        [[nodiscard]] double final_sparsity() const noexcept override { return options_.target_sparsity; }

    private:
        ConstantSparsityOptions options_{};
    };
}

#endif //SHEAR_SPARSITY_CONSTANT_HPP
