#ifndef SHEAR_SPARSITY_POLYNOMIAL_DECAY_HPP
#define SHEAR_SPARSITY_POLYNOMIAL_DECAY_HPP
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
// "To prune, or not to prune" (gradual pruning schedule) https://arxiv.org/abs/1710.01878

#include "common.hpp"

namespace Shear::Sparsity::Details {
    struct PolynomialDecayOptions {
        std::int64_t begin_step{0};
        std::int64_t end_step{1000};
        double initial_sparsity{0.0};
        double final_sparsity{0.5};
        double power{3.0};
    };

    struct PolynomialDecayDescriptor {
        PolynomialDecayOptions options{};
    };

    inline void validate(const PolynomialDecayOptions& options)
    {
        if (options.begin_step < 0) {
            throw ::Shear::ScheduleConfigError("PolynomialDecay begin_step must be non-negative.");
        }
        if (options.end_step < options.begin_step) {
            throw ::Shear::ScheduleConfigError("PolynomialDecay end_step (" + std::to_string(options.end_step)
                                               + ") precedes begin_step (" + std::to_string(options.begin_step) + ").");
        }
        require_fraction(options.initial_sparsity, "PolynomialDecay initial_sparsity");
        require_fraction(options.final_sparsity, "PolynomialDecay final_sparsity");
        if (options.initial_sparsity > options.final_sparsity) {
            throw ::Shear::ScheduleConfigError("PolynomialDecay initial_sparsity must not exceed final_sparsity.");
        }
        if (!std::isfinite(options.power) || options.power <= 0.0) {
            throw ::Shear::ScheduleConfigError("PolynomialDecay power must be strictly positive.");
        }
    }

    class PolynomialDecaySchedule final : public Schedule {
    public:
        explicit PolynomialDecaySchedule(PolynomialDecayOptions options) : options_(std::move(options))
        {
            validate(options_);
        }

        [[nodiscard]] double target(std::int64_t step) const override
        {
            if (step < options_.begin_step) {
                return 0.0;
            }
            if (step >= options_.end_step) {
                return options_.final_sparsity;
            }

            const double span = static_cast<double>(options_.end_step - options_.begin_step);
            const double progress = static_cast<double>(step - options_.begin_step) / span;
            const double remaining = std::pow(1.0 - progress, options_.power);
            const double value = options_.final_sparsity
                + (options_.initial_sparsity - options_.final_sparsity) * remaining;
            return std::clamp(value, options_.initial_sparsity, options_.final_sparsity);
        }

        [[nodiscard]] std::int64_t begin_step() const noexcept override { return options_.begin_step; }
        [[nodiscard]] std::int64_t end_step() const noexcept override { return options_.end_step; }
        [[nodiscard]] double final_sparsity() const noexcept override { return options_.final_sparsity; }

        [[nodiscard]] const PolynomialDecayOptions& options() const noexcept { return options_; }

    private:
        PolynomialDecayOptions options_{};
    };
}

#endif //SHEAR_SPARSITY_POLYNOMIAL_DECAY_HPP
