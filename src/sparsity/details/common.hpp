#ifndef SHEAR_SPARSITY_COMMON_HPP
#define SHEAR_SPARSITY_COMMON_HPP

#include <cmath>
#include <cstdint>
#include <string>

#include "../../common/errors.hpp"

namespace Shear::Sparsity::Details {

    // Pure step -> fraction mapping. Implementations hold no mutable state.
    class Schedule {
    public:
        virtual ~Schedule() = default;

        [[nodiscard]] virtual double target(std::int64_t step) const = 0;
        [[nodiscard]] virtual std::int64_t begin_step() const noexcept = 0;
        [[nodiscard]] virtual std::int64_t end_step() const noexcept = 0;
        [[nodiscard]] virtual double final_sparsity() const noexcept = 0;
    };

    inline void require_fraction(double value, const char* field)
    {
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            throw ::Shear::ScheduleConfigError(std::string(field) + " must be a finite fraction within [0, 1], got "
                                               + std::to_string(value) + ".");
        }
    }

}  // namespace Shear::Sparsity::Details

#endif //SHEAR_SPARSITY_COMMON_HPP
