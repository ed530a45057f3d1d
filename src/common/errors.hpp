#ifndef SHEAR_COMMON_ERRORS_HPP
#define SHEAR_COMMON_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace Shear {

    // Invalid schedule ranges or sparsity values.
    class ScheduleConfigError : public std::invalid_argument {
    public:
        explicit ScheduleConfigError(const std::string& message) : std::invalid_argument(message) {}
    };

    // A mask would drop every channel of a layer. Raised by compute_mask under Mask::DegeneratePolicy::Throw,
    // and for any all-drop mask handed to masking or surgery.
    class MaskDegenerateError : public std::invalid_argument {
    public:
        MaskDegenerateError(std::int64_t channels, std::int64_t requested_drop, std::string layer = {})
            : std::invalid_argument("Mask " + (layer.empty() ? std::string{} : "for layer '" + layer + "' ")
                                    + "would drop " + std::to_string(requested_drop) + " of "
                                    + std::to_string(channels) + " channels, leaving the layer empty."),
              channels_(channels), requested_drop_(requested_drop), layer_(std::move(layer)) {}

        [[nodiscard]] std::int64_t channels() const noexcept { return channels_; }
        [[nodiscard]] std::int64_t requested_drop() const noexcept { return requested_drop_; }
        [[nodiscard]] const std::string& layer() const noexcept { return layer_; }

    private:
        std::int64_t channels_{};
        std::int64_t requested_drop_{};
        std::string layer_{};
    };

    class DependencyUnresolvedError : public std::runtime_error {
    public:
        DependencyUnresolvedError(std::string layer, const std::string& reason)
            : std::runtime_error("Unresolved channel dependency for layer '" + layer + "': " + reason),
              layer_(std::move(layer)) {}

        [[nodiscard]] const std::string& layer() const noexcept { return layer_; }

    private:
        std::string layer_{};
    };

    class ShapeMismatchError : public std::runtime_error {
    public:
        ShapeMismatchError(std::string producer, std::string consumer, std::int64_t expected, std::int64_t actual,
                           const std::string& detail = {})
            : std::runtime_error("Channel mismatch between '" + producer + "' and '" + consumer + "': expected "
                                 + std::to_string(expected) + ", found " + std::to_string(actual)
                                 + (detail.empty() ? std::string{} : " (" + detail + ")")),
              producer_(std::move(producer)), consumer_(std::move(consumer)), expected_(expected), actual_(actual) {}

        [[nodiscard]] const std::string& producer() const noexcept { return producer_; }
        [[nodiscard]] const std::string& consumer() const noexcept { return consumer_; }
        [[nodiscard]] std::int64_t expected() const noexcept { return expected_; }
        [[nodiscard]] std::int64_t actual() const noexcept { return actual_; }

    private:
        std::string producer_{};
        std::string consumer_{};
        std::int64_t expected_{};
        std::int64_t actual_{};
    };

    class ValidationMismatchError : public std::runtime_error {
    public:
        ValidationMismatchError(const std::string& message, std::string report)
            : std::runtime_error(message), report_(std::move(report)) {}

        [[nodiscard]] const std::string& report() const noexcept { return report_; }

    private:
        std::string report_{};
    };
}

#endif // SHEAR_COMMON_ERRORS_HPP
