#ifndef SHEAR_SURGERY_REPORT_HPP
#define SHEAR_SURGERY_REPORT_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "../../utils/terminal.hpp"

namespace Shear::Surgery::Details {
    enum class LayerStatus {
        Reduced,
        Unchanged,
        Skipped,
    };

    [[nodiscard]] inline const char* to_string(LayerStatus status) noexcept
    {
        switch (status) {
            case LayerStatus::Reduced: return "reduced";
            case LayerStatus::Unchanged: return "unchanged";
            case LayerStatus::Skipped: return "skipped";
        }
        return "unknown";
    }

    struct LayerReport {
        std::string name{};
        std::int64_t channels_before{};
        std::int64_t channels_after{};
        LayerStatus status{LayerStatus::Unchanged};
        std::vector<std::string> consumers{};
        std::string reason{};
    };

    struct SurgeryReport {
        std::vector<LayerReport> layers{};
        std::int64_t parameters_before{};
        std::int64_t parameters_after{};

        [[nodiscard]] std::size_t skipped() const noexcept
        {
            std::size_t total = 0;
            for (const auto& layer : layers) {
                total += layer.status == LayerStatus::Skipped ? 1 : 0;
            }
            return total;
        }

        [[nodiscard]] double reduction() const noexcept
        {
            if (parameters_before == 0) {
                return 0.0;
            }
            return 1.0 - static_cast<double>(parameters_after) / static_cast<double>(parameters_before);
        }

        [[nodiscard]] std::string to_string() const
        {
            std::size_t width = 5;
            for (const auto& layer : layers) {
                width = std::max(width, layer.name.size());
            }

            std::ostringstream stream;
            stream << "Surgery report: " << layers.size() << " layer(s), parameters " << parameters_before << " -> "
                   << parameters_after << " (-" << std::fixed << std::setprecision(1) << reduction() * 100.0 << "%)\n";
            for (const auto& layer : layers) {
                stream << "  " << Utils::Terminal::PadRight(layer.name, width) << "  "
                       << std::setw(5) << layer.channels_before << " -> " << std::setw(5) << layer.channels_after
                       << "  " << Details::to_string(layer.status);
                if (!layer.consumers.empty()) {
                    stream << " [";
                    for (std::size_t index = 0; index < layer.consumers.size(); ++index) {
                        stream << (index > 0 ? ", " : "") << layer.consumers[index];
                    }
                    stream << ']';
                }
                if (!layer.reason.empty()) {
                    stream << ": " << layer.reason;
                }
                stream << '\n';
            }
            return stream.str();
        }
    };
}

#endif //SHEAR_SURGERY_REPORT_HPP
