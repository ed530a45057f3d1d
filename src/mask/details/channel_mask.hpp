#ifndef SHEAR_MASK_CHANNEL_MASK_HPP
#define SHEAR_MASK_CHANNEL_MASK_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Shear::Mask::Details {

    // One entry per output channel, true = keep.
    class ChannelMask {
    public:
        ChannelMask() = default;

        explicit ChannelMask(std::vector<bool> keep, bool corrected = false)
            : keep_(std::move(keep)), corrected_(corrected) {}

        [[nodiscard]] static ChannelMask all_keep(std::int64_t channels)
        {
            if (channels < 0) {
                throw std::invalid_argument("ChannelMask requires a non-negative channel count.");
            }
            return ChannelMask(std::vector<bool>(static_cast<std::size_t>(channels), true));
        }

        [[nodiscard]] std::int64_t size() const noexcept { return static_cast<std::int64_t>(keep_.size()); }
        [[nodiscard]] bool empty() const noexcept { return keep_.empty(); }
        [[nodiscard]] bool keep(std::int64_t channel) const { return keep_.at(static_cast<std::size_t>(channel)); }
        [[nodiscard]] const std::vector<bool>& values() const noexcept { return keep_; }

        // True when the degenerate clamp kept a channel the requested sparsity would have dropped.
        [[nodiscard]] bool corrected() const noexcept { return corrected_; }

        [[nodiscard]] std::int64_t kept() const noexcept
        {
            std::int64_t total = 0;
            for (bool value : keep_) {
                total += value ? 1 : 0;
            }
            return total;
        }

        [[nodiscard]] std::int64_t dropped() const noexcept { return size() - kept(); }

        [[nodiscard]] double sparsity() const noexcept
        {
            return keep_.empty() ? 0.0 : static_cast<double>(dropped()) / static_cast<double>(keep_.size());
        }

        [[nodiscard]] std::vector<std::int64_t> keep_indices() const
        {
            std::vector<std::int64_t> indices{};
            indices.reserve(keep_.size());
            for (std::size_t index = 0; index < keep_.size(); ++index) {
                if (keep_[index]) {
                    indices.push_back(static_cast<std::int64_t>(index));
                }
            }
            return indices;
        }

        [[nodiscard]] std::vector<std::int64_t> drop_indices() const
        {
            std::vector<std::int64_t> indices{};
            for (std::size_t index = 0; index < keep_.size(); ++index) {
                if (!keep_[index]) {
                    indices.push_back(static_cast<std::int64_t>(index));
                }
            }
            return indices;
        }

        [[nodiscard]] torch::Tensor to_tensor(const torch::TensorOptions& options = torch::TensorOptions().dtype(torch::kFloat32)) const
        {
            std::vector<float> values(keep_.size());
            for (std::size_t index = 0; index < keep_.size(); ++index) {
                values[index] = keep_[index] ? 1.0F : 0.0F;
            }
            return torch::tensor(values, torch::TensorOptions().dtype(torch::kFloat32)).to(options);
        }

        [[nodiscard]] std::string to_string() const
        {
            std::ostringstream stream;
            stream << '[';
            for (std::size_t index = 0; index < keep_.size(); ++index) {
                if (index > 0) {
                    stream << ',';
                }
                stream << (keep_[index] ? 1 : 0);
            }
            stream << ']';
            return stream.str();
        }

        friend bool operator==(const ChannelMask& lhs, const ChannelMask& rhs) noexcept { return lhs.keep_ == rhs.keep_; }
        friend bool operator!=(const ChannelMask& lhs, const ChannelMask& rhs) noexcept { return !(lhs == rhs); }

    private:
        std::vector<bool> keep_{};
        bool corrected_{false};
    };

    using MaskSet = std::map<std::string, ChannelMask>;
}

#endif //SHEAR_MASK_CHANNEL_MASK_HPP
