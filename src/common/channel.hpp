#ifndef SHEAR_COMMON_CHANNEL_HPP
#define SHEAR_COMMON_CHANNEL_HPP

#include <torch/torch.h>

#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace Shear::Common::Channel {

    [[nodiscard]] inline std::int64_t normalise_axis(const torch::Tensor& tensor, std::int64_t axis)
    {
        auto adjusted = axis;
        if (adjusted < 0) {
            adjusted += tensor.dim();
        }
        if (adjusted < 0 || adjusted >= tensor.dim()) {
            throw std::invalid_argument("Channel axis " + std::to_string(axis) + " is out of range for a tensor of rank "
                                        + std::to_string(tensor.dim()) + ".");
        }
        return adjusted;
    }

    [[nodiscard]] inline torch::Tensor move_dim_to_front(const torch::Tensor& tensor, std::int64_t dim)
    {
        const auto adjusted_dim = normalise_axis(tensor, dim);
        if (adjusted_dim == 0 || tensor.dim() <= 1) {
            return tensor;
        }

        std::vector<std::int64_t> permutation(tensor.dim());
        std::iota(permutation.begin(), permutation.end(), 0);
        std::swap(permutation[0], permutation[adjusted_dim]);
        return tensor.permute(permutation);
    }

    // One row per channel: [channels, elements-per-channel].
    [[nodiscard]] inline torch::Tensor channel_rows(const torch::Tensor& tensor, std::int64_t axis)
    {
        auto front = move_dim_to_front(tensor, axis);
        if (front.dim() == 1) {
            return front.reshape({front.size(0), 1});
        }
        return front.flatten(1);
    }

    // Reshapes a [channels] vector so it broadcasts against `reference` along `axis`.
    [[nodiscard]] inline torch::Tensor broadcast_along(const torch::Tensor& values,
                                                       const torch::Tensor& reference,
                                                       std::int64_t axis)
    {
        const auto adjusted = normalise_axis(reference, axis);
        std::vector<std::int64_t> shape(static_cast<std::size_t>(reference.dim()), 1);
        shape[static_cast<std::size_t>(adjusted)] = values.numel();
        return values.to(reference.device(), reference.scalar_type()).reshape(shape);
    }

    [[nodiscard]] inline torch::Tensor select_channels(const torch::Tensor& tensor,
                                                       std::int64_t axis,
                                                       const std::vector<std::int64_t>& indices)
    {
        const auto adjusted = normalise_axis(tensor, axis);
        auto index = torch::tensor(indices, torch::TensorOptions().dtype(torch::kLong).device(tensor.device()));
        return tensor.index_select(adjusted, index).contiguous();
    }
}

#endif // SHEAR_COMMON_CHANNEL_HPP
