#ifndef SHEAR_MASK_COMPUTE_HPP
#define SHEAR_MASK_COMPUTE_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "channel_mask.hpp"
#include "importance.hpp"

namespace Shear::Mask::Details {
    enum class DegeneratePolicy {
        Clamp,
        Throw,
    };

    struct MaskOptions {
        Importance importance{Importance::L1};
        std::int64_t axis{0};
        DegeneratePolicy degenerate{DegeneratePolicy::Clamp};
    };

    // K = round(f * N); sparsities at or above 1 request every channel.
    [[nodiscard]] inline std::int64_t requested_drop_count(std::int64_t channels, double target_sparsity)
    {
        if (std::isnan(target_sparsity) || target_sparsity < 0.0) {
            throw std::invalid_argument("Target sparsity must be a non-negative number, got "
                                        + std::to_string(target_sparsity) + ".");
        }
        if (target_sparsity >= 1.0) {
            return channels;
        }
        return static_cast<std::int64_t>(std::llround(target_sparsity * static_cast<double>(channels)));
    }

    [[nodiscard]] inline ChannelMask mask_from_scores(const std::vector<double>& scores,
                                                      double target_sparsity,
                                                      DegeneratePolicy policy = DegeneratePolicy::Clamp)
    {
        const auto channels = static_cast<std::int64_t>(scores.size());
        if (channels == 0) {
            throw std::invalid_argument("Cannot compute a channel mask over zero channels.");
        }

        auto drop = requested_drop_count(channels, target_sparsity);
        bool corrected = false;
        if (drop >= channels) {
            if (policy == DegeneratePolicy::Throw) {
                throw ::Shear::MaskDegenerateError(channels, drop);
            }
            drop = channels - 1;
            corrected = true;
        }

        // NaN ranks as least important. Equal scores keep index order, so lower indices drop first.
        auto rank_key = [&](std::size_t index) {
            const auto score = scores[index];
            return std::isnan(score) ? -std::numeric_limits<double>::infinity() : score;
        };
        std::vector<std::size_t> order(scores.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
            return rank_key(lhs) < rank_key(rhs);
        });

        std::vector<bool> keep(scores.size(), true);
        for (std::int64_t position = 0; position < drop; ++position) {
            keep[order[static_cast<std::size_t>(position)]] = false;
        }
        return ChannelMask(std::move(keep), corrected);
    }

    [[nodiscard]] inline ChannelMask compute_mask(const torch::Tensor& weights,
                                                  double target_sparsity,
                                                  const MaskOptions& options = {})
    {
        const auto scores = channel_importance(weights, options.importance, options.axis);
        return mask_from_scores(scores, target_sparsity, options.degenerate);
    }
}

#endif //SHEAR_MASK_COMPUTE_HPP
