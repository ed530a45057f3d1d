#ifndef SHEAR_MASK_IMPORTANCE_HPP
#define SHEAR_MASK_IMPORTANCE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/channel.hpp"

namespace Shear::Mask::Details {
    enum class Importance {
        Sum,
        L1,
        L2,
    };

    inline std::string to_string(Importance importance)
    {
        switch (importance) {
            case Importance::Sum: return "sum";
            case Importance::L1: return "l1";
            case Importance::L2: return "l2";
        }
        return "l1";
    }

    inline Importance importance_from_string(const std::string& value)
    {
        if (value == "sum") return Importance::Sum;
        if (value == "l1") return Importance::L1;
        if (value == "l2") return Importance::L2;
        throw std::invalid_argument("Unknown importance metric '" + value + "'. Expected sum, l1 or l2.");
    }

    // Scores are taken in double precision on a detached CPU copy, never on the live tensor.
    [[nodiscard]] inline std::vector<double> channel_importance(const torch::Tensor& weights,
                                                                Importance importance,
                                                                std::int64_t axis = 0)
    {
        if (!weights.defined()) {
            throw std::invalid_argument("channel_importance requires a defined weight tensor.");
        }
        if (weights.dim() == 0) {
            throw std::invalid_argument("channel_importance requires a tensor with a channel axis.");
        }

        torch::NoGradGuard no_grad{};
        const auto snapshot = weights.detach().to(torch::kCPU, torch::kFloat64);
        const auto rows = ::Shear::Common::Channel::channel_rows(snapshot, axis);

        torch::Tensor scores;
        switch (importance) {
            case Importance::Sum:
                scores = rows.sum(1);
                break;
            case Importance::L1:
                scores = rows.abs().sum(1);
                break;
            case Importance::L2:
                scores = rows.pow(2).sum(1).sqrt();
                break;
        }

        scores = scores.contiguous();
        const auto* data = scores.data_ptr<double>();
        return std::vector<double>(data, data + scores.numel());
    }
}

#endif //SHEAR_MASK_IMPORTANCE_HPP
