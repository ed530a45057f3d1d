#ifndef SHEAR_MASK_APPLY_HPP
#define SHEAR_MASK_APPLY_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/channel.hpp"
#include "../common/errors.hpp"
#include "../dependency/dependency.hpp"
#include "../network.hpp"
#include "../utils/terminal.hpp"
#include "mask.hpp"

namespace Shear::Mask {
    using Slot = Layer::Details::Slot;

    // Multiplicative factors per layer for the weight and bias slots. Undefined factors leave the slot untouched.
    struct MaskPlan {
        std::vector<std::array<torch::Tensor, 2>> factors{};
        std::vector<Dependency::ExtractionResult> extraction{};

        [[nodiscard]] bool empty() const noexcept
        {
            for (const auto& slots : factors) {
                if (slots[0].defined() || slots[1].defined()) {
                    return false;
                }
            }
            return true;
        }
    };

    inline void validate_masks(const LayerGraph& graph, const MaskSet& masks)
    {
        for (const auto& [name, mask] : masks) {
            const auto& layer = graph.layer(graph.index_of(name));
            if (layer.kind != Layer::Kind::PointwiseConvolution) {
                throw std::invalid_argument("Mask targets '" + name + "', a " + Layer::to_string(layer.kind)
                                            + " layer; only pointwise convolutions can be pruned.");
            }
            const auto channels = layer.channels.out_channels.value_or(0);
            if (mask.size() != channels) {
                throw ShapeMismatchError(name, name, channels, mask.size(), "mask length");
            }
            if (mask.kept() == 0) {
                throw MaskDegenerateError(channels, mask.dropped(), name);
            }
        }
    }

    // Own weight/bias along axis 0, plus every coupled weight/bias slot in `extraction`. Running statistics are never masked.
    [[nodiscard]] inline MaskPlan plan_masks(const LayerGraph& graph,
                                             const MaskSet& masks,
                                             std::vector<Dependency::ExtractionResult> extraction,
                                             std::ostream* stream = nullptr)
    {
        validate_masks(graph, masks);

        MaskPlan plan{};
        plan.factors.resize(graph.size());
        plan.extraction = std::move(extraction);

        auto combine = [](torch::Tensor& factor, torch::Tensor contribution) {
            factor = factor.defined() ? factor * contribution : std::move(contribution);
        };
        auto slot_index = [](Slot slot) { return static_cast<std::size_t>(slot); };

        for (const auto& result : plan.extraction) {
            const auto found = masks.find(result.layer);
            if (found == masks.end()) {
                continue;
            }
            const auto root = graph.index_of(result.layer);
            const auto& layer = graph.layer(root);
            const auto& weight = layer.parameter(Slot::Weight);
            const auto keep = found->second.to_tensor(weight.options());

            combine(plan.factors[root][slot_index(Slot::Weight)], Common::Channel::broadcast_along(keep, weight, 0));
            if (layer.has_parameter(Slot::Bias)) {
                combine(plan.factors[root][slot_index(Slot::Bias)], keep);
            }

            if (!result.ok()) {
                Utils::Terminal::Warn(stream, "Masking only '" + result.layer + "' itself: " + result.message);
                continue;
            }

            for (const auto& edge : result.edges) {
                if (edge.slot != Slot::Weight && edge.slot != Slot::Bias) {
                    continue;
                }
                const auto& target = graph.layer(edge.consumer).parameter(edge.slot);
                combine(plan.factors[edge.consumer][slot_index(edge.slot)],
                        Common::Channel::broadcast_along(keep, target, edge.axis));
            }
        }
        return plan;
    }

    [[nodiscard]] inline MaskPlan plan_masks(const LayerGraph& graph,
                                             const MaskSet& masks,
                                             const Dependency::ExtractOptions& options = {},
                                             std::ostream* stream = nullptr)
    {
        std::vector<std::string> roots{};
        roots.reserve(masks.size());
        for (const auto& entry : masks) {
            roots.push_back(entry.first);
        }
        validate_masks(graph, masks);
        return plan_masks(graph, masks, Dependency::extract_all(graph, roots, options), stream);
    }

    // Substitutes for a masked forward; gradients reach the stored tensors through the product.
    [[nodiscard]] inline std::vector<LayerGraph::EffectiveParameters> effective_parameters(const LayerGraph& graph, const MaskPlan& plan)
    {
        std::vector<LayerGraph::EffectiveParameters> effective(graph.size());
        for (std::size_t index = 0; index < graph.size() && index < plan.factors.size(); ++index) {
            const auto& layer = graph.layer(index);
            const auto& factors = plan.factors[index];
            if (factors[0].defined()) {
                effective[index].weight = layer.parameter(Slot::Weight) * factors[0];
            }
            if (factors[1].defined()) {
                effective[index].bias = layer.parameter(Slot::Bias) * factors[1];
            }
        }
        return effective;
    }

    inline void bake(LayerGraph& graph, const MaskPlan& plan)
    {
        torch::NoGradGuard no_grad{};
        for (std::size_t index = 0; index < graph.size() && index < plan.factors.size(); ++index) {
            const auto& layer = graph.layer(index);
            const auto& factors = plan.factors[index];
            if (factors[0].defined()) {
                layer.parameter(Slot::Weight).mul_(factors[0]);
            }
            if (factors[1].defined()) {
                layer.parameter(Slot::Bias).mul_(factors[1]);
            }
        }
    }

    // Pre-surgery reference: an independent copy with every mask multiplied into its stored tensors.
    [[nodiscard]] inline std::shared_ptr<LayerGraph> apply_masks(const LayerGraph& graph,
                                                                 const MaskSet& masks,
                                                                 const Dependency::ExtractOptions& options = {},
                                                                 std::ostream* stream = nullptr)
    {
        auto masked = graph.copy();
        bake(*masked, plan_masks(*masked, masks, options, stream));
        return masked;
    }
}

#endif //SHEAR_MASK_APPLY_HPP
