#ifndef SHEAR_SURGERY_APPLY_HPP
#define SHEAR_SURGERY_APPLY_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../../common/channel.hpp"
#include "../../common/errors.hpp"
#include "../../dependency/dependency.hpp"
#include "../../mask/apply.hpp"
#include "../../mask/mask.hpp"
#include "../../network.hpp"
#include "../../utils/terminal.hpp"
#include "report.hpp"

namespace Shear::Surgery::Details {
    using Slot = ::Shear::Layer::Details::Slot;
    using SlotTensors = std::array<torch::Tensor, ::Shear::Layer::Details::kSlotCount>;

    struct SurgeryOptions {
        Dependency::ExtractOptions extract{};
        bool strict{false};  // rethrow per-layer extraction failures instead of skipping the layer
        std::ostream* stream{&std::cout};
        bool monitor{true};
    };

    struct SurgeryResult {
        std::shared_ptr<LayerGraph> graph{};
        SurgeryReport report{};
    };

    namespace Detail {
        inline void resize_output(::Shear::Layer::Descriptor& descriptor, std::int64_t channels)
        {
            std::visit(
                [&](auto& concrete) {
                    using DescriptorType = std::decay_t<decltype(concrete)>;
                    if constexpr (std::is_same_v<DescriptorType, ::Shear::Layer::Conv2dDescriptor>) {
                        concrete.options.out_channels = channels;
                    } else {
                        throw std::logic_error("Only convolution outputs can be resized.");
                    }
                },
                descriptor);
        }

        inline void resize_input(::Shear::Layer::Descriptor& descriptor, std::int64_t channels)
        {
            std::visit(
                [&](auto& concrete) {
                    using DescriptorType = std::decay_t<decltype(concrete)>;
                    if constexpr (std::is_same_v<DescriptorType, ::Shear::Layer::Conv2dDescriptor>) {
                        auto& options = concrete.options;
                        const bool depthwise = options.groups > 1 && options.groups == options.in_channels
                            && options.groups == options.out_channels;
                        if (depthwise) {
                            options.groups = channels;
                            options.out_channels = channels;
                        }
                        options.in_channels = channels;
                    } else if constexpr (std::is_same_v<DescriptorType, ::Shear::Layer::BatchNorm2dDescriptor>) {
                        concrete.options.num_features = channels;
                    } else if constexpr (std::is_same_v<DescriptorType, ::Shear::Layer::FCDescriptor>) {
                        concrete.options.in_features = channels;
                    } else {
                        throw std::logic_error("Layer kind has no channel-dimensioned input to resize.");
                    }
                },
                descriptor);
        }

        inline SlotTensors snapshot(const ::Shear::Layer::Details::RegisteredLayer& layer)
        {
            SlotTensors tensors{};
            for (std::size_t slot = 0; slot < tensors.size(); ++slot) {
                if (layer.parameters[slot].defined()) {
                    tensors[slot] = layer.parameters[slot].detach().clone();
                }
            }
            return tensors;
        }

        inline void slice(SlotTensors& tensors, Slot slot, std::int64_t axis, std::int64_t expected,
                          const std::vector<std::int64_t>& keep, const std::string& producer, const std::string& consumer)
        {
            auto& tensor = tensors[static_cast<std::size_t>(slot)];
            if (!tensor.defined()) {
                return;
            }
            if (tensor.size(axis) != expected) {
                throw ShapeMismatchError(producer, consumer, expected, tensor.size(axis),
                                         std::string(to_string(slot)) + " axis " + std::to_string(axis) + " before slicing");
            }
            tensor = ::Shear::Common::Channel::select_channels(tensor, axis, keep);
        }
    }

    [[nodiscard]] inline SurgeryResult apply_surgery(const LayerGraph& graph,
                                                     const Mask::MaskSet& masks,
                                                     const SurgeryOptions& options = {})
    {
        using ::Shear::Utils::Terminal::Info;
        using ::Shear::Utils::Terminal::Warn;

        Mask::validate_masks(graph, masks);
        graph.validate_shapes();

        std::vector<std::string> roots{};
        for (const auto index : graph.topological_order()) {
            if (masks.find(graph.name(index)) != masks.end()) {
                roots.push_back(graph.name(index));
            }
        }
        const auto extraction = Dependency::extract_all(graph, roots, options.extract);

        torch::NoGradGuard no_grad{};
        std::vector<Detail::SlotTensors> tensors{};
        tensors.reserve(graph.size());
        for (std::size_t index = 0; index < graph.size(); ++index) {
            tensors.push_back(Detail::snapshot(graph.layer(index)));
        }
        auto descriptors = graph.descriptors();

        SurgeryResult result{};
        result.report.parameters_before = graph.parameter_count();

        for (const auto& outcome : extraction) {
            const auto root = graph.index_of(outcome.layer);
            const auto& mask = masks.at(outcome.layer);

            LayerReport entry{};
            entry.name = outcome.layer;
            entry.channels_before = mask.size();
            entry.channels_after = mask.size();

            if (!outcome.ok()) {
                if (options.strict) {
                    outcome.rethrow();
                }
                // The layer keeps its width; dropped channels are zeroed in place instead.
                auto& own = tensors[root];
                auto keep = mask.to_tensor(own[static_cast<std::size_t>(Slot::Weight)].options());
                own[static_cast<std::size_t>(Slot::Weight)].mul_(
                    ::Shear::Common::Channel::broadcast_along(keep, own[static_cast<std::size_t>(Slot::Weight)], 0));
                if (own[static_cast<std::size_t>(Slot::Bias)].defined()) {
                    own[static_cast<std::size_t>(Slot::Bias)].mul_(keep);
                }
                entry.status = LayerStatus::Skipped;
                entry.reason = outcome.message;
                Warn(options.stream, "Surgery skipped '" + outcome.layer + "': " + outcome.message);
                result.report.layers.push_back(std::move(entry));
                continue;
            }

            for (const auto& edge : outcome.edges) {
                const auto& consumer = graph.name(edge.consumer);
                if (std::find(entry.consumers.begin(), entry.consumers.end(), consumer) == entry.consumers.end()) {
                    entry.consumers.push_back(consumer);
                }
            }

            const auto keep = mask.keep_indices();
            const auto kept = static_cast<std::int64_t>(keep.size());
            if (kept == mask.size()) {
                entry.status = LayerStatus::Unchanged;
                result.report.layers.push_back(std::move(entry));
                continue;
            }

            Detail::slice(tensors[root], Slot::Weight, 0, mask.size(), keep, outcome.layer, outcome.layer);
            Detail::slice(tensors[root], Slot::Bias, 0, mask.size(), keep, outcome.layer, outcome.layer);
            Detail::resize_output(descriptors[root], kept);

            for (const auto& edge : outcome.edges) {
                Detail::slice(tensors[edge.consumer], edge.slot, edge.axis, edge.channels, keep,
                              outcome.layer, graph.name(edge.consumer));
                Detail::resize_input(descriptors[edge.consumer], kept);
            }

            entry.status = LayerStatus::Reduced;
            entry.channels_after = kept;
            result.report.layers.push_back(std::move(entry));
        }

        auto reduced = std::make_shared<LayerGraph>();
        for (std::size_t index = 0; index < descriptors.size(); ++index) {
            reduced->add(descriptors[index], graph.name(index));
        }
        if (graph.has_explicit_routing()) {
            reduced->links(graph.link_specs());
        }

        for (std::size_t index = 0; index < tensors.size(); ++index) {
            const auto& layer = reduced->layer(index);
            for (std::size_t slot = 0; slot < tensors[index].size(); ++slot) {
                const auto& source = tensors[index][slot];
                if (!source.defined()) {
                    continue;
                }
                const auto& target = layer.parameters[slot];
                if (!target.defined() || target.sizes() != source.sizes()) {
                    throw ShapeMismatchError(layer.name, layer.name,
                                             target.defined() ? target.numel() : 0, source.numel(),
                                             std::string(to_string(static_cast<Slot>(slot))) + " element count after slicing");
                }
                target.set_data(source.to(target.device()));
            }
        }
        reduced->train(graph.is_training());
        reduced->validate_shapes();

        result.report.parameters_after = reduced->parameter_count();
        result.graph = std::move(reduced);

        if (options.monitor) {
            Info(options.stream, result.report.to_string());
        }
        return result;
    }
}

#endif //SHEAR_SURGERY_APPLY_HPP
