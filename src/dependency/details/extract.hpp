#ifndef SHEAR_DEPENDENCY_EXTRACT_HPP
#define SHEAR_DEPENDENCY_EXTRACT_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../network.hpp"

namespace Shear::Dependency::Details {
    using Slot = ::Shear::Layer::Details::Slot;

    enum class DepthwisePolicy {
        Propagate,
        Stop,
    };

    struct ExtractOptions {
        DepthwisePolicy depthwise{DepthwisePolicy::Propagate};
        std::size_t max_workers{0};  // 0: hardware concurrency
    };

    // Output channel i of `producer` is entry i of `consumer`'s `slot` tensor along `axis`.
    struct DependencyEdge {
        std::size_t producer{};
        std::size_t consumer{};
        Slot slot{Slot::Weight};
        std::int64_t axis{0};
        std::int64_t channels{0};
    };

    struct ExtractionResult {
        std::string layer{};
        std::vector<DependencyEdge> edges{};
        std::exception_ptr error{};
        std::string message{};

        [[nodiscard]] bool ok() const noexcept { return !error; }

        void rethrow() const
        {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    };

    inline std::vector<DependencyEdge> extract_dependencies(const LayerGraph& graph,
                                                            const std::string& layer_name,
                                                            const ExtractOptions& options = {})
    {
        using ::Shear::Layer::Kind;

        const auto root = graph.index_of(layer_name);
        const auto& producer = graph.layer(root);
        if (producer.kind != Kind::PointwiseConvolution) {
            throw std::invalid_argument("Layer '" + layer_name + "' is a " + ::Shear::Layer::to_string(producer.kind)
                                        + " layer; only pointwise convolutions can be pruned.");
        }
        const auto channels = producer.channels.out_channels.value_or(0);

        std::vector<DependencyEdge> edges{};
        std::vector<bool> visited(graph.size(), false);
        visited[root] = true;

        auto record = [&](std::size_t consumer, Slot slot, std::int64_t axis) {
            const auto& layer = graph.layer(consumer);
            if (!layer.has_parameter(slot)) {
                return;
            }
            const auto& tensor = layer.parameter(slot);
            const auto size = tensor.dim() > axis ? tensor.size(axis) : std::int64_t{-1};
            if (size != channels) {
                throw ShapeMismatchError(producer.name, layer.name, channels, size,
                                         std::string(to_string(slot)) + " axis " + std::to_string(axis));
            }
            edges.push_back(DependencyEdge{root, consumer, slot, axis, channels});
        };

        std::deque<std::size_t> frontier{root};
        while (!frontier.empty()) {
            const auto current = frontier.front();
            frontier.pop_front();

            if (graph.is_graph_output(current)) {
                throw DependencyUnresolvedError(layer_name, "channels reach a graph output through '" + graph.name(current)
                                                                + "' before any consumer.");
            }

            for (const auto consumer : graph.consumers(current)) {
                if (visited[consumer]) {
                    continue;
                }
                visited[consumer] = true;

                const auto& layer = graph.layer(consumer);
                switch (layer.kind) {
                    case Kind::Normalization:
                        record(consumer, Slot::Weight, 0);
                        record(consumer, Slot::Bias, 0);
                        record(consumer, Slot::RunningMean, 0);
                        record(consumer, Slot::RunningVar, 0);
                        frontier.push_back(consumer);
                        break;
                    case Kind::DepthwiseConvolution:
                        if (options.depthwise == DepthwisePolicy::Stop) {
                            throw DependencyUnresolvedError(layer_name, "walk stopped at depthwise convolution '" + layer.name + "'.");
                        }
                        record(consumer, Slot::Weight, 0);
                        record(consumer, Slot::Bias, 0);
                        frontier.push_back(consumer);
                        break;
                    case Kind::Convolution:
                        if (layer.channels.groups != 1) {
                            throw DependencyUnresolvedError(layer_name, "grouped convolution '" + layer.name
                                                                            + "' mixes channels in groups of "
                                                                            + std::to_string(layer.channels.in_channels.value_or(0) / layer.channels.groups) + ".");
                        }
                        record(consumer, Slot::Weight, 1);
                        break;
                    case Kind::PointwiseConvolution:
                    case Kind::Dense:
                        record(consumer, Slot::Weight, 1);
                        break;
                    case Kind::Other:
                        if (!layer.channels.preserves_channels) {
                            throw DependencyUnresolvedError(layer_name, "'" + layer.name + "' does not preserve channel indices.");
                        }
                        frontier.push_back(consumer);
                        break;
                }
            }
        }

        return edges;
    }

    inline constexpr std::size_t kSerialWalkLimit = 4;

    // Walks are read-only, so independent roots run on a bounded set of workers. Slicing happens afterwards, serially.
    inline std::vector<ExtractionResult> extract_all(const LayerGraph& graph,
                                                     const std::vector<std::string>& layers,
                                                     const ExtractOptions& options = {})
    {
        graph.require_routing();

        std::vector<ExtractionResult> results(layers.size());
        std::vector<std::exception_ptr> failures(layers.size());
        auto walk = [&](std::size_t index) {
            auto& result = results[index];
            result.layer = layers[index];
            try {
                result.edges = extract_dependencies(graph, layers[index], options);
            } catch (const DependencyUnresolvedError& error) {
                result.error = std::current_exception();
                result.message = error.what();
            } catch (const ShapeMismatchError& error) {
                result.error = std::current_exception();
                result.message = error.what();
            } catch (const std::exception&) {
                failures[index] = std::current_exception();
            }
        };

        std::size_t workers = options.max_workers != 0 ? options.max_workers
                                                       : static_cast<std::size_t>(std::thread::hardware_concurrency());
        workers = std::min(std::max<std::size_t>(workers, 1), layers.size());
        if (layers.size() <= kSerialWalkLimit || workers <= 1) {
            for (std::size_t index = 0; index < layers.size(); ++index) {
                walk(index);
            }
        } else {
            std::vector<std::future<void>> pending{};
            pending.reserve(workers);
            for (std::size_t worker = 0; worker < workers; ++worker) {
                pending.push_back(std::async(std::launch::async, [&walk, worker, workers, count = layers.size()]() {
                    for (std::size_t index = worker; index < count; index += workers) {
                        walk(index);
                    }
                }));
            }
            for (auto& future : pending) {
                future.get();
            }
        }

        // Anything other than an unresolved walk is a caller error; report the first one in root order.
        for (const auto& failure : failures) {
            if (failure) {
                std::rethrow_exception(failure);
            }
        }
        return results;
    }
}

#endif //SHEAR_DEPENDENCY_EXTRACT_HPP
