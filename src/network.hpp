#ifndef SHEAR_NETWORK_HPP
#define SHEAR_NETWORK_HPP
/*
 * Layer graph owning every prunable network.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Register layers from descriptors (`add`), optionally routed with
 *    `links` (single producer per layer, fan-out and several outputs allowed).
 *  - Expose the structure the pruning passes walk: producer, consumers,
 *    graph-output membership and a topological order.
 *  - Run forwards with optional per-layer weight/bias substitutes so a
 *    masked view never mutates the stored tensors.
 *  - Deep-copy itself (`copy`) and check channel contracts statically
 *    (`validate_shapes`) or with a probe tensor (`check`, utils/check.hpp).
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common/errors.hpp"
#include "common/graph.hpp"
#include "layer/layer.hpp"

namespace Shear {
    class LayerGraph : public torch::nn::Module {
    public:
        using RegisteredLayer = Layer::Details::RegisteredLayer;
        using EffectiveParameters = Layer::Details::EffectiveParameters;

        struct LayerCheck {
            std::size_t index{};
            std::string name{};
            std::string module_name{};
            std::string activation{};
            std::vector<int64_t> input_shape{};
            std::vector<int64_t> output_shape{};
            std::vector<int64_t> expected_input_shape{};
            bool ok{false};
            std::string message{};
        };

        struct CheckReport {
            bool ok{false};
            std::vector<std::string> warnings{};
            std::vector<LayerCheck> layers{};
            std::vector<std::vector<int64_t>> output_shapes{};

            [[nodiscard]] std::string to_string() const;
        };

        LayerGraph() = default;
        LayerGraph(const LayerGraph&) = delete;
        LayerGraph& operator=(const LayerGraph&) = delete;

        void add(Layer::Descriptor descriptor, std::string name = {})
        {
            const auto index = layers_.size();
            std::string layer_name = name.empty() ? "#" + std::to_string(index) : std::move(name);
            if (name_index_.find(layer_name) != name_index_.end()) {
                throw std::invalid_argument("Layer name '" + layer_name + "' is already registered.");
            }

            auto registered_layer = Layer::Details::build_registered_layer(*this, descriptor, index);
            registered_layer.name = layer_name;
            layers_.push_back(std::move(registered_layer));
            descriptors_.push_back(std::move(descriptor));
            name_index_.emplace(std::move(layer_name), index);

            if (explicit_routing_) {
                clear_compiled_graph();
            } else {
                compile_sequential();
            }
        }

        void links(std::vector<LinkSpec> specifications)
        {
            if (specifications.empty()) {
                explicit_routing_ = false;
                link_specs_.clear();
                compile_sequential();
                return;
            }
            compile_links(specifications);
            link_specs_ = std::move(specifications);
            explicit_routing_ = true;
        }

        [[nodiscard]] std::size_t size() const noexcept { return layers_.size(); }
        [[nodiscard]] bool empty() const noexcept { return layers_.empty(); }

        [[nodiscard]] const RegisteredLayer& layer(std::size_t index) const
        {
            if (index >= layers_.size()) {
                throw std::out_of_range("Layer index " + std::to_string(index) + " is out of range.");
            }
            return layers_[index];
        }

        [[nodiscard]] const RegisteredLayer& layer(const std::string& name) const { return layers_[index_of(name)]; }

        [[nodiscard]] std::size_t index_of(const std::string& name) const
        {
            const auto it = name_index_.find(name);
            if (it == name_index_.end()) {
                throw std::invalid_argument("Unknown layer '" + name + "'.");
            }
            return it->second;
        }

        [[nodiscard]] bool contains(const std::string& name) const { return name_index_.find(name) != name_index_.end(); }
        [[nodiscard]] const std::string& name(std::size_t index) const { return layer(index).name; }

        [[nodiscard]] const Layer::Descriptor& descriptor(std::size_t index) const
        {
            if (index >= descriptors_.size()) {
                throw std::out_of_range("Descriptor index " + std::to_string(index) + " is out of range.");
            }
            return descriptors_[index];
        }

        [[nodiscard]] const std::vector<Layer::Descriptor>& descriptors() const noexcept { return descriptors_; }
        [[nodiscard]] const std::vector<LinkSpec>& link_specs() const noexcept { return link_specs_; }
        [[nodiscard]] bool has_explicit_routing() const noexcept { return explicit_routing_; }

        // nullopt when the layer reads the graph input directly.
        [[nodiscard]] std::optional<std::size_t> producer(std::size_t index) const
        {
            require_routing();
            return producers_.at(index);
        }

        [[nodiscard]] const std::vector<std::size_t>& consumers(std::size_t index) const
        {
            require_routing();
            return consumers_.at(index);
        }

        [[nodiscard]] bool is_graph_output(std::size_t index) const
        {
            require_routing();
            return !output_slots_.at(index).empty();
        }

        [[nodiscard]] const std::vector<std::size_t>& topological_order() const
        {
            require_routing();
            return topological_order_;
        }

        [[nodiscard]] std::size_t output_count() const
        {
            require_routing();
            return output_count_;
        }

        [[nodiscard]] std::vector<torch::Tensor> forward_all(torch::Tensor input,
                                                             const std::vector<EffectiveParameters>* overrides = nullptr) const
        {
            require_routing();
            if (layers_.empty()) {
                throw std::logic_error("Cannot run a forward pass on an empty graph.");
            }
            if (overrides != nullptr && overrides->size() != layers_.size()) {
                throw std::invalid_argument("Expected " + std::to_string(layers_.size()) + " parameter overrides, received "
                                            + std::to_string(overrides->size()) + ".");
            }

            static const EffectiveParameters kStored{};
            std::vector<torch::Tensor> node_buffers(compiled_nodes_.size());
            node_buffers[kInputNode] = std::move(input);
            std::vector<torch::Tensor> outputs(output_count_);

            for (const auto& step : execution_steps_) {
                switch (step.kind) {
                    case ExecutionStep::Kind::Module: {
                        const auto& effective = overrides != nullptr ? (*overrides)[step.layer_index] : kStored;
                        node_buffers[step.activation_index] = layers_[step.layer_index].run(node_buffers[step.input_index], effective);
                        break;
                    }
                    case ExecutionStep::Kind::Output:
                        outputs[step.output_slot] = node_buffers[step.input_index];
                        break;
                }
            }
            return outputs;
        }

        // Several outputs are concatenated along dim 1.
        [[nodiscard]] torch::Tensor forward(torch::Tensor input) const
        {
            auto outputs = forward_all(std::move(input));
            if (outputs.size() == 1) {
                return outputs.front();
            }
            return torch::cat(outputs, 1);
        }

        // Walks every declared channel contract and throws on the first disagreement.
        void validate_shapes() const
        {
            require_routing();
            for (const auto index : topological_order_) {
                const auto& consumer = layers_[index];
                validate_parameters(consumer);
                if (!consumer.channels.in_channels) {
                    continue;
                }
                auto upstream = producers_[index];
                while (upstream && !layers_[*upstream].channels.out_channels && layers_[*upstream].channels.preserves_channels) {
                    upstream = producers_[*upstream];
                }
                if (!upstream || !layers_[*upstream].channels.out_channels) {
                    continue;
                }
                const auto produced = *layers_[*upstream].channels.out_channels;
                const auto expected = *consumer.channels.in_channels;
                if (produced != expected) {
                    throw ShapeMismatchError(layers_[*upstream].name, consumer.name, expected, produced);
                }
            }
        }

        [[nodiscard]] std::shared_ptr<LayerGraph> copy() const
        {
            auto duplicate = std::make_shared<LayerGraph>();
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                duplicate->add(descriptors_[index], layers_[index].name);
            }
            if (explicit_routing_) {
                duplicate->links(link_specs_);
            }
            duplicate->load_state_from(*this);
            duplicate->train(is_training());
            return duplicate;
        }

        // Copies every parameter and buffer of a structurally identical graph.
        void load_state_from(const LayerGraph& other)
        {
            torch::NoGradGuard no_grad{};
            auto transfer = [](const auto& sources, auto targets) {
                for (auto& item : targets) {
                    const auto* source = sources.find(item.key());
                    if (source == nullptr) {
                        throw std::invalid_argument("Source graph has no tensor named '" + item.key() + "'.");
                    }
                    if (!source->defined()) {
                        continue;
                    }
                    if (source->sizes() != item.value().sizes()) {
                        throw std::invalid_argument("Tensor '" + item.key() + "' differs in shape between graphs.");
                    }
                    item.value().set_data(source->detach().clone());
                }
            };
            transfer(other.named_parameters(true), named_parameters(true));
            transfer(other.named_buffers(true), named_buffers(true));
        }

        [[nodiscard]] torch::Device device() const
        {
            for (const auto& tensor : parameters(true)) {
                return tensor.device();
            }
            return torch::Device(torch::kCPU);
        }

        [[nodiscard]] std::int64_t parameter_count() const
        {
            std::int64_t total = 0;
            for (const auto& layer : layers_) {
                total += layer.parameter_count();
            }
            return total;
        }

        // Throws std::logic_error when layers were added after an explicit links() call.
        void require_routing() const
        {
            if (!routing_active_) {
                throw std::logic_error("Layer graph routing is stale; call links() after adding layers.");
            }
        }

        [[nodiscard]] CheckReport check(const std::vector<int64_t>& input_shape) const;
        [[nodiscard]] CheckReport check(const torch::Tensor& prototype_input) const;

    private:
        static constexpr std::size_t kInputNode = 0;

        [[nodiscard]] static std::size_t module_node(std::size_t layer_index) noexcept { return layer_index + 1; }

        static void validate_parameters(const RegisteredLayer& layer)
        {
            using Layer::Details::Slot;
            auto expect = [&](Slot slot, std::int64_t axis, std::int64_t expected) {
                if (!layer.has_parameter(slot)) {
                    return;
                }
                const auto& tensor = layer.parameter(slot);
                if (tensor.dim() <= axis) {
                    return;
                }
                if (tensor.size(axis) != expected) {
                    throw ShapeMismatchError(layer.name, layer.name, expected, tensor.size(axis),
                                             std::string(to_string(slot)) + " axis " + std::to_string(axis));
                }
            };

            if (layer.channels.out_channels) {
                const auto out = *layer.channels.out_channels;
                expect(Slot::Weight, 0, out);
                expect(Slot::Bias, 0, out);
                expect(Slot::RunningMean, 0, out);
                expect(Slot::RunningVar, 0, out);
            }
            if (layer.channels.in_channels && layer.kind != Layer::Kind::Normalization) {
                expect(Slot::Weight, 1, *layer.channels.in_channels / std::max<std::int64_t>(1, layer.channels.groups));
            }
        }

        void clear_compiled_graph()
        {
            routing_active_ = false;
            compiled_nodes_.clear();
            execution_steps_.clear();
            producers_.clear();
            consumers_.clear();
            output_slots_.clear();
            topological_order_.clear();
            output_count_ = 0;
        }

        void compile_sequential()
        {
            std::vector<LinkSpec> chain{};
            chain.reserve(layers_.size() + 1);
            if (layers_.empty()) {
                clear_compiled_graph();
                routing_active_ = true;
                return;
            }
            chain.emplace_back(Port::Input(), Port::Module(layers_.front().name));
            for (std::size_t index = 1; index < layers_.size(); ++index) {
                chain.emplace_back(Port::Module(layers_[index - 1].name), Port::Module(layers_[index].name));
            }
            chain.emplace_back(Port::Module(layers_.back().name), Port::Output());
            compile_links(chain);
        }

        void compile_links(const std::vector<LinkSpec>& specifications)
        {
            std::vector<CompiledNode> nodes;
            nodes.reserve(layers_.size() + 2);

            CompiledNode input_node{};
            input_node.kind = CompiledNode::Kind::Input;
            input_node.label = "@input";
            nodes.push_back(std::move(input_node));

            for (std::size_t index = 0; index < layers_.size(); ++index) {
                CompiledNode node{};
                node.kind = CompiledNode::Kind::Module;
                node.index = index;
                node.label = layers_[index].name;
                nodes.push_back(std::move(node));
            }

            std::unordered_map<std::size_t, std::size_t> output_nodes{};
            auto ensure_output_node = [&](std::size_t slot) -> std::size_t {
                if (auto it = output_nodes.find(slot); it != output_nodes.end()) {
                    return it->second;
                }
                CompiledNode node{};
                node.kind = CompiledNode::Kind::Output;
                node.index = slot;
                node.label = "@output[" + std::to_string(slot) + "]";
                nodes.push_back(std::move(node));
                output_nodes.emplace(slot, nodes.size() - 1);
                return nodes.size() - 1;
            };

            auto resolve_module = [&](const Port& port) -> std::size_t {
                if (auto it = name_index_.find(port.identifier); it != name_index_.end()) {
                    return module_node(it->second);
                }
                if (!port.identifier.empty() && port.identifier.front() == '#') {
                    if (auto numeric = Port::parse_index(std::string_view(port.identifier).substr(1));
                        numeric && *numeric < layers_.size()) {
                        return module_node(*numeric);
                    }
                }
                throw std::invalid_argument("Unknown module referenced by port '" + port.describe() + "'.");
            };

            auto resolve_port = [&](const Port& port) -> std::size_t {
                switch (port.kind) {
                    case Port::Kind::Input: return kInputNode;
                    case Port::Kind::Output: {
                        const auto slot = Port::output_slot(port);
                        if (!slot) {
                            throw std::invalid_argument("Unknown output '" + port.describe() + "'.");
                        }
                        return ensure_output_node(*slot);
                    }
                    case Port::Kind::Module: return resolve_module(port);
                }
                throw std::invalid_argument("Unsupported port kind encountered while resolving links.");
            };

            for (const auto& specification : specifications) {
                const auto source_index = resolve_port(specification.source);
                const auto target_index = resolve_port(specification.target);

                if (nodes[source_index].kind == CompiledNode::Kind::Output) {
                    throw std::invalid_argument("Output port '" + specification.source.describe() + "' cannot be used as a source.");
                }
                if (nodes[target_index].kind == CompiledNode::Kind::Input) {
                    throw std::invalid_argument("Input port '" + specification.target.describe() + "' cannot be used as a target.");
                }
                if (!nodes[target_index].inputs.empty()) {
                    throw std::invalid_argument("Consumer port '" + specification.target.describe() + "' already has a producer.");
                }
                nodes[source_index].outputs.push_back(target_index);
                nodes[target_index].inputs.push_back(source_index);
            }

            for (const auto& node : nodes) {
                if (node.kind == CompiledNode::Kind::Module && node.inputs.empty()) {
                    throw std::invalid_argument("Module node '" + node.label + "' has no inbound links in the routing graph.");
                }
            }
            if (output_nodes.empty()) {
                throw std::invalid_argument("Link specification does not reach '@output'.");
            }
            for (std::size_t slot = 0; slot < output_nodes.size(); ++slot) {
                if (output_nodes.find(slot) == output_nodes.end()) {
                    throw std::invalid_argument("Outputs must be numbered contiguously; '@output[" + std::to_string(slot) + "]' is missing.");
                }
            }

            // Toposort
            std::vector<std::size_t> indegree(nodes.size(), 0);
            for (const auto& node : nodes) {
                for (auto target : node.outputs) {
                    ++indegree[target];
                }
            }
            std::deque<std::size_t> queue;
            for (std::size_t index = 0; index < nodes.size(); ++index) {
                if (indegree[index] == 0) {
                    queue.push_back(index);
                }
            }

            std::vector<ExecutionStep> execution_steps;
            std::vector<std::size_t> order;
            std::size_t visited = 0;
            while (!queue.empty()) {
                const auto node_index = queue.front();
                queue.pop_front();
                ++visited;
                const auto& node = nodes[node_index];
                if (node.kind == CompiledNode::Kind::Module) {
                    ExecutionStep step{};
                    step.kind = ExecutionStep::Kind::Module;
                    step.activation_index = node_index;
                    step.layer_index = node.index;
                    step.input_index = node.inputs.front();
                    execution_steps.push_back(step);
                    order.push_back(node.index);
                } else if (node.kind == CompiledNode::Kind::Output) {
                    ExecutionStep step{};
                    step.kind = ExecutionStep::Kind::Output;
                    step.activation_index = node_index;
                    step.input_index = node.inputs.front();
                    step.output_slot = node.index;
                    execution_steps.push_back(step);
                }
                for (auto target : node.outputs) {
                    if (--indegree[target] == 0) {
                        queue.push_back(target);
                    }
                }
            }
            if (visited != nodes.size()) {
                throw std::invalid_argument("Link specification contains cycles; unable to compile routing graph.");
            }

            std::vector<std::optional<std::size_t>> producers(layers_.size());
            std::vector<std::vector<std::size_t>> consumers(layers_.size());
            std::vector<std::vector<std::size_t>> output_slots(layers_.size());
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                const auto& node = nodes[module_node(index)];
                const auto source = node.inputs.front();
                if (nodes[source].kind == CompiledNode::Kind::Module) {
                    producers[index] = nodes[source].index;
                }
                for (auto target : node.outputs) {
                    if (nodes[target].kind == CompiledNode::Kind::Module) {
                        consumers[index].push_back(nodes[target].index);
                    } else if (nodes[target].kind == CompiledNode::Kind::Output) {
                        output_slots[index].push_back(nodes[target].index);
                    }
                }
            }

            compiled_nodes_ = std::move(nodes);
            execution_steps_ = std::move(execution_steps);
            producers_ = std::move(producers);
            consumers_ = std::move(consumers);
            output_slots_ = std::move(output_slots);
            topological_order_ = std::move(order);
            output_count_ = output_nodes.size();
            routing_active_ = true;
        }

        std::vector<RegisteredLayer> layers_{};
        std::vector<Layer::Descriptor> descriptors_{};
        std::unordered_map<std::string, std::size_t> name_index_{};
        std::vector<LinkSpec> link_specs_{};
        bool explicit_routing_{false};

        bool routing_active_{true};
        std::vector<CompiledNode> compiled_nodes_{};
        std::vector<ExecutionStep> execution_steps_{};
        std::vector<std::optional<std::size_t>> producers_{};
        std::vector<std::vector<std::size_t>> consumers_{};
        std::vector<std::vector<std::size_t>> output_slots_{};
        std::vector<std::size_t> topological_order_{};
        std::size_t output_count_{0};
    };
}

#include "utils/check.hpp"

#endif //SHEAR_NETWORK_HPP
