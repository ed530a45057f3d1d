#ifndef SHEAR_CHECK_HPP
#define SHEAR_CHECK_HPP

#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../activation/apply.hpp"

namespace Shear {
    namespace CheckDetails {
        inline std::string format_shape(const std::vector<int64_t>& shape)
        {
            if (shape.empty()) {
                return std::string{"()"};
            }

            std::ostringstream stream;
            stream << '(';
            for (std::size_t i = 0; i < shape.size(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                stream << shape[i];
            }
            stream << ')';
            return stream.str();
        }

        inline std::string describe_module(const Layer::Details::RegisteredLayer& layer)
        {
            if (!layer.module) {
                return "Functional layer";
            }
            return layer.module->name();
        }
    }

    inline std::string LayerGraph::CheckReport::to_string() const
    {
        std::ostringstream stream;
        stream << "Graph diagnostics: " << (ok ? "PASS" : "FAIL") << '\n';

        if (!warnings.empty()) {
            stream << "Warnings:" << '\n';
            for (const auto& warning : warnings) {
                stream << "  - " << warning << '\n';
            }
        }

        for (const auto& layer : layers) {
            stream << "[#" << layer.index << "] " << layer.name << " (" << layer.module_name;
            if (!layer.activation.empty() && layer.activation != "identity") {
                stream << " + " << layer.activation;
            }
            stream << ")\n";
            stream << "    input : " << CheckDetails::format_shape(layer.input_shape) << '\n';
            if (!layer.expected_input_shape.empty()) {
                stream << "    expect input : " << CheckDetails::format_shape(layer.expected_input_shape) << '\n';
            }
            if (layer.ok) {
                stream << "    output: " << CheckDetails::format_shape(layer.output_shape) << '\n';
                if (!layer.message.empty()) {
                    stream << "    note  : " << layer.message << '\n';
                }
            } else {
                stream << "    status: FAILED" << '\n';
                if (!layer.message.empty()) {
                    stream << "    reason: " << layer.message << '\n';
                }
            }
        }

        for (std::size_t slot = 0; slot < output_shapes.size(); ++slot) {
            stream << "@output[" << slot << "]: " << CheckDetails::format_shape(output_shapes[slot]) << '\n';
        }

        return stream.str();
    }

    inline LayerGraph::CheckReport LayerGraph::check(const std::vector<int64_t>& input_shape) const
    {
        if (input_shape.empty()) {
            throw std::invalid_argument("LayerGraph::check requires a non-empty input shape.");
        }

        if (std::any_of(input_shape.begin(), input_shape.end(), [](int64_t dimension) { return dimension <= 0; })) {
            throw std::invalid_argument("LayerGraph::check requires all input dimensions to be positive.");
        }

        auto tensor = torch::randn(input_shape, torch::TensorOptions().dtype(torch::kFloat32).device(device()));
        return check(tensor);
    }

    inline LayerGraph::CheckReport LayerGraph::check(const torch::Tensor& prototype_input) const
    {
        if (!prototype_input.defined()) {
            throw std::invalid_argument("LayerGraph::check requires a defined prototype input tensor.");
        }

        CheckReport report{};
        if (layers_.empty()) {
            report.ok = false;
            report.warnings.push_back("Graph does not contain any registered layers.");
            return report;
        }
        if (!routing_active_) {
            report.ok = false;
            report.warnings.push_back("Graph routing is stale; call links() after adding layers.");
            return report;
        }

        auto pad_shape = [](const std::vector<int64_t>& actual, std::size_t minimum_rank) {
            std::vector<int64_t> padded = actual;
            if (padded.size() < minimum_rank) {
                padded.resize(minimum_rank, static_cast<int64_t>(-1));
            }
            return padded;
        };

        auto assign_expected_input = [&](LayerCheck& entry, const RegisteredLayer& layer) {
            if (!layer.channels.in_channels) {
                return;
            }
            if (layer.kind == Layer::Kind::Dense) {
                auto expected = entry.input_shape;
                if (expected.empty()) {
                    expected.push_back(*layer.channels.in_channels);
                } else {
                    expected.back() = *layer.channels.in_channels;
                }
                entry.expected_input_shape = std::move(expected);
            } else {
                auto expected = pad_shape(entry.input_shape, 4);
                expected[1] = *layer.channels.in_channels;
                entry.expected_input_shape = std::move(expected);
            }
        };

        torch::NoGradGuard no_grad{};
        std::vector<torch::Tensor> node_buffers(compiled_nodes_.size());
        node_buffers[kInputNode] = prototype_input.to(device()).detach();
        report.output_shapes.resize(output_count_);
        report.layers.reserve(layers_.size());

        bool success = true;
        for (const auto& step : execution_steps_) {
            if (step.kind == ExecutionStep::Kind::Output) {
                report.output_shapes[step.output_slot] = node_buffers[step.input_index].sizes().vec();
                continue;
            }

            const auto& layer = layers_[step.layer_index];
            LayerCheck entry{};
            entry.index = step.layer_index;
            entry.name = layer.name;
            entry.module_name = CheckDetails::describe_module(layer);
            entry.activation = Activation::Details::to_string(layer.activation);
            entry.input_shape = node_buffers[step.input_index].sizes().vec();
            assign_expected_input(entry, layer);

            try {
                auto output = layer.run(node_buffers[step.input_index]);
                entry.output_shape = output.sizes().vec();
                entry.ok = true;
                node_buffers[step.activation_index] = std::move(output);
            } catch (const c10::Error& error) {
                entry.ok = false;
                entry.message = error.msg();
            } catch (const std::exception& error) {
                entry.ok = false;
                entry.message = error.what();
            }

            if (!entry.ok && !entry.expected_input_shape.empty() && entry.expected_input_shape != entry.input_shape) {
                entry.message += " Expected input " + CheckDetails::format_shape(entry.expected_input_shape)
                                 + " but received " + CheckDetails::format_shape(entry.input_shape) + '.';
            }

            const bool layer_ok = entry.ok;
            report.layers.push_back(std::move(entry));
            if (!layer_ok) {
                success = false;
                break;
            }
        }

        report.ok = success;
        return report;
    }
}

#endif //SHEAR_CHECK_HPP
