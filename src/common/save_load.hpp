#ifndef SHEAR_COMMON_SAVE_LOAD_HPP
#define SHEAR_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"
#include "../evaluation/details/equivalence.hpp"
#include "../initialization/apply.hpp"
#include "../initialization/initialization.hpp"
#include "../layer/layer.hpp"
#include "../mask/details/channel_mask.hpp"
#include "../network.hpp"
#include "../surgery/details/report.hpp"
#include "graph.hpp"

namespace Shear::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing boolean field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline const PropertyTree& get_child(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                std::ostringstream message;
                message << "Missing section '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *child;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw std::runtime_error(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }

        inline std::string reduce_op_to_string(Layer::Details::ReduceOp op)
        {
            switch (op) {
                case Layer::Details::ReduceOp::Sum: return "sum";
                case Layer::Details::ReduceOp::Max: return "max";
                case Layer::Details::ReduceOp::Min: return "min";
                case Layer::Details::ReduceOp::Mean:
                default: return "mean";
            }
        }

        inline Layer::Details::ReduceOp reduce_op_from_string(const std::string& value)
        {
            const auto lowered = to_lower(value);
            if (lowered == "sum") return Layer::Details::ReduceOp::Sum;
            if (lowered == "mean") return Layer::Details::ReduceOp::Mean;
            if (lowered == "max") return Layer::Details::ReduceOp::Max;
            if (lowered == "min") return Layer::Details::ReduceOp::Min;
            throw std::runtime_error("Unknown reduce op '" + value + "'.");
        }

        inline PropertyTree serialize_activation_descriptor(const Activation::Descriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", Activation::Details::to_string(descriptor.type));
            return tree;
        }

        inline Activation::Descriptor deserialize_activation_descriptor(const PropertyTree& tree, const std::string& context)
        {
            const auto type = get_string(tree, "type", context + " activation");
            return Activation::Descriptor{Activation::Details::from_string(to_lower(type))};
        }

        inline PropertyTree serialize_initialization_descriptor(const Initialization::Descriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", Initialization::Details::to_string(descriptor.type));
            return tree;
        }

        inline Initialization::Descriptor deserialize_initialization_descriptor(const PropertyTree& tree,
                                                                                const std::string& context)
        {
            const auto type = get_string(tree, "type", context + " initialization");
            return Initialization::Descriptor{Initialization::Details::from_string(to_lower(type))};
        }

        inline Activation::Descriptor optional_activation(const PropertyTree& tree, const std::string& context)
        {
            if (const auto child = tree.get_child_optional("activation")) {
                return deserialize_activation_descriptor(*child, context);
            }
            return Activation::Identity;
        }

        inline Initialization::Descriptor optional_initialization(const PropertyTree& tree, const std::string& context)
        {
            if (const auto child = tree.get_child_optional("initialization")) {
                return deserialize_initialization_descriptor(*child, context);
            }
            return Initialization::Default;
        }

        inline std::string port_kind_to_string(Port::Kind kind)
        {
            switch (kind) {
                case Port::Kind::Input: return "input";
                case Port::Kind::Output: return "output";
                case Port::Kind::Module:
                default: return "module";
            }
        }

        inline PropertyTree serialize_port(const Port& port)
        {
            PropertyTree tree;
            tree.put("kind", port_kind_to_string(port.kind));
            tree.put("id", port.identifier);
            return tree;
        }

        inline Port deserialize_port(const PropertyTree& tree, const std::string& context)
        {
            const auto kind = to_lower(get_string(tree, "kind", context));
            const auto identifier = get_string(tree, "id", context);
            if (kind == "input") return Port::Input(identifier);
            if (kind == "output") return Port::Output(identifier);
            if (kind == "module") return Port::Module(identifier);
            throw std::runtime_error("Unknown port kind '" + kind + "' in " + context);
        }
    }

    inline PropertyTree serialize_layer_descriptor(const Layer::Descriptor& descriptor)
    {
        PropertyTree tree;
        std::visit(
            [&](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<DescriptorType, Layer::FCDescriptor>) {
                    tree.put("type", "fc");
                    tree.put("options.in_features", concrete.options.in_features);
                    tree.put("options.out_features", concrete.options.out_features);
                    tree.put("options.bias", concrete.options.bias);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                    tree.add_child("initialization", Detail::serialize_initialization_descriptor(concrete.initialization));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::Conv2dDescriptor>) {
                    tree.put("type", "conv2d");
                    tree.put("options.in_channels", concrete.options.in_channels);
                    tree.put("options.out_channels", concrete.options.out_channels);
                    tree.add_child("options.kernel_size", Detail::write_array(concrete.options.kernel_size));
                    tree.add_child("options.stride", Detail::write_array(concrete.options.stride));
                    tree.add_child("options.padding", Detail::write_array(concrete.options.padding));
                    tree.add_child("options.dilation", Detail::write_array(concrete.options.dilation));
                    tree.put("options.groups", concrete.options.groups);
                    tree.put("options.bias", concrete.options.bias);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                    tree.add_child("initialization", Detail::serialize_initialization_descriptor(concrete.initialization));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::BatchNorm2dDescriptor>) {
                    tree.put("type", "batch_norm2d");
                    tree.put("options.num_features", concrete.options.num_features);
                    tree.put("options.eps", concrete.options.eps);
                    tree.put("options.momentum", concrete.options.momentum);
                    tree.put("options.affine", concrete.options.affine);
                    tree.put("options.track_running_stats", concrete.options.track_running_stats);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                    tree.add_child("initialization", Detail::serialize_initialization_descriptor(concrete.initialization));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::PoolingDescriptor>) {
                    tree.put("type", "pooling");
                    std::visit(
                        [&](const auto& options) {
                            using OptionType = std::decay_t<decltype(options)>;
                            if constexpr (std::is_same_v<OptionType, Layer::MaxPool2dOptions>) {
                                tree.put("options.variant", "max2d");
                                tree.add_child("options.kernel_size", Detail::write_array(options.kernel_size));
                                tree.add_child("options.stride", Detail::write_array(options.stride));
                                tree.add_child("options.padding", Detail::write_array(options.padding));
                                tree.add_child("options.dilation", Detail::write_array(options.dilation));
                                tree.put("options.ceil_mode", options.ceil_mode);
                            } else if constexpr (std::is_same_v<OptionType, Layer::AvgPool2dOptions>) {
                                tree.put("options.variant", "avg2d");
                                tree.add_child("options.kernel_size", Detail::write_array(options.kernel_size));
                                tree.add_child("options.stride", Detail::write_array(options.stride));
                                tree.add_child("options.padding", Detail::write_array(options.padding));
                                tree.put("options.ceil_mode", options.ceil_mode);
                                tree.put("options.count_include_pad", options.count_include_pad);
                            } else if constexpr (std::is_same_v<OptionType, Layer::AdaptiveAvgPool2dOptions>) {
                                tree.put("options.variant", "adaptive_avg2d");
                                tree.add_child("options.output_size", Detail::write_array(options.output_size));
                            } else if constexpr (std::is_same_v<OptionType, Layer::AdaptiveMaxPool2dOptions>) {
                                tree.put("options.variant", "adaptive_max2d");
                                tree.add_child("options.output_size", Detail::write_array(options.output_size));
                            } else {
                                static_assert(sizeof(OptionType) == 0, "Unsupported pooling options for serialization.");
                            }
                        },
                        concrete.options);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::FlattenDescriptor>) {
                    tree.put("type", "flatten");
                    tree.put("options.start_dim", concrete.options.start_dim);
                    tree.put("options.end_dim", concrete.options.end_dim);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::ReduceDescriptor>) {
                    tree.put("type", "reduce");
                    tree.put("options.op", Detail::reduce_op_to_string(concrete.options.op));
                    tree.add_child("options.dims", Detail::write_array(concrete.options.dims));
                    tree.put("options.keep_dim", concrete.options.keep_dim);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                } else {
                    static_assert(sizeof(DescriptorType) == 0, "Unsupported layer descriptor for serialization.");
                }
            },
            descriptor);
        return tree;
    }

    inline Layer::Descriptor deserialize_layer_descriptor(const PropertyTree& tree, const std::string& context)
    {
        const auto type = Detail::to_lower(Detail::get_string(tree, "type", context));
        const auto& options = Detail::get_child(tree, "options", context);
        const auto activation = Detail::optional_activation(tree, context);

        auto read_extents = [&](const std::string& key) {
            return Detail::read_array<std::int64_t>(Detail::get_child(options, key, context), context + " " + key);
        };

        if (type == "fc") {
            Layer::FCOptions fc{};
            fc.in_features = Detail::get_numeric<std::int64_t>(options, "in_features", context);
            fc.out_features = Detail::get_numeric<std::int64_t>(options, "out_features", context);
            fc.bias = Detail::get_boolean(options, "bias", context);
            return Layer::FC(fc, activation, Detail::optional_initialization(tree, context));
        }
        if (type == "conv2d") {
            Layer::Conv2dOptions conv{};
            conv.in_channels = Detail::get_numeric<std::int64_t>(options, "in_channels", context);
            conv.out_channels = Detail::get_numeric<std::int64_t>(options, "out_channels", context);
            conv.kernel_size = read_extents("kernel_size");
            conv.stride = read_extents("stride");
            conv.padding = read_extents("padding");
            conv.dilation = read_extents("dilation");
            conv.groups = Detail::get_numeric<std::int64_t>(options, "groups", context);
            conv.bias = Detail::get_boolean(options, "bias", context);
            return Layer::Conv2d(conv, activation, Detail::optional_initialization(tree, context));
        }
        if (type == "batch_norm2d") {
            Layer::BatchNorm2dOptions norm{};
            norm.num_features = Detail::get_numeric<std::int64_t>(options, "num_features", context);
            norm.eps = Detail::get_numeric<double>(options, "eps", context);
            norm.momentum = Detail::get_numeric<double>(options, "momentum", context);
            norm.affine = Detail::get_boolean(options, "affine", context);
            norm.track_running_stats = Detail::get_boolean(options, "track_running_stats", context);
            return Layer::BatchNorm2d(norm, activation, Detail::optional_initialization(tree, context));
        }
        if (type == "pooling") {
            const auto variant = Detail::to_lower(Detail::get_string(options, "variant", context));
            if (variant == "max2d") {
                Layer::MaxPool2dOptions pool{};
                pool.kernel_size = read_extents("kernel_size");
                pool.stride = read_extents("stride");
                pool.padding = read_extents("padding");
                pool.dilation = read_extents("dilation");
                pool.ceil_mode = Detail::get_boolean(options, "ceil_mode", context);
                return Layer::MaxPool2d(pool, activation);
            }
            if (variant == "avg2d") {
                Layer::AvgPool2dOptions pool{};
                pool.kernel_size = read_extents("kernel_size");
                pool.stride = read_extents("stride");
                pool.padding = read_extents("padding");
                pool.ceil_mode = Detail::get_boolean(options, "ceil_mode", context);
                pool.count_include_pad = Detail::get_boolean(options, "count_include_pad", context);
                return Layer::AvgPool2d(pool, activation);
            }
            if (variant == "adaptive_avg2d") {
                return Layer::AdaptiveAvgPool2d({read_extents("output_size")}, activation);
            }
            if (variant == "adaptive_max2d") {
                return Layer::AdaptiveMaxPool2d({read_extents("output_size")}, activation);
            }
            throw std::runtime_error("Unknown pooling variant '" + variant + "' in " + context);
        }
        if (type == "flatten") {
            Layer::FlattenOptions flatten{};
            flatten.start_dim = Detail::get_numeric<std::int64_t>(options, "start_dim", context);
            flatten.end_dim = Detail::get_numeric<std::int64_t>(options, "end_dim", context);
            return Layer::Flatten(flatten, activation);
        }
        if (type == "reduce") {
            Layer::ReduceOptions reduce{};
            reduce.op = Detail::reduce_op_from_string(Detail::get_string(options, "op", context));
            reduce.dims = read_extents("dims");
            reduce.keep_dim = Detail::get_boolean(options, "keep_dim", context);
            return Layer::Reduce(reduce, activation);
        }

        std::ostringstream message;
        message << "Unknown layer type '" << type << "' in " << context;
        throw std::runtime_error(message.str());
    }

    // Layer descriptors and routing only; tensors are not part of the architecture.
    inline PropertyTree serialize_architecture(const LayerGraph& graph)
    {
        PropertyTree layers;
        for (std::size_t index = 0; index < graph.size(); ++index) {
            PropertyTree entry;
            entry.put("name", graph.name(index));
            entry.add_child("descriptor", serialize_layer_descriptor(graph.descriptor(index)));
            layers.push_back({"", entry});
        }

        PropertyTree tree;
        tree.add_child("layers", layers);
        if (graph.has_explicit_routing()) {
            PropertyTree links;
            for (const auto& link : graph.link_specs()) {
                PropertyTree entry;
                entry.add_child("source", Detail::serialize_port(link.source));
                entry.add_child("target", Detail::serialize_port(link.target));
                links.push_back({"", entry});
            }
            tree.add_child("links", links);
        }
        return tree;
    }

    inline std::shared_ptr<LayerGraph> deserialize_architecture(const PropertyTree& tree, const std::string& context)
    {
        auto graph = std::make_shared<LayerGraph>();
        std::size_t position = 0;
        for (const auto& node : Detail::get_child(tree, "layers", context)) {
            const auto entry_context = context + " layer " + std::to_string(position++);
            graph->add(deserialize_layer_descriptor(Detail::get_child(node.second, "descriptor", entry_context), entry_context),
                       node.second.get<std::string>("name", std::string{}));
        }

        if (const auto links = tree.get_child_optional("links")) {
            std::vector<LinkSpec> specifications;
            specifications.reserve(links->size());
            for (const auto& node : *links) {
                specifications.emplace_back(Detail::deserialize_port(Detail::get_child(node.second, "source", context), context),
                                            Detail::deserialize_port(Detail::get_child(node.second, "target", context), context));
            }
            graph->links(std::move(specifications));
        }
        return graph;
    }

    inline PropertyTree serialize_masks(const Mask::Details::MaskSet& masks)
    {
        PropertyTree tree;
        for (const auto& [name, mask] : masks) {
            std::vector<int> values;
            values.reserve(static_cast<std::size_t>(mask.size()));
            for (const bool keep : mask.values()) {
                values.push_back(keep ? 1 : 0);
            }
            PropertyTree entry;
            entry.put("name", name);
            entry.put("corrected", mask.corrected());
            entry.add_child("keep", Detail::write_array(values));
            tree.push_back({"", entry});
        }
        return tree;
    }

    inline Mask::Details::MaskSet deserialize_masks(const PropertyTree& tree, const std::string& context)
    {
        Mask::Details::MaskSet masks;
        for (const auto& node : tree) {
            const auto name = Detail::get_string(node.second, "name", context);
            const auto values = Detail::read_array<int>(Detail::get_child(node.second, "keep", context), context + " mask " + name);
            std::vector<bool> keep;
            keep.reserve(values.size());
            for (const int value : values) {
                if (value != 0 && value != 1) {
                    throw std::runtime_error("Mask '" + name + "' in " + context + " holds a value other than 0 or 1.");
                }
                keep.push_back(value == 1);
            }
            if (!masks.emplace(name, Mask::Details::ChannelMask(std::move(keep), node.second.get<bool>("corrected", false))).second) {
                throw std::runtime_error("Duplicate mask '" + name + "' in " + context);
            }
        }
        return masks;
    }

    inline PropertyTree serialize_surgery_report(const Surgery::Details::SurgeryReport& report)
    {
        PropertyTree tree;
        tree.put("parameters_before", report.parameters_before);
        tree.put("parameters_after", report.parameters_after);
        tree.put("reduction", report.reduction());

        PropertyTree layers;
        for (const auto& layer : report.layers) {
            PropertyTree entry;
            entry.put("name", layer.name);
            entry.put("channels_before", layer.channels_before);
            entry.put("channels_after", layer.channels_after);
            entry.put("status", Surgery::Details::to_string(layer.status));
            entry.add_child("consumers", Detail::write_array(layer.consumers));
            if (!layer.reason.empty()) {
                entry.put("reason", layer.reason);
            }
            layers.push_back({"", entry});
        }
        tree.add_child("layers", layers);
        return tree;
    }

    inline PropertyTree serialize_equivalence_report(const Evaluation::Details::EquivalenceReport& report)
    {
        PropertyTree tree;
        tree.put("ok", report.ok);
        tree.put("trials", report.trials);
        tree.put("max_abs_diff", report.max_abs_diff);

        PropertyTree failures;
        for (const auto& comparison : report.comparisons) {
            if (comparison.ok) {
                continue;
            }
            PropertyTree entry;
            entry.put("trial", comparison.trial);
            entry.put("output", comparison.output);
            entry.add_child("reference_shape", Detail::write_array(comparison.reference_shape));
            entry.add_child("reduced_shape", Detail::write_array(comparison.reduced_shape));
            entry.put("max_abs_diff", comparison.max_abs_diff);
            entry.put("violations", comparison.violations);
            failures.push_back({"", entry});
        }
        tree.add_child("failures", failures);
        return tree;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }
}
#endif // SHEAR_COMMON_SAVE_LOAD_HPP
