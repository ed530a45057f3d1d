#ifndef SHEAR_COMMON_GRAPH_HPP
#define SHEAR_COMMON_GRAPH_HPP

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Shear {
    struct Port {
        enum class Kind {
            Input,
            Output,
            Module
        };

        Kind kind{Kind::Module};
        std::string identifier{};
        std::string representation{};
        std::optional<std::size_t> node_index{};

        Port() = default;

        [[nodiscard]] bool is_input() const noexcept { return kind == Kind::Input; }
        [[nodiscard]] bool is_output() const noexcept { return kind == Kind::Output; }
        [[nodiscard]] bool is_module() const noexcept { return kind == Kind::Module; }
        [[nodiscard]] const std::string& describe() const noexcept { return representation; }

        void assign_node(std::size_t value) { node_index = value; }

        static Port Module(std::string_view specification)
        {
            const auto trimmed = trim(specification);
            if (trimmed.empty()) {
                throw std::invalid_argument("Port::Module requires a non-empty specification.");
            }

            Port port{};
            port.kind = Kind::Module;
            port.identifier.assign(trimmed.begin(), trimmed.end());
            port.representation = port.identifier;
            return port;
        }

        static Port Input(std::string_view name = "@input") {
            const auto trimmed = trim(name);
            if (trimmed.empty()) {
                throw std::invalid_argument("Port::Input requires a non-empty name.");
            }
            if (trimmed != "@input") {
                throw std::invalid_argument(
                    "Unsupported input sentinel '" + std::string(trimmed) + "'. Graphs take a single '@input'.");
            }
            Port p{};
            p.kind = Kind::Input;
            p.identifier.assign(trimmed.begin(), trimmed.end());
            p.representation = p.identifier;
            return p;
        }

        // "@output" is output 0; "@output[k]" or "#k" names further outputs.
        static Port Output(std::string_view name = "@output") {
            const auto trimmed = trim(name);
            if (trimmed.empty()) {
                throw std::invalid_argument("Port::Output requires a non-empty name.");
            }
            Port p{};
            p.kind = Kind::Output;
            p.identifier.assign(trimmed.begin(), trimmed.end());
            p.representation = p.identifier;
            if (!output_slot(p).has_value()) {
                throw std::invalid_argument(
                    "Unsupported output sentinel '" + p.identifier + "'. Use '@output', '@output[k]' or '#k'.");
            }
            return p;
        }

        [[nodiscard]] static std::optional<std::size_t> output_slot(const Port& port)
        {
            std::string_view token = port.identifier;
            if (token == "@output") {
                return std::size_t{0};
            }
            if (token.rfind("@output[", 0) == 0 && token.back() == ']') {
                token = token.substr(8, token.size() - 9);
            } else if (!token.empty() && token.front() == '#') {
                token.remove_prefix(1);
            } else {
                return std::nullopt;
            }
            return parse_index(token);
        }

        [[nodiscard]] static std::optional<std::size_t> parse_index(std::string_view token)
        {
            if (token.empty()) {
                return std::nullopt;
            }
            std::size_t value = 0;
            for (char c : token) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return std::nullopt;
                }
                value = value * 10 + static_cast<std::size_t>(c - '0');
            }
            return value;
        }

    private:
        static std::string_view trim(std::string_view token)
        {
            while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front()))) {
                token.remove_prefix(1);
            }
            while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) {
                token.remove_suffix(1);
            }
            return token;
        }
    };

    struct LinkSpec {
        Port source{};
        Port target{};

        LinkSpec() = default;
        LinkSpec(Port source, Port target) : source(std::move(source)), target(std::move(target)) {}
    };

    struct CompiledNode {
        enum class Kind {
            Input,
            Module,
            Output
        };

        Kind kind{Kind::Module};
        std::size_t index{std::numeric_limits<std::size_t>::max()};
        std::string label{};
        std::vector<std::size_t> inputs{};
        std::vector<std::size_t> outputs{};
    };

    struct ExecutionStep {
        enum class Kind {
            Module,
            Output
        };

        Kind kind{Kind::Module};
        std::size_t activation_index{std::numeric_limits<std::size_t>::max()};
        std::size_t layer_index{std::numeric_limits<std::size_t>::max()};
        std::size_t input_index{std::numeric_limits<std::size_t>::max()};
        std::size_t output_slot{0};
    };
}

#endif // SHEAR_COMMON_GRAPH_HPP
