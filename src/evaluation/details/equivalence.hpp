#ifndef SHEAR_EVALUATION_EQUIVALENCE_HPP
#define SHEAR_EVALUATION_EQUIVALENCE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../network.hpp"
#include "../../utils/terminal.hpp"

namespace Shear::Evaluation::Details {
    struct EquivalenceOptions {
        double rtol{1e-5};
        double atol{1e-5};
        std::vector<std::int64_t> input_shape{};  // used by the overload that draws its own inputs
        std::size_t trials{4};
        std::uint64_t seed{0};
        bool print_summary{true};
        std::ostream* stream{&std::cout};
    };

    struct OutputComparison {
        std::size_t trial{};
        std::size_t output{};
        std::vector<std::int64_t> reference_shape{};
        std::vector<std::int64_t> reduced_shape{};
        double max_abs_diff{0.0};
        std::int64_t violations{0};
        bool ok{false};
    };

    struct EquivalenceReport {
        bool ok{true};
        std::size_t trials{0};
        double max_abs_diff{0.0};
        std::vector<OutputComparison> comparisons{};

        [[nodiscard]] std::string to_string() const
        {
            auto shape_to_string = [](const std::vector<std::int64_t>& shape) {
                std::ostringstream stream;
                stream << '(';
                for (std::size_t i = 0; i < shape.size(); ++i) {
                    stream << (i > 0 ? ", " : "") << shape[i];
                }
                stream << ')';
                return stream.str();
            };

            std::ostringstream stream;
            stream << "Equivalence: " << (ok ? "PASS" : "FAIL") << " over " << trials << " trial(s), max |diff| "
                   << std::scientific << std::setprecision(3) << max_abs_diff << '\n';
            for (const auto& comparison : comparisons) {
                if (comparison.ok) {
                    continue;
                }
                stream << "  trial " << comparison.trial << " output " << comparison.output << ": ";
                if (comparison.reference_shape != comparison.reduced_shape) {
                    stream << "shape " << shape_to_string(comparison.reference_shape) << " vs "
                           << shape_to_string(comparison.reduced_shape) << '\n';
                } else {
                    stream << comparison.violations << " element(s) outside tolerance, max |diff| "
                           << comparison.max_abs_diff << '\n';
                }
            }
            return stream.str();
        }
    };

    namespace Detail {
        class EvalModeGuard {
        public:
            explicit EvalModeGuard(LayerGraph& graph) : graph_(graph), was_training_(graph.is_training())
            {
                graph_.eval();
            }
            ~EvalModeGuard() { graph_.train(was_training_); }

            EvalModeGuard(const EvalModeGuard&) = delete;
            EvalModeGuard& operator=(const EvalModeGuard&) = delete;

        private:
            LayerGraph& graph_;
            bool was_training_{false};
        };

        inline void compare(const std::vector<torch::Tensor>& reference,
                            const std::vector<torch::Tensor>& reduced,
                            std::size_t trial,
                            const EquivalenceOptions& options,
                            EquivalenceReport& report)
        {
            if (reference.size() != reduced.size()) {
                OutputComparison comparison{};
                comparison.trial = trial;
                comparison.output = std::min(reference.size(), reduced.size());
                comparison.ok = false;
                report.comparisons.push_back(std::move(comparison));
                report.ok = false;
                return;
            }

            for (std::size_t output = 0; output < reference.size(); ++output) {
                OutputComparison comparison{};
                comparison.trial = trial;
                comparison.output = output;
                comparison.reference_shape = reference[output].sizes().vec();
                comparison.reduced_shape = reduced[output].sizes().vec();

                if (comparison.reference_shape != comparison.reduced_shape) {
                    comparison.ok = false;
                } else if (reference[output].numel() == 0) {
                    comparison.ok = true;
                } else {
                    const auto expected = reference[output].to(torch::kCPU, torch::kFloat64);
                    const auto actual = reduced[output].to(torch::kCPU, torch::kFloat64);
                    const auto difference = (actual - expected).abs();
                    const auto allowed = options.atol + options.rtol * expected.abs();
                    // NaN differences compare false and count as violations.
                    const auto within = difference.le(allowed);
                    comparison.violations = within.logical_not().sum().item<std::int64_t>();
                    comparison.max_abs_diff = difference.nan_to_num(std::numeric_limits<double>::infinity()).max().item<double>();
                    comparison.ok = comparison.violations == 0;
                }

                report.max_abs_diff = std::max(report.max_abs_diff, comparison.max_abs_diff);
                report.ok = report.ok && comparison.ok;
                report.comparisons.push_back(std::move(comparison));
            }
        }

        inline void finish(const EquivalenceReport& report, const EquivalenceOptions& options)
        {
            if (options.print_summary) {
                Utils::Terminal::Info(options.stream, report.to_string());
            }
            if (!report.ok) {
                throw ::Shear::ValidationMismatchError(
                    "Reduced graph diverges from the masked reference beyond rtol=" + std::to_string(options.rtol)
                        + ", atol=" + std::to_string(options.atol) + "; do not export it.",
                    report.to_string());
            }
        }
    }

    inline void validate_tolerances(const EquivalenceOptions& options)
    {
        if (!(options.rtol >= 0.0) || !(options.atol >= 0.0)) {
            throw std::invalid_argument("Equivalence tolerances must be non-negative.");
        }
    }

    inline EquivalenceReport validate_equivalence(LayerGraph& reference,
                                                  LayerGraph& reduced,
                                                  const std::vector<torch::Tensor>& inputs,
                                                  const EquivalenceOptions& options = {})
    {
        validate_tolerances(options);
        if (inputs.empty()) {
            throw std::invalid_argument("validate_equivalence requires at least one input tensor.");
        }

        torch::NoGradGuard no_grad{};
        Detail::EvalModeGuard reference_mode(reference);
        Detail::EvalModeGuard reduced_mode(reduced);

        EquivalenceReport report{};
        for (std::size_t trial = 0; trial < inputs.size(); ++trial) {
            const auto& input = inputs[trial];
            if (!input.defined()) {
                throw std::invalid_argument("validate_equivalence received an undefined input tensor.");
            }
            const auto expected = reference.forward_all(input.to(reference.device()));
            const auto actual = reduced.forward_all(input.to(reduced.device()));
            Detail::compare(expected, actual, trial, options, report);
            ++report.trials;
        }

        Detail::finish(report, options);
        return report;
    }

    inline EquivalenceReport validate_equivalence(LayerGraph& reference,
                                                  LayerGraph& reduced,
                                                  torch::Tensor input,
                                                  const EquivalenceOptions& options = {})
    {
        return validate_equivalence(reference, reduced, std::vector<torch::Tensor>{std::move(input)}, options);
    }

    // Draws `trials` standard-normal inputs of `input_shape` from a generator seeded with `seed`.
    inline EquivalenceReport validate_equivalence(LayerGraph& reference,
                                                  LayerGraph& reduced,
                                                  const EquivalenceOptions& options)
    {
        if (options.input_shape.empty()) {
            throw std::invalid_argument("EquivalenceOptions::input_shape is required when no input is supplied.");
        }
        if (options.trials == 0) {
            throw std::invalid_argument("EquivalenceOptions::trials must be at least one.");
        }

        auto generator = at::detail::createCPUGenerator(options.seed);
        std::vector<torch::Tensor> inputs{};
        inputs.reserve(options.trials);
        for (std::size_t trial = 0; trial < options.trials; ++trial) {
            inputs.push_back(torch::randn(options.input_shape, generator, torch::TensorOptions().dtype(torch::kFloat32)));
        }
        return validate_equivalence(reference, reduced, inputs, options);
    }
}

#endif //SHEAR_EVALUATION_EQUIVALENCE_HPP
