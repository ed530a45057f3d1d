#ifndef SHEAR_TRAINING_CONTROLLER_HPP
#define SHEAR_TRAINING_CONTROLLER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../dependency/dependency.hpp"
#include "../mask/apply.hpp"
#include "../mask/mask.hpp"
#include "../network.hpp"
#include "../sparsity/sparsity.hpp"
#include "../utils/terminal.hpp"

namespace Shear::Training {
    enum class Phase {
        Warmup,
        Ramping,
        Stable,
    };

    [[nodiscard]] inline const char* to_string(Phase phase) noexcept
    {
        switch (phase) {
            case Phase::Warmup: return "warmup";
            case Phase::Ramping: return "ramping";
            case Phase::Stable: return "stable";
        }
        return "unknown";
    }

    struct MaskedTrainingOptions {
        Sparsity::Descriptor schedule{Sparsity::PolynomialDecay()};
        std::int64_t recompute_interval{100};
        Mask::Importance importance{Mask::Importance::L1};
        std::vector<std::string> layers{};  // empty: every pointwise convolution
        Dependency::ExtractOptions extract{};
        std::ostream* stream{&std::cout};
        bool monitor{true};
    };

    struct LayerSummary {
        std::string name{};
        std::int64_t channels{};
        std::int64_t kept{};
        double sparsity{};
        bool corrected{false};
        bool coupled{true};
    };

    /*
     * Call begin_step(step) once per training step, before the optimizer update of that step.
     * Recomputation reads the weights left by the previous update and holds the exclusive lock,
     * so it never interleaves with a masked forward.
     */
    class MaskedTrainingController {
    public:
        MaskedTrainingController(LayerGraph& graph, MaskedTrainingOptions options)
            : graph_(graph),
              options_(std::move(options)),
              schedule_(Sparsity::Details::build_schedule(options_.schedule))
        {
            if (options_.recompute_interval <= 0) {
                throw ScheduleConfigError("recompute_interval must be strictly positive, got "
                                          + std::to_string(options_.recompute_interval) + ".");
            }

            layers_ = resolve_layers();
            extraction_ = Dependency::extract_all(graph_, layers_, options_.extract);
            for (const auto& name : layers_) {
                masks_.emplace(name, Mask::ChannelMask::all_keep(graph_.layer(name).channels.out_channels.value_or(0)));
            }
            plan_ = Mask::plan_masks(graph_, masks_, extraction_, options_.stream);

            if (options_.monitor) {
                Utils::Terminal::Info(options_.stream, "Masked training over " + std::to_string(layers_.size())
                                                           + " pointwise layer(s), recompute every "
                                                           + std::to_string(options_.recompute_interval) + " step(s).");
            }
        }

        MaskedTrainingController(const MaskedTrainingController&) = delete;
        MaskedTrainingController& operator=(const MaskedTrainingController&) = delete;

        [[nodiscard]] Phase phase(std::int64_t step) const noexcept
        {
            if (step < schedule_->begin_step()) {
                return Phase::Warmup;
            }
            if (step <= schedule_->end_step()) {
                return Phase::Ramping;
            }
            return Phase::Stable;
        }

        [[nodiscard]] double target(std::int64_t step) const { return schedule_->target(step); }

        // Returns true when the masks were recomputed for this step.
        bool begin_step(std::int64_t step)
        {
            if (frozen_.load()) {
                throw_frozen();
            }
            if (step < 0) {
                throw std::invalid_argument("Training steps are non-negative, got " + std::to_string(step) + ".");
            }
            if (step % options_.recompute_interval != 0) {
                return false;
            }
            recompute(step);
            return true;
        }

        [[nodiscard]] std::vector<torch::Tensor> forward_all(torch::Tensor input) const
        {
            std::shared_lock lock(mutex_);
            const auto effective = Mask::effective_parameters(graph_, plan_);
            return graph_.forward_all(std::move(input), &effective);
        }

        [[nodiscard]] torch::Tensor forward(torch::Tensor input) const
        {
            auto outputs = forward_all(std::move(input));
            if (outputs.size() == 1) {
                return outputs.front();
            }
            return torch::cat(outputs, 1);
        }

        [[nodiscard]] Mask::MaskSet masks() const
        {
            std::shared_lock lock(mutex_);
            return masks_;
        }

        Mask::MaskSet freeze()
        {
            std::unique_lock lock(mutex_);
            frozen_.store(true);
            return masks_;
        }

        [[nodiscard]] bool frozen() const noexcept { return frozen_.load(); }
        [[nodiscard]] const std::vector<std::string>& layers() const noexcept { return layers_; }

        [[nodiscard]] std::int64_t last_recompute_step() const
        {
            std::shared_lock lock(mutex_);
            return last_recompute_step_;
        }

        // Independent graph with the current masks multiplied into its stored tensors.
        [[nodiscard]] std::shared_ptr<LayerGraph> strip() const
        {
            std::shared_lock lock(mutex_);
            auto stripped = graph_.copy();
            Mask::bake(*stripped, Mask::plan_masks(*stripped, masks_, extraction_));
            return stripped;
        }

        [[nodiscard]] std::vector<LayerSummary> summary() const
        {
            std::shared_lock lock(mutex_);
            std::vector<LayerSummary> rows{};
            rows.reserve(layers_.size());
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                const auto& mask = masks_.at(layers_[index]);
                rows.push_back(LayerSummary{layers_[index], mask.size(), mask.kept(), mask.sparsity(),
                                            mask.corrected(), extraction_[index].ok()});
            }
            return rows;
        }

    private:
        std::vector<std::string> resolve_layers() const
        {
            std::vector<std::string> layers{};
            if (options_.layers.empty()) {
                for (const auto index : graph_.topological_order()) {
                    if (graph_.layer(index).kind == Layer::Kind::PointwiseConvolution) {
                        layers.push_back(graph_.name(index));
                    }
                }
            } else {
                for (const auto& name : options_.layers) {
                    const auto& layer = graph_.layer(name);
                    if (layer.kind != Layer::Kind::PointwiseConvolution) {
                        throw std::invalid_argument("Layer '" + name + "' is a " + Layer::to_string(layer.kind)
                                                    + " layer; only pointwise convolutions can be pruned.");
                    }
                    layers.push_back(name);
                }
            }
            if (layers.empty()) {
                throw std::invalid_argument("The graph has no pointwise convolution to prune.");
            }
            return layers;
        }

        [[noreturn]] static void throw_frozen()
        {
            throw std::logic_error("Masks are frozen; begin_step() cannot be called after freeze().");
        }

        void recompute(std::int64_t step)
        {
            std::unique_lock lock(mutex_);
            // freeze() may have won the lock since begin_step() checked.
            if (frozen_.load()) {
                throw_frozen();
            }
            const double sparsity = schedule_->target(step);
            const Mask::MaskOptions mask_options{.importance = options_.importance,
                                                 .axis = 0,
                                                 .degenerate = Mask::DegeneratePolicy::Clamp};

            Mask::MaskSet next = masks_;
            for (const auto& name : layers_) {
                const auto& weight = graph_.layer(name).parameter(Layer::Details::Slot::Weight);
                try {
                    next[name] = Mask::compute_mask(weight, sparsity, mask_options);
                } catch (const std::invalid_argument& error) {
                    Utils::Terminal::Warn(options_.stream, "Keeping the previous mask of '" + name + "': " + error.what());
                }
            }
            masks_ = std::move(next);
            plan_ = Mask::plan_masks(graph_, masks_, extraction_);
            last_recompute_step_ = step;

            if (options_.monitor) {
                std::ostringstream line;
                line << "step " << step << " [" << to_string(phase(step)) << "] target "
                     << std::fixed << std::setprecision(3) << sparsity;
                for (const auto& name : layers_) {
                    const auto& mask = masks_.at(name);
                    line << "  " << name << ' ' << mask.kept() << '/' << mask.size();
                }
                Utils::Terminal::Info(options_.stream, line.str());
            }
        }

        LayerGraph& graph_;
        MaskedTrainingOptions options_{};
        std::unique_ptr<Sparsity::Schedule> schedule_{};
        std::vector<std::string> layers_{};
        std::vector<Dependency::ExtractionResult> extraction_{};

        mutable std::shared_mutex mutex_{};
        Mask::MaskSet masks_{};
        Mask::MaskPlan plan_{};
        std::atomic<bool> frozen_{false};
        std::int64_t last_recompute_step_{-1};
    };
}

#endif //SHEAR_TRAINING_CONTROLLER_HPP
