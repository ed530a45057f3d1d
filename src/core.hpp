#ifndef SHEAR_CORE_HPP
#define SHEAR_CORE_HPP
/*
 * Core orchestrator of the library.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Hold the pruning configuration (schedule range, sparsity target,
 *    recompute cadence, importance metric, probe input) and validate it once.
 *  - Bind a caller-owned LayerGraph to a masked-training controller and expose
 *    the per-step hook the surrounding training loop calls.
 *  - Run the post-training pipeline: freeze masks, cut the graph, rebuild the
 *    masked reference and check that both compute the same function.
 *  - Read and write the configuration and the run artifacts as JSON.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common/errors.hpp"
#include "common/save_load.hpp"
#include "dependency/dependency.hpp"
#include "evaluation/evaluation.hpp"
#include "mask/apply.hpp"
#include "mask/mask.hpp"
#include "network.hpp"
#include "sparsity/sparsity.hpp"
#include "surgery/surgery.hpp"
#include "training/controller.hpp"
#include "utils/terminal.hpp"

namespace Shear {
    struct PruningConfig {
        std::int64_t start_step{0};
        std::int64_t end_step{1000};
        double max_sparsity{0.5};
        std::int64_t recompute_interval{100};
        Mask::Importance importance_metric{Mask::Importance::L1};

        double power{3.0};
        double initial_sparsity{0.0};
        Dependency::DepthwisePolicy depthwise{Dependency::DepthwisePolicy::Propagate};
        std::vector<std::string> layers{};  // empty: every pointwise convolution

        std::vector<std::int64_t> probe_shape{};  // input drawn for the equivalence check, e.g. {2, 3, 32, 32}
        double rtol{1e-5};
        double atol{1e-5};
        std::size_t trials{4};
        std::uint64_t seed{0};
        bool strict{false};

        std::ostream* stream{&std::cout};
        bool monitor{true};

        [[nodiscard]] Sparsity::PolynomialDecayOptions schedule_options() const noexcept
        {
            return {.begin_step = start_step,
                    .end_step = end_step,
                    .initial_sparsity = initial_sparsity,
                    .final_sparsity = max_sparsity,
                    .power = power};
        }

        void validate() const
        {
            Sparsity::Details::validate(schedule_options());
            if (recompute_interval <= 0) {
                throw ScheduleConfigError("recompute_interval must be strictly positive, got "
                                          + std::to_string(recompute_interval) + ".");
            }
            if (probe_shape.empty()) {
                throw std::invalid_argument("PruningConfig::probe_shape is required for the equivalence check.");
            }
            for (const auto extent : probe_shape) {
                if (extent <= 0) {
                    throw std::invalid_argument("PruningConfig::probe_shape extents must be positive.");
                }
            }
            if (trials == 0) {
                throw std::invalid_argument("PruningConfig::trials must be at least one.");
            }
            if (!(rtol >= 0.0) || !(atol >= 0.0)) {
                throw std::invalid_argument("PruningConfig tolerances must be non-negative.");
            }
        }
    };

    struct PruningResult {
        std::shared_ptr<LayerGraph> graph{};      // reduced
        std::shared_ptr<LayerGraph> reference{};  // masked, full size
        Mask::MaskSet masks{};
        Surgery::SurgeryReport surgery{};
        Evaluation::EquivalenceReport equivalence{};
    };

    namespace Config {
        namespace Detail {
            inline std::string depthwise_to_string(Dependency::DepthwisePolicy policy)
            {
                return policy == Dependency::DepthwisePolicy::Stop ? "stop" : "propagate";
            }

            inline Dependency::DepthwisePolicy depthwise_from_string(const std::string& value)
            {
                const auto lowered = Common::SaveLoad::Detail::to_lower(value);
                if (lowered == "propagate") return Dependency::DepthwisePolicy::Propagate;
                if (lowered == "stop") return Dependency::DepthwisePolicy::Stop;
                throw std::invalid_argument("Unknown depthwise policy '" + value + "'. Expected propagate or stop.");
            }
        }

        inline Common::SaveLoad::PropertyTree serialize(const PruningConfig& config)
        {
            namespace SaveLoad = Common::SaveLoad;
            SaveLoad::PropertyTree tree;
            tree.put("start_step", config.start_step);
            tree.put("end_step", config.end_step);
            tree.put("max_sparsity", config.max_sparsity);
            tree.put("recompute_interval", config.recompute_interval);
            tree.put("importance_metric", Mask::Details::to_string(config.importance_metric));
            tree.put("power", config.power);
            tree.put("initial_sparsity", config.initial_sparsity);
            tree.put("depthwise", Detail::depthwise_to_string(config.depthwise));
            tree.add_child("layers", SaveLoad::Detail::write_array(config.layers));
            tree.add_child("probe_shape", SaveLoad::Detail::write_array(config.probe_shape));
            tree.put("rtol", config.rtol);
            tree.put("atol", config.atol);
            tree.put("trials", config.trials);
            tree.put("seed", config.seed);
            tree.put("strict", config.strict);
            tree.put("monitor", config.monitor);
            return tree;
        }

        // The four schedule fields are required; everything else falls back to PruningConfig's defaults.
        inline PruningConfig deserialize(const Common::SaveLoad::PropertyTree& tree, const std::string& context = "pruning config")
        {
            namespace SaveLoad = Common::SaveLoad;
            PruningConfig config{};
            config.start_step = SaveLoad::Detail::get_numeric<std::int64_t>(tree, "start_step", context);
            config.end_step = SaveLoad::Detail::get_numeric<std::int64_t>(tree, "end_step", context);
            config.max_sparsity = SaveLoad::Detail::get_numeric<double>(tree, "max_sparsity", context);
            config.recompute_interval = SaveLoad::Detail::get_numeric<std::int64_t>(tree, "recompute_interval", context);
            if (const auto metric = tree.get_optional<std::string>("importance_metric")) {
                config.importance_metric = Mask::Details::importance_from_string(SaveLoad::Detail::to_lower(*metric));
            }
            config.power = tree.get<double>("power", config.power);
            config.initial_sparsity = tree.get<double>("initial_sparsity", config.initial_sparsity);
            if (const auto policy = tree.get_optional<std::string>("depthwise")) {
                config.depthwise = Detail::depthwise_from_string(*policy);
            }
            if (const auto layers = tree.get_child_optional("layers")) {
                config.layers = SaveLoad::Detail::read_array<std::string>(*layers, context + " layers");
            }
            if (const auto shape = tree.get_child_optional("probe_shape")) {
                config.probe_shape = SaveLoad::Detail::read_array<std::int64_t>(*shape, context + " probe_shape");
            }
            config.rtol = tree.get<double>("rtol", config.rtol);
            config.atol = tree.get<double>("atol", config.atol);
            config.trials = tree.get<std::size_t>("trials", config.trials);
            config.seed = tree.get<std::uint64_t>("seed", config.seed);
            config.strict = tree.get<bool>("strict", config.strict);
            config.monitor = tree.get<bool>("monitor", config.monitor);
            config.validate();
            return config;
        }

        inline PruningConfig load(const std::filesystem::path& path)
        {
            return deserialize(Common::SaveLoad::read_json_file(path), path.string());
        }

        inline void save(const PruningConfig& config, const std::filesystem::path& path)
        {
            Common::SaveLoad::write_json_file(path, serialize(config));
        }
    }

    class Pruner {
    public:
        explicit Pruner(PruningConfig config) : config_(std::move(config)) { config_.validate(); }

        Pruner(const Pruner&) = delete;
        Pruner& operator=(const Pruner&) = delete;

        void attach(LayerGraph& graph)
        {
            if (controller_) {
                throw std::logic_error("Pruner is already attached to a graph.");
            }
            Training::MaskedTrainingOptions options{};
            options.schedule = Sparsity::PolynomialDecay(config_.schedule_options());
            options.recompute_interval = config_.recompute_interval;
            options.importance = config_.importance_metric;
            options.layers = config_.layers;
            options.extract = extract_options();
            options.stream = config_.stream;
            options.monitor = config_.monitor;

            controller_ = std::make_unique<Training::MaskedTrainingController>(graph, std::move(options));
            graph_ = &graph;
        }

        [[nodiscard]] bool attached() const noexcept { return controller_ != nullptr; }

        // Call once per training step, before the optimizer update.
        bool step(std::int64_t step) { return controller().begin_step(step); }

        [[nodiscard]] torch::Tensor forward(torch::Tensor input) const { return controller().forward(std::move(input)); }

        [[nodiscard]] Training::Phase phase(std::int64_t step) const { return controller().phase(step); }

        [[nodiscard]] const Training::MaskedTrainingController& controller() const
        {
            if (!controller_) {
                throw std::logic_error("Pruner::attach() must be called before training.");
            }
            return *controller_;
        }

        [[nodiscard]] Training::MaskedTrainingController& controller()
        {
            if (!controller_) {
                throw std::logic_error("Pruner::attach() must be called before training.");
            }
            return *controller_;
        }

        [[nodiscard]] const PruningConfig& config() const noexcept { return config_; }

        PruningResult finalize()
        {
            auto& active = controller();
            PruningResult result{};
            result.masks = active.frozen() ? active.masks() : active.freeze();

            Surgery::SurgeryOptions surgery_options{};
            surgery_options.extract = extract_options();
            surgery_options.strict = config_.strict;
            surgery_options.stream = config_.stream;
            surgery_options.monitor = config_.monitor;
            auto surgery = Surgery::apply_surgery(*graph_, result.masks, surgery_options);
            result.graph = std::move(surgery.graph);
            result.surgery = std::move(surgery.report);

            result.reference = Mask::apply_masks(*graph_, result.masks, extract_options(), config_.stream);

            Evaluation::EquivalenceOptions equivalence{};
            equivalence.rtol = config_.rtol;
            equivalence.atol = config_.atol;
            equivalence.input_shape = config_.probe_shape;
            equivalence.trials = config_.trials;
            equivalence.seed = config_.seed;
            equivalence.print_summary = config_.monitor;
            equivalence.stream = config_.stream;
            result.equivalence = Evaluation::validate_equivalence(*result.reference, *result.graph, equivalence);

            if (config_.monitor) {
                std::ostringstream line;
                line << "Pruning finished: " << result.surgery.parameters_before << " -> " << result.surgery.parameters_after
                     << " parameters, " << result.surgery.skipped() << " layer(s) skipped.";
                Utils::Terminal::Info(config_.stream, line.str());
            }
            return result;
        }

        static void save(const PruningResult& result, const std::filesystem::path& path)
        {
            namespace SaveLoad = Common::SaveLoad;
            if (!result.graph) {
                throw std::invalid_argument("PruningResult holds no reduced graph.");
            }
            SaveLoad::PropertyTree tree;
            tree.add_child("architecture", SaveLoad::serialize_architecture(*result.graph));
            tree.add_child("masks", SaveLoad::serialize_masks(result.masks));
            tree.add_child("surgery", SaveLoad::serialize_surgery_report(result.surgery));
            tree.add_child("equivalence", SaveLoad::serialize_equivalence_report(result.equivalence));
            SaveLoad::write_json_file(path, tree);
        }

    private:
        [[nodiscard]] Dependency::ExtractOptions extract_options() const
        {
            Dependency::ExtractOptions options{};
            options.depthwise = config_.depthwise;
            return options;
        }

        PruningConfig config_{};
        LayerGraph* graph_{nullptr};
        std::unique_ptr<Training::MaskedTrainingController> controller_{};
    };
}

#endif // SHEAR_CORE_HPP
