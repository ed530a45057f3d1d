#ifndef SHEAR_LAYER_REDUCE_HPP
#define SHEAR_LAYER_REDUCE_HPP
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Shear::Layer::Details {

    enum class ReduceOp {
        Sum,
        Mean,
        Max,
        Min,
    };

    struct ReduceOptions {
        ReduceOp op{ReduceOp::Mean};
        std::vector<std::int64_t> dims{};
        bool keep_dim{false};
    };

    namespace Detail {
        inline std::vector<std::int64_t> normalise_dims(const torch::Tensor& input, const std::vector<std::int64_t>& dims)
        {
            if (input.dim() == 0) {
                return {};
            }

            if (dims.empty()) {
                std::vector<std::int64_t> all_dims(static_cast<std::size_t>(input.dim()));
                std::iota(all_dims.begin(), all_dims.end(), std::int64_t{0});
                return all_dims;
            }

            std::vector<std::int64_t> normalised = dims;
            const auto total_dims = input.dim();
            for (auto& dim : normalised) {
                if (dim < 0) {
                    dim += total_dims;
                }
                TORCH_CHECK(dim >= 0 && dim < total_dims, "Reduce layer received an out-of-range dimension index.");
            }

            std::sort(normalised.begin(), normalised.end());
            normalised.erase(std::unique(normalised.begin(), normalised.end()), normalised.end());
            return normalised;
        }

        inline torch::Tensor reduce_tensor(torch::Tensor input, const ReduceOptions& options)
        {
            if (!input.defined()) {
                return input;
            }

            auto dims = normalise_dims(input, options.dims);
            torch::IntArrayRef dims_ref(dims);
            switch (options.op) {
                case ReduceOp::Sum: return torch::sum(input, dims_ref, options.keep_dim);
                case ReduceOp::Mean: return torch::mean(input, dims_ref, options.keep_dim);
                case ReduceOp::Max: return torch::amax(input, dims_ref, options.keep_dim);
                case ReduceOp::Min: return torch::amin(input, dims_ref, options.keep_dim);
            }

            TORCH_CHECK(false, "Unsupported reduce operation.");
            return torch::Tensor{};
        }

        // Spatial reductions (every listed dim past the channel axis) leave NCHW channel indices untouched.
        [[nodiscard]] inline bool reduces_spatial_only(const ReduceOptions& options) noexcept
        {
            if (options.dims.empty()) {
                return false;
            }
            return std::all_of(options.dims.begin(), options.dims.end(), [](std::int64_t dim) { return dim >= 2; });
        }
    }

    class ReduceImpl : public torch::nn::Module {
    public:
        ReduceImpl() = default;

        explicit ReduceImpl(ReduceOptions options)
        {
            reset(std::move(options));
        }

        void reset(ReduceOptions options)
        {
            options_ = std::move(options);
        }

        torch::Tensor forward(torch::Tensor input)
        {
            return Detail::reduce_tensor(std::move(input), options_);
        }

        [[nodiscard]] const ReduceOptions& options() const noexcept { return options_; }

    private:
        ReduceOptions options_{};
    };

    TORCH_MODULE(Reduce);

    struct ReduceDescriptor {
        ReduceOptions options{};
        ::Shear::Activation::Descriptor activation{::Shear::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const ReduceDescriptor& descriptor, std::size_t index)
    {
        auto module = owner.register_module("reduce_" + std::to_string(index), Reduce(descriptor.options));

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.kind = ::Shear::Layer::Kind::Other;
        registered_layer.channels.preserves_channels = Detail::reduces_spatial_only(descriptor.options);
        registered_layer.forward = [module](torch::Tensor input, const EffectiveParameters&) mutable {
            return module->forward(std::move(input));
        };
        return registered_layer;
    }

}
#endif //SHEAR_LAYER_REDUCE_HPP
