#ifndef TASNET_LAYERNORM_HPP
#define TASNET_LAYERNORM_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../registry.hpp"

namespace Tasnet::Layer::Details {
    inline constexpr double kLayerNormEpsilon = 1e-8;

    struct LayerNormOptions {
        std::int64_t channels{};
        double eps{kLayerNormEpsilon};
    };

    // Shared storage of the two layer normalisation variants: a per-channel gain and bias of
    // shape [1, N, 1] applied as gamma * (y - mean) / sqrt(var + eps) + beta on [M, N, K].
    class AffineNormBase : public torch::nn::Module {
    public:
        explicit AffineNormBase(const LayerNormOptions& options)
            : options_(options)
        {
            if (options_.channels <= 0) {
                throw std::invalid_argument("Layer normalisation requires a positive channel count.");
            }
            gamma = register_parameter("gamma", torch::empty({1, options_.channels, 1}));
            beta = register_parameter("beta", torch::empty({1, options_.channels, 1}));
            reset_parameters();
        }

        void reset_parameters()
        {
            torch::NoGradGuard guard;
            gamma.fill_(1.0);
            beta.zero_();
        }

        [[nodiscard]] const LayerNormOptions& options() const noexcept { return options_; }

        torch::Tensor gamma;
        torch::Tensor beta;

    protected:
        [[nodiscard]] torch::Tensor affine(const torch::Tensor& y, const torch::Tensor& mean, const torch::Tensor& var) const
        {
            return gamma * (y - mean) / torch::pow(var + options_.eps, 0.5) + beta;
        }

    private:
        LayerNormOptions options_{};
    };

    // cLN: statistics over the channel axis only, one pair per (batch, time) position.
    // Nothing crosses the time axis, so it stays causal.
    class ChannelwiseLayerNormImpl : public AffineNormBase {
    public:
        explicit ChannelwiseLayerNormImpl(const LayerNormOptions& options)
            : AffineNormBase(options)
        {}

        explicit ChannelwiseLayerNormImpl(std::int64_t channels)
            : ChannelwiseLayerNormImpl(LayerNormOptions{channels})
        {}

        torch::Tensor forward(const torch::Tensor& y)
        {
            const auto mean = y.mean({1}, /*keepdim=*/true);                       // [M, 1, K]
            const auto var = (y - mean).pow(2).mean({1}, /*keepdim=*/true);        // [M, 1, K]
            return affine(y, mean, var);
        }
    };

    TORCH_MODULE(ChannelwiseLayerNorm);

    // gLN: statistics over channel and time jointly, one pair per batch element.
    class GlobalLayerNormImpl : public AffineNormBase {
    public:
        explicit GlobalLayerNormImpl(const LayerNormOptions& options)
            : AffineNormBase(options)
        {}

        explicit GlobalLayerNormImpl(std::int64_t channels)
            : GlobalLayerNormImpl(LayerNormOptions{channels})
        {}

        torch::Tensor forward(const torch::Tensor& y)
        {
            const auto mean = y.mean({1, 2}, /*keepdim=*/true);                    // [M, 1, 1]
            const auto var = (y - mean).pow(2).mean({1, 2}, /*keepdim=*/true);     // [M, 1, 1]
            return affine(y, mean, var);
        }
    };

    TORCH_MODULE(GlobalLayerNorm);
}

#endif //TASNET_LAYERNORM_HPP
