#ifndef TASNET_SEPARATOR_DETAILS_TEMPORAL_CONV_NET_HPP
#define TASNET_SEPARATOR_DETAILS_TEMPORAL_CONV_NET_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../block/block.hpp"
#include "../../initialization/initialization.hpp"
#include "../../layer/layer.hpp"

namespace Tasnet::Separator::Details {
    struct TemporalConvNetOptions {
        std::int64_t filters{};             // N
        std::int64_t bottleneck_channels{}; // B
        std::int64_t block_channels{};      // H
        std::int64_t kernel_size{3};        // P
        std::int64_t blocks_per_repeat{};   // X
        std::int64_t repeats{};             // R
        std::int64_t sources{};             // C
        ::Tasnet::Layer::NormType norm_type{::Tasnet::Layer::NormType::Global};
    };

    struct TemporalConvNetDescriptor {
        TemporalConvNetOptions options{};
        ::Tasnet::Initialization::Descriptor initialization{::Tasnet::Initialization::Default};
    };

    // Dilation of block `x` within a repeat; the schedule restarts at 1 for every repeat.
    [[nodiscard]] constexpr std::int64_t block_dilation(std::int64_t x) noexcept
    {
        return std::int64_t{1} << x;
    }

    // Number of latent frames one output frame depends on: 1 + R * sum_x (P - 1) * 2^x.
    [[nodiscard]] constexpr std::int64_t receptive_field(std::int64_t kernel_size,
                                                         std::int64_t blocks_per_repeat,
                                                         std::int64_t repeats) noexcept
    {
        std::int64_t per_repeat = 0;
        for (std::int64_t x = 0; x < blocks_per_repeat; ++x) {
            per_repeat += (kernel_size - 1) * block_dilation(x);
        }
        return 1 + repeats * per_repeat;
    }

    // True when receptive_field(P, X, R) and every block padding are representable as int64.
    // Expects positive arguments and X < 63.
    [[nodiscard]] constexpr bool receptive_field_fits(std::int64_t kernel_size,
                                                      std::int64_t blocks_per_repeat,
                                                      std::int64_t repeats) noexcept
    {
        constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
        const auto dilation_sum = (std::int64_t{1} << blocks_per_repeat) - 1; // sum_x 2^x
        if (kernel_size - 1 > kMax / dilation_sum) {
            return false;
        }
        const auto per_repeat = (kernel_size - 1) * dilation_sum;
        return per_repeat == 0 || repeats <= (kMax - 1) / per_repeat;
    }

    // Mask estimator, [M, K, N] -> [M, K, C, N].
    //   cLN(N) -> 1x1 conv N->B -> R x X temporal blocks -> 1x1 conv B->C*N -> softmax over C
    // The input layer norm is channel-wise whatever norm_type the blocks use.
    class TemporalConvNetImpl : public torch::nn::Module {
    public:
        explicit TemporalConvNetImpl(TemporalConvNetDescriptor descriptor)
            : options_(descriptor.options)
        {
            const auto& o = options_;
            if (o.filters <= 0 || o.bottleneck_channels <= 0 || o.block_channels <= 0 || o.kernel_size <= 0) {
                throw std::invalid_argument("TemporalConvNet requires positive N, B, H and P.");
            }
            if (o.blocks_per_repeat <= 0 || o.repeats <= 0 || o.sources <= 0) {
                throw std::invalid_argument("TemporalConvNet requires positive X, R and C.");
            }
            if (o.blocks_per_repeat >= 63) {
                throw std::invalid_argument("TemporalConvNet dilation 2^(X-1) overflows for X = "
                                            + std::to_string(o.blocks_per_repeat) + ".");
            }
            if (!receptive_field_fits(o.kernel_size, o.blocks_per_repeat, o.repeats)) {
                throw std::invalid_argument("TemporalConvNet receptive field overflows for P = "
                                            + std::to_string(o.kernel_size) + ", X = " + std::to_string(o.blocks_per_repeat)
                                            + ", R = " + std::to_string(o.repeats) + ".");
            }
            namespace Layer = ::Tasnet::Layer;
            namespace LayerDetails = ::Tasnet::Layer::Details;

            layer_norm_ = register_module("layer_norm", Layer::ChannelwiseLayerNorm(o.filters));
            bottleneck_conv1x1_ = LayerDetails::build_registered_layer(*this,
                Layer::Conv1d({.in_channels = o.filters, .out_channels = o.bottleneck_channels}, descriptor.initialization),
                "bottleneck_conv1x1");

            temporal_conv_net_ = register_module("temporal_conv_net", torch::nn::ModuleList());
            repeats_.reserve(static_cast<std::size_t>(o.repeats));
            for (std::int64_t r = 0; r < o.repeats; ++r) {
                torch::nn::Sequential blocks;
                for (std::int64_t x = 0; x < o.blocks_per_repeat; ++x) {
                    blocks->push_back(::Tasnet::Block::TemporalBlock(::Tasnet::Block::Temporal(
                        {.in_channels = o.bottleneck_channels,
                         .out_channels = o.block_channels,
                         .kernel_size = o.kernel_size,
                         .dilation = block_dilation(x),
                         .norm_type = o.norm_type},
                        descriptor.initialization)));
                }
                temporal_conv_net_->push_back(blocks);
                repeats_.push_back(std::move(blocks));
            }

            mask_conv1x1_ = LayerDetails::build_registered_layer(*this,
                Layer::Conv1d({.in_channels = o.bottleneck_channels, .out_channels = o.sources * o.filters},
                              descriptor.initialization),
                "mask_conv1x1");
        }

        // [M, K, N] -> [M, K, C, N]
        torch::Tensor forward(const torch::Tensor& mixture_w)
        {
            const auto batch = mixture_w.size(0);
            const auto frames = mixture_w.size(1);
            const auto filters = mixture_w.size(2);

            auto x = mixture_w.permute({0, 2, 1}).contiguous();  // [M, N, K]
            x = layer_norm_->forward(x);
            x = bottleneck_conv1x1_->forward(x);                 // [M, B, K]
            for (auto& repeat : repeats_) {
                x = repeat->forward(x);
            }
            auto score = mask_conv1x1_->forward(x);              // [M, C*N, K]
            score = score.permute({0, 2, 1}).contiguous().view({batch, frames, options_.sources, filters});
            return ::Tasnet::Activation::Softmax{2}(std::move(score));
        }

        // Dilation of every temporal block in execution order.
        [[nodiscard]] std::vector<std::int64_t> dilations() const
        {
            std::vector<std::int64_t> values;
            values.reserve(static_cast<std::size_t>(options_.repeats * options_.blocks_per_repeat));
            for (const auto& repeat : repeats_) {
                for (const auto& block : *repeat) {
                    values.push_back(block.ptr<::Tasnet::Block::Details::TemporalBlockImpl>()->dilation());
                }
            }
            return values;
        }

        [[nodiscard]] std::int64_t receptive_field() const noexcept
        {
            return ::Tasnet::Separator::Details::receptive_field(options_.kernel_size, options_.blocks_per_repeat, options_.repeats);
        }

        [[nodiscard]] const TemporalConvNetOptions& options() const noexcept { return options_; }

    private:
        TemporalConvNetOptions options_{};
        ::Tasnet::Layer::ChannelwiseLayerNorm layer_norm_{nullptr};
        torch::nn::Conv1d bottleneck_conv1x1_{nullptr};
        torch::nn::ModuleList temporal_conv_net_{nullptr};
        std::vector<torch::nn::Sequential> repeats_{};
        torch::nn::Conv1d mask_conv1x1_{nullptr};
    };

    TORCH_MODULE(TemporalConvNet);
}

#endif // TASNET_SEPARATOR_DETAILS_TEMPORAL_CONV_NET_HPP
