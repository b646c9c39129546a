#ifndef TASNET_BLOCK_DETAILS_DEPTHWISE_SEPARABLE_HPP
#define TASNET_BLOCK_DETAILS_DEPTHWISE_SEPARABLE_HPP

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "../../../initialization/initialization.hpp"
#include "../../../layer/layer.hpp"

namespace Tasnet::Block::Details {
    struct DepthwiseSeparableOptions {
        std::int64_t in_channels{};   // H
        std::int64_t out_channels{};  // B
        std::int64_t kernel_size{3};  // P
        std::int64_t dilation{1};
        ::Tasnet::Layer::NormType norm_type{::Tasnet::Layer::NormType::Global};
    };

    struct DepthwiseSeparableDescriptor {
        DepthwiseSeparableOptions options{};
        ::Tasnet::Initialization::Descriptor initialization{::Tasnet::Initialization::Default};
    };

    [[nodiscard]] constexpr std::int64_t causal_padding(std::int64_t kernel_size, std::int64_t dilation) noexcept
    {
        return (kernel_size - 1) * dilation;
    }

    // [M, H, K] -> [M, B, K]
    // depthwise conv (padded by (P-1)*d) -> chomp (P-1)*d -> PReLU -> norm -> pointwise conv
    class DepthwiseSeparableConvImpl : public torch::nn::Module {
    public:
        explicit DepthwiseSeparableConvImpl(DepthwiseSeparableDescriptor descriptor)
            : options_(descriptor.options)
        {
            if (options_.in_channels <= 0 || options_.out_channels <= 0) {
                throw std::invalid_argument("Depthwise separable convolutions require positive channel counts.");
            }
            if (options_.kernel_size <= 0 || options_.dilation <= 0) {
                throw std::invalid_argument("Depthwise separable convolutions require a positive kernel size and dilation.");
            }

            if (options_.kernel_size - 1 > std::numeric_limits<std::int64_t>::max() / options_.dilation) {
                throw std::invalid_argument("Depthwise separable convolution padding (P-1)*d overflows.");
            }

            const auto padding = causal_padding(options_.kernel_size, options_.dilation);
            namespace Layer = ::Tasnet::Layer;
            namespace LayerDetails = ::Tasnet::Layer::Details;

            depthwise_conv_ = LayerDetails::build_registered_layer(*this,
                Layer::Conv1d({.in_channels = options_.in_channels,
                               .out_channels = options_.in_channels,
                               .kernel_size = options_.kernel_size,
                               .padding = padding,
                               .dilation = options_.dilation,
                               .groups = options_.in_channels},
                              descriptor.initialization),
                "depthwise_conv");
            chomp_ = LayerDetails::build_registered_layer(*this, Layer::Chomp(padding), "chomp");
            prelu_ = LayerDetails::build_registered_layer(*this, Layer::PReLU(), "prelu");
            norm_ = LayerDetails::build_registered_layer(*this, Layer::Normalization(options_.norm_type, options_.in_channels), "norm");
            pointwise_conv_ = LayerDetails::build_registered_layer(*this,
                Layer::Conv1d({.in_channels = options_.in_channels, .out_channels = options_.out_channels},
                              descriptor.initialization),
                "pointwise_conv");
        }

        torch::Tensor forward(const torch::Tensor& input)
        {
            auto output = depthwise_conv_->forward(input);
            output = chomp_->forward(output);
            output = prelu_->forward(output);
            output = norm_.forward(output);
            return pointwise_conv_->forward(output);
        }

        [[nodiscard]] const DepthwiseSeparableOptions& options() const noexcept { return options_; }

    private:
        DepthwiseSeparableOptions options_{};
        torch::nn::Conv1d depthwise_conv_{nullptr};
        ::Tasnet::Layer::Chomp1d chomp_{nullptr};
        torch::nn::PReLU prelu_{nullptr};
        torch::nn::AnyModule norm_{};
        torch::nn::Conv1d pointwise_conv_{nullptr};
    };

    TORCH_MODULE(DepthwiseSeparableConv);
}

#endif // TASNET_BLOCK_DETAILS_DEPTHWISE_SEPARABLE_HPP
