#ifndef TASNET_BLOCK_DETAILS_TEMPORAL_HPP
#define TASNET_BLOCK_DETAILS_TEMPORAL_HPP

#include <cstdint>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "../../../activation/activation.hpp"
#include "../../../initialization/initialization.hpp"
#include "../../../layer/layer.hpp"
#include "depthwise_separable.hpp"

namespace Tasnet::Block::Details {
    struct TemporalBlockOptions {
        std::int64_t in_channels{};   // B
        std::int64_t out_channels{};  // H
        std::int64_t kernel_size{3};  // P
        std::int64_t dilation{1};
        ::Tasnet::Layer::NormType norm_type{::Tasnet::Layer::NormType::Global};
    };

    struct TemporalBlockDescriptor {
        TemporalBlockOptions options{};
        ::Tasnet::Initialization::Descriptor initialization{::Tasnet::Initialization::Default};
    };

    // [M, B, K] -> [M, B, K]
    // relu(x + dsconv(norm(prelu(conv1x1(x)))))
    // The skip connection needs no projection: the branch returns to B channels by construction.
    class TemporalBlockImpl : public torch::nn::Module {
    public:
        explicit TemporalBlockImpl(TemporalBlockDescriptor descriptor)
            : options_(descriptor.options)
        {
            if (options_.in_channels <= 0 || options_.out_channels <= 0) {
                throw std::invalid_argument("Temporal blocks require positive channel counts.");
            }
            namespace Layer = ::Tasnet::Layer;
            namespace LayerDetails = ::Tasnet::Layer::Details;

            conv1x1_ = LayerDetails::build_registered_layer(*this,
                Layer::Conv1d({.in_channels = options_.in_channels, .out_channels = options_.out_channels},
                              descriptor.initialization),
                "conv1x1");
            prelu_ = LayerDetails::build_registered_layer(*this, Layer::PReLU(), "prelu");
            norm_ = LayerDetails::build_registered_layer(*this, Layer::Normalization(options_.norm_type, options_.out_channels), "norm");
            dsconv_ = register_module("dsconv", DepthwiseSeparableConv(DepthwiseSeparableDescriptor{
                .options = {.in_channels = options_.out_channels,
                            .out_channels = options_.in_channels,
                            .kernel_size = options_.kernel_size,
                            .dilation = options_.dilation,
                            .norm_type = options_.norm_type},
                .initialization = descriptor.initialization}));
        }

        torch::Tensor forward(const torch::Tensor& input)
        {
            auto branch = conv1x1_->forward(input);
            branch = prelu_->forward(branch);
            branch = norm_.forward(branch);
            branch = dsconv_->forward(branch);
            return ::Tasnet::Activation::ReLU{}(branch + input);
        }

        [[nodiscard]] const TemporalBlockOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::int64_t dilation() const noexcept { return options_.dilation; }

    private:
        TemporalBlockOptions options_{};
        torch::nn::Conv1d conv1x1_{nullptr};
        torch::nn::PReLU prelu_{nullptr};
        torch::nn::AnyModule norm_{};
        DepthwiseSeparableConv dsconv_{nullptr};
    };

    TORCH_MODULE(TemporalBlock);
}

#endif // TASNET_BLOCK_DETAILS_TEMPORAL_HPP
