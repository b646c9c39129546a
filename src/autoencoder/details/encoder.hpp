#ifndef TASNET_AUTOENCODER_DETAILS_ENCODER_HPP
#define TASNET_AUTOENCODER_DETAILS_ENCODER_HPP

#include <cstdint>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/initialization.hpp"
#include "../../layer/layer.hpp"

namespace Tasnet::AutoEncoder::Details {
    struct EncoderOptions {
        std::int64_t frame_length{}; // L
        std::int64_t filters{};      // N
    };

    struct EncoderDescriptor {
        EncoderOptions options{};
        ::Tasnet::Initialization::Descriptor initialization{::Tasnet::Initialization::Default};
    };

    // Nonnegative mixture weights, [M, K, L] -> [M, K, N].
    // A kernel-1 convolution over [M, L, K] is a per-frame projection onto N basis filters.
    class EncoderImpl : public torch::nn::Module {
    public:
        explicit EncoderImpl(EncoderDescriptor descriptor)
            : options_(descriptor.options)
        {
            if (options_.frame_length <= 0 || options_.filters <= 0) {
                throw std::invalid_argument("Encoder requires a positive frame length and filter count.");
            }
            conv1d_U_ = ::Tasnet::Layer::Details::build_registered_layer(*this,
                ::Tasnet::Layer::Conv1d({.in_channels = options_.frame_length, .out_channels = options_.filters},
                                        descriptor.initialization),
                "conv1d_U");
        }

        torch::Tensor forward(torch::Tensor mixture)
        {
            if (!mixture.is_floating_point()) {
                mixture = mixture.to(conv1d_U_->weight.scalar_type());
            }
            auto mixture_w = conv1d_U_->forward(mixture.permute({0, 2, 1}).contiguous()); // [M, N, K]
            mixture_w = ::Tasnet::Activation::ReLU{}(std::move(mixture_w));
            return mixture_w.permute({0, 2, 1}).contiguous();                             // [M, K, N]
        }

        [[nodiscard]] const EncoderOptions& options() const noexcept { return options_; }
        [[nodiscard]] const torch::nn::Conv1d& basis() const noexcept { return conv1d_U_; }

    private:
        EncoderOptions options_{};
        torch::nn::Conv1d conv1d_U_{nullptr};
    };

    TORCH_MODULE(Encoder);
}

#endif // TASNET_AUTOENCODER_DETAILS_ENCODER_HPP
