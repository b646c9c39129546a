#ifndef TASNET_AUTOENCODER_DETAILS_DECODER_HPP
#define TASNET_AUTOENCODER_DETAILS_DECODER_HPP

#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

#include "../../initialization/initialization.hpp"
#include "../../layer/layer.hpp"

namespace Tasnet::AutoEncoder::Details {
    struct DecoderOptions {
        std::int64_t filters{};      // N
        std::int64_t frame_length{}; // L
    };

    struct DecoderDescriptor {
        DecoderOptions options{};
        ::Tasnet::Initialization::Descriptor initialization{::Tasnet::Initialization::Default};
    };

    // Masks the latent representation per source, then maps it back to frames through one
    // synthesis basis shared by every source.
    //   ([M, K, N], [M, K, C, N]) -> [M, C, K, L]
    class DecoderImpl : public torch::nn::Module {
    public:
        explicit DecoderImpl(DecoderDescriptor descriptor)
            : options_(descriptor.options)
        {
            if (options_.frame_length <= 0 || options_.filters <= 0) {
                throw std::invalid_argument("Decoder requires a positive frame length and filter count.");
            }
            basis_signals_ = ::Tasnet::Layer::Details::build_registered_layer(*this,
                ::Tasnet::Layer::FC({.in_features = options_.filters, .out_features = options_.frame_length},
                                    descriptor.initialization),
                "basis_signals");
        }

        torch::Tensor forward(const torch::Tensor& mixture_w, const torch::Tensor& est_mask)
        {
            const auto source_w = mixture_w.unsqueeze(2) * est_mask;    // [M, K, C, N]
            const auto est_source = basis_signals_->forward(source_w);  // [M, K, C, L]
            return est_source.permute({0, 2, 1, 3}).contiguous();       // [M, C, K, L]
        }

        [[nodiscard]] const DecoderOptions& options() const noexcept { return options_; }
        [[nodiscard]] const torch::nn::Linear& basis() const noexcept { return basis_signals_; }

    private:
        DecoderOptions options_{};
        torch::nn::Linear basis_signals_{nullptr};
    };

    TORCH_MODULE(Decoder);
}

#endif // TASNET_AUTOENCODER_DETAILS_DECODER_HPP
