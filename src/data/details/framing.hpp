#ifndef TASNET_DATA_DETAILS_FRAMING_HPP
#define TASNET_DATA_DETAILS_FRAMING_HPP

#include <cstdint>
#include <vector>

#include <torch/torch.h>

namespace Tasnet::Data::Details {
    struct FrameOptions {
        std::int64_t frame_length{}; // L
        std::int64_t hop{0};         // 0 means hop = frame_length
    };

    [[nodiscard]] inline std::int64_t effective_hop(const FrameOptions& options) noexcept
    {
        return options.hop > 0 ? options.hop : options.frame_length;
    }

    // Number of frames covering `samples` once the tail is zero-padded to a whole hop.
    [[nodiscard]] inline std::int64_t frame_count(std::int64_t samples, std::int64_t frame_length, std::int64_t hop) noexcept
    {
        if (samples <= frame_length) {
            return 1;
        }
        return 1 + (samples - frame_length + hop - 1) / hop;
    }

    // [M, T] (or [T]) -> [M, K, L]. The tail is zero-padded so the last frame is complete.
    inline torch::Tensor Frame(const torch::Tensor& waveform, const FrameOptions& options)
    {
        TORCH_CHECK(options.frame_length > 0, "Frame requires a positive frame length");
        TORCH_CHECK(options.hop >= 0, "Frame hop must not be negative");
        TORCH_CHECK(waveform.dim() == 1 || waveform.dim() == 2, "Frame expects a [T] or [M, T] waveform, got ",
                    waveform.dim(), " dimensions");
        const auto hop = effective_hop(options);
        TORCH_CHECK(hop <= options.frame_length, "Frame hop (", hop, ") may not exceed the frame length (",
                    options.frame_length, "): the samples between frames would be dropped");
        auto x = waveform.dim() == 1 ? waveform.unsqueeze(0) : waveform;

        const auto T = x.size(-1);
        TORCH_CHECK(T > 0, "Frame requires a non-empty waveform");
        const auto K = frame_count(T, options.frame_length, hop);
        const auto padded = (K - 1) * hop + options.frame_length;
        if (padded > T) {
            x = torch::constant_pad_nd(x, {0, padded - T}, 0);
        }
        return x.unfold(/*dimension=*/-1, /*size=*/options.frame_length, /*step=*/hop).contiguous();
    }

    // [..., K, L] -> [..., (K - 1) * hop + L], summing overlapping samples.
    inline torch::Tensor OverlapAdd(const torch::Tensor& frames, std::int64_t hop)
    {
        TORCH_CHECK(frames.dim() >= 2, "OverlapAdd expects frames shaped [..., K, L]");
        TORCH_CHECK(hop > 0, "OverlapAdd requires a positive hop");
        const auto K = frames.size(-2);
        const auto L = frames.size(-1);
        TORCH_CHECK(hop <= L, "OverlapAdd hop (", hop, ") may not exceed the frame length (", L, ")");

        if (hop == L) {
            std::vector<std::int64_t> shape(frames.sizes().begin(), frames.sizes().end() - 2);
            shape.push_back(K * L);
            return frames.contiguous().view(shape);
        }

        std::vector<std::int64_t> shape(frames.sizes().begin(), frames.sizes().end() - 2);
        shape.push_back((K - 1) * hop + L);
        auto signal = torch::zeros(shape, frames.options());
        for (std::int64_t k = 0; k < K; ++k) {
            signal.narrow(-1, k * hop, L).add_(frames.select(-2, k));
        }
        return signal;
    }

    // How many frames cover each sample after OverlapAdd; divides out the hop < L gain.
    inline torch::Tensor OverlapCount(std::int64_t frames, std::int64_t frame_length, std::int64_t hop,
                                      const torch::TensorOptions& options = torch::kFloat32)
    {
        return OverlapAdd(torch::ones({frames, frame_length}, options), hop);
    }
}

#endif // TASNET_DATA_DETAILS_FRAMING_HPP
