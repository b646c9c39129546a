#ifndef TASNET_CORE_HPP
#define TASNET_CORE_HPP
/*
 * Conv-TasNet.
 * ---------------------------------------------------------------------------
 *  - ConvTasNet composes Encoder -> TemporalConvNet -> Decoder and maps framed
 *    mixtures [M, K, L] to per-source frames [M, C, K, L].
 *  - separate() wraps the forward pass with framing and overlap-add for raw
 *    waveforms.
 *  - The free functions at the bottom convert a model (and optionally its
 *    optimizer) to a checkpoint Package and back. Reconstruction always builds
 *    the architecture from the stored hyperparameters before any parameter
 *    value is loaded.
 */

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "autoencoder/autoencoder.hpp"
#include "common/options.hpp"
#include "common/save_load.hpp"
#include "data/data.hpp"
#include "initialization/initialization.hpp"
#include "layer/layer.hpp"
#include "separator/separator.hpp"
#include "utils/log.hpp"
#include "utils/terminal.hpp"

namespace Tasnet {
    namespace Details {
        // Puts `module` in eval mode for one scope and restores the caller's mode afterwards.
        class EvalModeGuard {
        public:
            explicit EvalModeGuard(torch::nn::Module& module)
                : module_(module)
                , was_training_(module.is_training())
            {
                module_.eval();
            }
            ~EvalModeGuard() { module_.train(was_training_); }

            EvalModeGuard(const EvalModeGuard&) = delete;
            EvalModeGuard& operator=(const EvalModeGuard&) = delete;

        private:
            torch::nn::Module& module_;
            bool was_training_;
        };
    }

    class ConvTasNetImpl : public torch::nn::Module {
    public:
        explicit ConvTasNetImpl(Options options,
                                Initialization::Descriptor initialization = Initialization::Default)
            : options_(options)
        {
            validate(options_);
            const auto& o = options_;

            encoder_ = register_module("encoder", AutoEncoder::Encoder(AutoEncoder::EncoderDescriptor{
                .options = {.frame_length = o.L, .filters = o.N},
                .initialization = initialization}));

            separator_ = register_module("separator", Separator::TemporalConvNet(Separator::TCN(
                {.filters = o.N,
                 .bottleneck_channels = o.B,
                 .block_channels = o.H,
                 .kernel_size = o.P,
                 .blocks_per_repeat = o.X,
                 .repeats = o.R,
                 .sources = o.C,
                 .norm_type = o.norm_type},
                initialization)));

            decoder_ = register_module("decoder", AutoEncoder::Decoder(AutoEncoder::DecoderDescriptor{
                .options = {.filters = o.N, .frame_length = o.L},
                .initialization = initialization}));
        }

        // Legacy form: norm_type is a string and unknown values fall back to batch norm.
        ConvTasNetImpl(std::int64_t N, std::int64_t L, std::int64_t B, std::int64_t H,
                       std::int64_t P, std::int64_t X, std::int64_t R, std::int64_t C,
                       std::string_view norm_type = "gLN",
                       std::ostream* stream = &std::cout)
            : ConvTasNetImpl(Options{.N = N, .L = L, .B = B, .H = H, .P = P, .X = X, .R = R, .C = C,
                                     .norm_type = Layer::parse_norm_type(norm_type, stream)})
        {
        }

        // [M, K, L] -> [M, C, K, L]
        torch::Tensor forward(torch::Tensor mixture)
        {
            auto mixture_w = encoder_->forward(std::move(mixture)); // [M, K, N]
            auto est_mask = separator_->forward(mixture_w);         // [M, K, C, N]
            return decoder_->forward(mixture_w, est_mask);          // [M, C, K, L]
        }

        // Raw waveforms [M, T] (or [T]) -> [M, C, T]. hop = 0 uses non-overlapping frames and
        // hop may not exceed L. Runs in eval mode, so batch norm uses and keeps its running
        // statistics; the training mode is restored on return.
        torch::Tensor separate(const torch::Tensor& waveform, std::int64_t hop = 0)
        {
            torch::NoGradGuard guard;
            Details::EvalModeGuard mode(*this);
            const Data::FrameOptions framing{.frame_length = options_.L, .hop = hop};
            const auto step = Data::Details::effective_hop(framing);
            const auto samples = waveform.size(-1);

            auto frames = Data::Frame(waveform, framing).to(device_);
            auto estimates = forward(std::move(frames));            // [M, C, K, L]
            auto signal = Data::OverlapAdd(estimates, step);        // [M, C, T']
            if (step < options_.L) {
                signal = signal / Data::OverlapCount(estimates.size(2), options_.L, step, signal.options());
            }
            return signal.narrow(-1, 0, samples).contiguous();
        }

        ConvTasNetImpl& to_device(bool use_cuda = true, std::ostream* stream = &std::cout)
        {
            if (use_cuda && torch::cuda::is_available()) {
                device_ = torch::Device(torch::kCUDA, /*index=*/0);
            } else {
                if (use_cuda) {
                    Utils::Log::Warn(stream, "CUDA device requested but is unavailable, staying on CPU.");
                }
                device_ = torch::Device(torch::kCPU);
            }
            this->to(device_);
            return *this;
        }

        [[nodiscard]] const torch::Device& device() const noexcept { return device_; }
        [[nodiscard]] const Options& options() const noexcept { return options_; }

        [[nodiscard]] std::int64_t parameter_count() const
        {
            std::int64_t total = 0;
            for (const auto& parameter : parameters(/*recurse=*/true)) {
                total += parameter.numel();
            }
            return total;
        }

        [[nodiscard]] std::int64_t receptive_field() const noexcept { return separator_->receptive_field(); }

        void summary(std::ostream& stream) const
        {
            using Utils::Terminal::ApplyColor;
            namespace Colors = Utils::Terminal::Colors;
            std::ostringstream line;
            line << options_;
            Utils::Log::Info(&stream, ApplyColor("Conv-TasNet", Colors::kBrightCyan) + " " + line.str());
            Utils::Log::Info(&stream, "  parameters      : " + std::to_string(parameter_count()));
            Utils::Log::Info(&stream, "  receptive field : " + std::to_string(receptive_field()) + " frames ("
                                          + std::to_string(receptive_field() * options_.L) + " samples)");
            Utils::Log::Info(&stream, "  device          : " + device_.str());
        }

        [[nodiscard]] const AutoEncoder::Encoder& encoder() const noexcept { return encoder_; }
        [[nodiscard]] const Separator::TemporalConvNet& separator() const noexcept { return separator_; }
        [[nodiscard]] const AutoEncoder::Decoder& decoder() const noexcept { return decoder_; }

    private:
        Options options_{};
        torch::Device device_{torch::kCPU};
        AutoEncoder::Encoder encoder_{nullptr};
        Separator::TemporalConvNet separator_{nullptr};
        AutoEncoder::Decoder decoder_{nullptr};
    };

    TORCH_MODULE(ConvTasNet);

    using Common::SaveLoad::Package;

    // Inference-only snapshot: hyperparameters and parameter values.
    inline Package serialize(const ConvTasNet& model)
    {
        Package package{};
        package.options = model->options();
        package.state_dict = Common::SaveLoad::capture_state(*model);
        return package;
    }

    // Resumable snapshot. cv_loss is stored alongside tr_loss, empty when not given.
    inline Package serialize(const ConvTasNet& model,
                             const torch::optim::Optimizer& optimizer,
                             std::int64_t epoch,
                             std::optional<std::vector<double>> tr_loss = std::nullopt,
                             std::optional<std::vector<double>> cv_loss = std::nullopt)
    {
        auto package = serialize(model);
        package.optim_dict = Common::SaveLoad::capture_optimizer(optimizer);
        package.epoch = epoch;
        if (tr_loss) {
            package.tr_loss = std::move(tr_loss);
            package.cv_loss = cv_loss ? std::move(*cv_loss) : std::vector<double>{};
        }
        return package;
    }

    inline ConvTasNet load_model_from_package(const Package& package)
    {
        ConvTasNet model(package.options);
        Common::SaveLoad::apply_state(*model, package.state_dict);
        return model;
    }

    inline ConvTasNet load_model(const std::filesystem::path& directory, std::ostream* stream = &std::cout)
    {
        return load_model_from_package(Common::SaveLoad::load_package(directory, stream));
    }

    inline void save_model(const std::filesystem::path& directory, const ConvTasNet& model, std::ostream* stream = &std::cout)
    {
        Common::SaveLoad::save_package(directory, serialize(model), stream);
    }

    // Loads the optimizer snapshot of `package` into `optimizer` (built over the reconstructed
    // model) and returns the epoch to resume from.
    inline std::int64_t restore_optimizer(const Package& package, torch::optim::Optimizer& optimizer)
    {
        if (!package.optim_dict) {
            throw std::runtime_error("Checkpoint has no optimizer state to resume from.");
        }
        if (!package.epoch) {
            throw std::runtime_error("Checkpoint has no epoch to resume from.");
        }
        Common::SaveLoad::apply_optimizer(*package.optim_dict, optimizer);
        return *package.epoch;
    }
}

#endif // TASNET_CORE_HPP
