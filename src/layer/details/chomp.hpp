#ifndef TASNET_CHOMP_HPP
#define TASNET_CHOMP_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../registry.hpp"

namespace Tasnet::Layer::Details {
    struct Chomp1dOptions {
        std::int64_t chomp_size{0};
    };

    struct Chomp1dDescriptor {
        Chomp1dOptions options{};
    };

    // Drops the trailing `chomp_size` samples of [M, H, Kpad] so that a convolution padded by
    // (P - 1) * dilation on both sides only ever sees past samples and returns K samples.
    class Chomp1dImpl : public torch::nn::Module {
    public:
        explicit Chomp1dImpl(std::int64_t chomp_size = 0)
            : chomp_size_(chomp_size)
        {
            if (chomp_size_ < 0) {
                throw std::invalid_argument("Chomp1d requires a non-negative chomp size.");
            }
        }

        torch::Tensor forward(const torch::Tensor& input)
        {
            if (chomp_size_ == 0) {
                return input;
            }
            const auto length = input.size(-1);
            return input.narrow(-1, 0, length - chomp_size_).contiguous();
        }

        [[nodiscard]] std::int64_t chomp_size() const noexcept { return chomp_size_; }

    private:
        std::int64_t chomp_size_{0};
    };

    TORCH_MODULE(Chomp1d);

    template <class Owner>
    Chomp1d build_registered_layer(Owner& owner, const Chomp1dDescriptor& descriptor, const std::string& name)
    {
        require_name(name);
        return owner.register_module(name, Chomp1d(descriptor.options.chomp_size));
    }
}

#endif //TASNET_CHOMP_HPP
