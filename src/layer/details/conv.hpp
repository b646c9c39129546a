#ifndef TASNET_CONV_HPP
#define TASNET_CONV_HPP
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"

namespace Tasnet::Layer::Details {

    // Every convolution of the network is bias-free, hence the default.
    struct Conv1dOptions {
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::int64_t kernel_size{1};
        std::int64_t stride{1};
        std::int64_t padding{0};
        std::int64_t dilation{1};
        std::int64_t groups{1};
        bool bias{false};
    };

    struct Conv1dDescriptor {
        Conv1dOptions options{};
        ::Tasnet::Initialization::Descriptor initialization{::Tasnet::Initialization::Default};
    };

    template <class Owner>
    torch::nn::Conv1d build_registered_layer(Owner& owner, const Conv1dDescriptor& descriptor, const std::string& name)
    {
        require_name(name);
        const auto& options = descriptor.options;
        if (options.in_channels <= 0 || options.out_channels <= 0) {
            throw std::invalid_argument("Conv1d layers require positive channel counts.");
        }
        if (options.kernel_size <= 0 || options.stride <= 0 || options.dilation <= 0) {
            throw std::invalid_argument("Conv1d layers require positive kernel size, stride and dilation.");
        }
        if (options.padding < 0) {
            throw std::invalid_argument("Conv1d layers require a non-negative padding.");
        }
        if (options.groups <= 0 || options.in_channels % options.groups != 0 || options.out_channels % options.groups != 0) {
            throw std::invalid_argument("Conv1d groups must divide both the input and output channel counts.");
        }

        auto torch_options = torch::nn::Conv1dOptions(options.in_channels, options.out_channels, options.kernel_size)
                                 .stride(options.stride)
                                 .padding(options.padding)
                                 .dilation(options.dilation)
                                 .groups(options.groups)
                                 .bias(options.bias);

        auto module = owner.register_module(name, torch::nn::Conv1d(torch_options));
        {
            torch::NoGradGuard guard;
            ::Tasnet::Initialization::Details::apply_module_initialization(module, descriptor);
        }
        return module;
    }

}

#endif //TASNET_CONV_HPP
