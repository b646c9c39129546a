#ifndef TASNET_PRELU_HPP
#define TASNET_PRELU_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../registry.hpp"

namespace Tasnet::Layer::Details {
    // A single slope shared by all channels, as torch::nn::PReLU defaults to.
    struct PReLUOptions {
        std::int64_t num_parameters{1};
        double init{0.25};
    };

    struct PReLUDescriptor {
        PReLUOptions options{};
    };

    template <class Owner>
    torch::nn::PReLU build_registered_layer(Owner& owner, const PReLUDescriptor& descriptor, const std::string& name)
    {
        require_name(name);
        if (descriptor.options.num_parameters <= 0) {
            throw std::invalid_argument("PReLU requires at least one learnable slope.");
        }
        auto options = torch::nn::PReLUOptions()
                           .num_parameters(descriptor.options.num_parameters)
                           .init(descriptor.options.init);
        return owner.register_module(name, torch::nn::PReLU(options));
    }
}

#endif //TASNET_PRELU_HPP
