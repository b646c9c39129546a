#ifndef TASNET_FC_HPP
#define TASNET_FC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"


namespace Tasnet::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{false};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Tasnet::Initialization::Descriptor initialization{::Tasnet::Initialization::Default};
    };

    template <class Owner>
    torch::nn::Linear build_registered_layer(Owner& owner, const FCDescriptor& descriptor, const std::string& name)
    {
        require_name(name);
        if (descriptor.options.in_features <= 0 || descriptor.options.out_features <= 0) {
            throw std::invalid_argument("Fully connected layers require positive in/out features.");
        }

        auto options = torch::nn::LinearOptions(descriptor.options.in_features, descriptor.options.out_features)
                            .bias(descriptor.options.bias);
        auto module = owner.register_module(name, torch::nn::Linear(options));
        {
            torch::NoGradGuard guard;
            ::Tasnet::Initialization::Details::apply_module_initialization(module, descriptor);
        }
        return module;
    }
}

#endif //TASNET_FC_HPP
