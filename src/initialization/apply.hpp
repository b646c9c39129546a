#ifndef TASNET_INITIALIZATION_APPLY_HPP
#define TASNET_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include "initialization.hpp"

namespace Tasnet::Initialization::Details {
    // Only weights are touched: every convolution and linear layer of the network is bias-free.
    template <class Module, class Descriptor>
    inline void apply_module_initialization(const Module& module, const Descriptor& descriptor) {
        switch (descriptor.initialization.type) {
            case ::Tasnet::Initialization::Type::XavierNormal:
                torch::nn::init::xavier_normal_(module->weight);
                break;
            case ::Tasnet::Initialization::Type::Default:
            default:
                break;
        }
    }
}
#endif // TASNET_INITIALIZATION_APPLY_HPP
