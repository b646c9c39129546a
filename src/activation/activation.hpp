#ifndef TASNET_ACTIVATION_HPP
#define TASNET_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/relu.hpp"
#include "details/softmax.hpp"

namespace Tasnet::Activation {
    using ReLU = Details::ReLU;
    using Softmax = Details::Softmax;
}

#endif //TASNET_ACTIVATION_HPP
