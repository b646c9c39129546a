#ifndef TASNET_RELU_HPP
#define TASNET_RELU_HPP

#include <torch/torch.h>

#include <utility>

namespace Tasnet::Activation::Details {
    struct ReLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::relu(std::move(input));
        }
    };
}

#endif //TASNET_RELU_HPP
