#ifndef TASNET_SOFTMAX_HPP
#define TASNET_SOFTMAX_HPP

#include <cstdint>
#include <utility>

#include <torch/torch.h>

namespace Tasnet::Activation::Details {

    // Defaults to the trailing axis; the separator normalises over the source axis instead.
    struct Softmax {
        std::int64_t dim{-1};

        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            if (input.dim() == 0) {
                return input;
            }
            return torch::softmax(std::move(input), dim);
        }
    };

}

#endif //TASNET_SOFTMAX_HPP
