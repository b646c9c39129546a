#ifndef TASNET_BATCHNORM_HPP
#define TASNET_BATCHNORM_HPP
#include <cstdint>

#include <stdexcept>

#include <torch/nn/module.h>
#include <torch/nn/options/batchnorm.h>
#include <torch/torch.h>


namespace Tasnet::Layer::Details {

    struct BatchNorm1dOptions {
        std::int64_t num_features{};
        double eps{1e-5};
        double momentum{0.1};
        bool affine{true};
        bool track_running_stats{true};
    };

    inline torch::nn::BatchNorm1d make_batchnorm1d(const BatchNorm1dOptions& options)
    {
        if (options.num_features <= 0) {
            throw std::invalid_argument("BatchNorm1d requires a positive number of features.");
        }

        return torch::nn::BatchNorm1d(torch::nn::BatchNorm1dOptions(options.num_features)
                                          .eps(options.eps)
                                          .momentum(options.momentum)
                                          .affine(options.affine)
                                          .track_running_stats(options.track_running_stats));
    }

}

#endif //TASNET_BATCHNORM_HPP
