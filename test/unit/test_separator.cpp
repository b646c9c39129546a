#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../../include/Tasnet.h"
#include "common.hpp"

using namespace TasnetTest;
namespace Separator = Tasnet::Separator;

namespace {
    Separator::TemporalConvNet make_separator(Tasnet::Layer::NormType norm_type = Tasnet::Layer::NormType::Global)
    {
        return Separator::TemporalConvNet(Separator::TCN({.filters = 5,
                                                          .bottleneck_channels = 4,
                                                          .block_channels = 6,
                                                          .kernel_size = 3,
                                                          .blocks_per_repeat = 3,
                                                          .repeats = 2,
                                                          .sources = 3,
                                                          .norm_type = norm_type}));
    }

    void test_mask_shape_and_simplex()
    {
        torch::manual_seed(6);
        auto separator = make_separator();
        const auto mask = separator->forward(torch::rand({2, 7, 5}));
        expect(mask.sizes() == torch::IntArrayRef({2, 7, 3, 5}), "mask must be [M, K, C, N]");
        expect(torch::all(mask >= 0).item<bool>() && torch::all(mask <= 1).item<bool>(), "mask outside [0, 1]");
        expect(approx_equal(mask.sum(2), torch::ones({2, 7, 5})), "mask does not sum to one over sources");
    }

    void test_dilation_schedule()
    {
        auto separator = make_separator();
        const std::vector<std::int64_t> expected{1, 2, 4, 1, 2, 4};
        expect(separator->dilations() == expected, "dilations must restart at 1 for every repeat");
    }

    void test_receptive_field()
    {
        auto separator = make_separator();
        expect(separator->receptive_field() == 1 + 2 * (2 * (1 + 2 + 4)), "receptive field for P=3, X=3, R=2");
        static_assert(Separator::Details::receptive_field(3, 8, 4) == 1 + 4 * 2 * 255);
    }

    void test_causal_with_channelwise_norm()
    {
        torch::manual_seed(7);
        auto separator = make_separator(Tasnet::Layer::NormType::ChannelWise);
        const auto x = torch::rand({1, 9, 5});
        auto future = x.clone();
        future.narrow(1, 6, 3).add_(2.0);
        const auto a = separator->forward(x);
        const auto b = separator->forward(future);
        expect(approx_equal(a.narrow(1, 0, 6), b.narrow(1, 0, 6)), "cLN separator looked ahead in time");
    }

    void test_parameter_names()
    {
        auto separator = make_separator();
        const auto parameters = separator->named_parameters();
        expect(parameters.contains("layer_norm.gamma"), "input layer norm");
        expect(parameters.contains("bottleneck_conv1x1.weight"), "bottleneck");
        expect(parameters.contains("temporal_conv_net.1.2.dsconv.depthwise_conv.weight"), "last temporal block");
        expect(parameters["mask_conv1x1.weight"].sizes() == torch::IntArrayRef({15, 4, 1}), "mask conv maps B -> C * N");
    }

    void test_receptive_field_overflow()
    {
        static_assert(Separator::Details::receptive_field_fits(3, 8, 4));
        static_assert(!Separator::Details::receptive_field_fits(5, 62, 1));
        static_assert(!Separator::Details::receptive_field_fits(3, 40, std::int64_t{1} << 40));
        expect(throws<std::invalid_argument>([] {
                   Separator::TemporalConvNet(Separator::TCN({.filters = 2,
                                                              .bottleneck_channels = 2,
                                                              .block_channels = 2,
                                                              .kernel_size = 5,
                                                              .blocks_per_repeat = 62,
                                                              .repeats = 1,
                                                              .sources = 2}));
               }),
               "(P - 1) * (2^X - 1) does not fit in 64 bits");
    }
}

int main()
{
    std::cout << "=== Separator tests ===" << std::endl;
    run("mask shape and simplex", test_mask_shape_and_simplex);
    run("dilation schedule", test_dilation_schedule);
    run("receptive field", test_receptive_field);
    run("causal with channel-wise norm", test_causal_with_channelwise_norm);
    run("parameter names", test_parameter_names);
    run("receptive field overflow", test_receptive_field_overflow);
    return finish("Separator");
}
