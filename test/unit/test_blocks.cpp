#include <cstdint>
#include <iostream>
#include <stdexcept>

#include <torch/torch.h>

#include "../../include/Tasnet.h"
#include "common.hpp"

using namespace TasnetTest;
namespace Block = Tasnet::Block;
namespace Layer = Tasnet::Layer;

namespace {
    void test_chomp_removes_tail()
    {
        Layer::Chomp1d chomp(3);
        const auto x = torch::arange(20, torch::kFloat32).view({1, 2, 10});
        const auto y = chomp->forward(x);
        expect(y.size(-1) == 7, "chomp kept the wrong length");
        expect(approx_equal(y, x.narrow(-1, 0, 7)), "chomp altered the kept samples");
    }

    void test_chomp_zero_is_identity()
    {
        Layer::Chomp1d chomp(0);
        const auto x = torch::randn({1, 2, 5});
        expect(approx_equal(chomp->forward(x), x), "chomp 0 must return its input");
    }

    void test_causal_padding()
    {
        expect(Block::Details::causal_padding(3, 4) == 8, "(P - 1) * d for P=3, d=4");
        expect(Block::Details::causal_padding(2, 1) == 1, "(P - 1) * d for P=2, d=1");
    }

    void test_depthwise_separable_shapes()
    {
        Block::DepthwiseSeparableConv conv(Block::DepthwiseSeparable(
            {.in_channels = 6, .out_channels = 4, .kernel_size = 3, .dilation = 4}));
        const auto y = conv->forward(torch::randn({2, 6, 11}));
        expect(y.sizes() == torch::IntArrayRef({2, 4, 11}), "dsconv must keep K and map H -> B");
    }

    void test_depthwise_is_grouped()
    {
        Block::DepthwiseSeparableConv conv(Block::DepthwiseSeparable(
            {.in_channels = 6, .out_channels = 4, .kernel_size = 3, .dilation = 2}));
        const auto parameters = conv->named_parameters();
        expect(parameters["depthwise_conv.weight"].sizes() == torch::IntArrayRef({6, 1, 3}), "depthwise weight shape");
        expect(parameters["pointwise_conv.weight"].sizes() == torch::IntArrayRef({4, 6, 1}), "pointwise weight shape");
        expect(!parameters.contains("depthwise_conv.bias"), "convolutions carry no bias");
    }

    void test_depthwise_is_causal()
    {
        torch::manual_seed(4);
        Block::DepthwiseSeparableConv conv(Block::DepthwiseSeparable(
            {.in_channels = 3, .out_channels = 2, .kernel_size = 3, .dilation = 2,
             .norm_type = Layer::NormType::ChannelWise}));
        const auto x = torch::randn({1, 3, 9});
        auto future = x.clone();
        future.narrow(-1, 6, 3).add_(5.0);
        const auto a = conv->forward(x);
        const auto b = conv->forward(future);
        expect(approx_equal(a.narrow(-1, 0, 6), b.narrow(-1, 0, 6)), "output depended on future samples");
    }

    void test_temporal_block_shape_and_residual()
    {
        torch::manual_seed(5);
        Block::TemporalBlock block(Block::Temporal({.in_channels = 4, .out_channels = 6, .kernel_size = 3, .dilation = 4}));
        const auto x = torch::rand({2, 4, 13});
        const auto y = block->forward(x);
        expect(y.sizes() == x.sizes(), "temporal block must preserve [M, B, K]");
        expect(torch::all(y >= 0).item<bool>(), "final ReLU output must be nonnegative");

        {
            torch::NoGradGuard guard;
            block->named_parameters()["dsconv.pointwise_conv.weight"].zero_();
        }
        expect(approx_equal(block->forward(x), torch::relu(x)), "zero branch must reduce to relu(x)");
    }

    void test_temporal_block_dilation()
    {
        Block::TemporalBlock block(Block::Temporal({.in_channels = 2, .out_channels = 3, .kernel_size = 2, .dilation = 8}));
        expect(block->dilation() == 8, "dilation accessor");
    }

    void test_invalid_channels()
    {
        expect(throws<std::invalid_argument>([] {
                   Block::TemporalBlock block(Block::Temporal({.in_channels = 0, .out_channels = 3}));
               }),
               "zero channels must be rejected");
    }

    void test_padding_overflow()
    {
        expect(throws<std::invalid_argument>([] {
                   Block::DepthwiseSeparableConv conv(Block::DepthwiseSeparable(
                       {.in_channels = 2, .out_channels = 2, .kernel_size = 9, .dilation = std::int64_t{1} << 61}));
               }),
               "(P - 1) * d beyond 64 bits must be rejected");
    }
}

int main()
{
    std::cout << "=== Block tests ===" << std::endl;
    run("chomp removes trailing samples", test_chomp_removes_tail);
    run("chomp 0 is identity", test_chomp_zero_is_identity);
    run("causal padding", test_causal_padding);
    run("depthwise separable shapes", test_depthwise_separable_shapes);
    run("depthwise separable parameters", test_depthwise_is_grouped);
    run("depthwise separable is causal", test_depthwise_is_causal);
    run("temporal block shape and residual", test_temporal_block_shape_and_residual);
    run("temporal block dilation", test_temporal_block_dilation);
    run("invalid channels", test_invalid_channels);
    run("padding overflow", test_padding_overflow);
    return finish("Block");
}
