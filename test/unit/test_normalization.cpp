#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

#include <torch/torch.h>

#include "../../include/Tasnet.h"
#include "common.hpp"

using namespace TasnetTest;
namespace Layer = Tasnet::Layer;

namespace {
    void test_channelwise_formula()
    {
        torch::manual_seed(0);
        Layer::ChannelwiseLayerNorm norm(4);
        {
            torch::NoGradGuard guard;
            norm->gamma.uniform_(0.5, 1.5);
            norm->beta.uniform_(-0.5, 0.5);
        }
        const auto y = torch::randn({2, 4, 7});
        const auto mean = y.mean({1}, true);
        const auto var = y.var({1}, /*unbiased=*/false, true);
        const auto expected = norm->gamma * (y - mean) / torch::sqrt(var + Layer::Details::kLayerNormEpsilon) + norm->beta;
        expect(approx_equal(norm->forward(y), expected), "cLN differs from the closed form");
    }

    void test_global_formula()
    {
        torch::manual_seed(1);
        Layer::GlobalLayerNorm norm(3);
        const auto y = torch::randn({2, 3, 5});
        const auto mean = y.mean({1, 2}, true);
        const auto var = y.var({1, 2}, /*unbiased=*/false, true);
        const auto expected = (y - mean) / torch::sqrt(var + Layer::Details::kLayerNormEpsilon);
        expect(approx_equal(norm->forward(y), expected), "gLN differs from the closed form");
    }

    void test_channelwise_is_per_timestep()
    {
        torch::manual_seed(2);
        Layer::ChannelwiseLayerNorm norm(3);
        const auto y = torch::randn({1, 3, 6});
        auto perturbed = y.clone();
        perturbed.select(2, 5).mul_(10.0).add_(3.0);
        const auto a = norm->forward(y);
        const auto b = norm->forward(perturbed);
        expect(approx_equal(a.narrow(2, 0, 5), b.narrow(2, 0, 5)), "cLN leaked a later timestep into earlier ones");
    }

    void test_global_couples_timesteps()
    {
        torch::manual_seed(3);
        Layer::GlobalLayerNorm norm(3);
        const auto y = torch::randn({1, 3, 6});
        auto perturbed = y.clone();
        perturbed.select(2, 5).mul_(10.0).add_(3.0);
        const auto a = norm->forward(y);
        const auto b = norm->forward(perturbed);
        const auto per_step = (a - b).abs().amax({0, 1}); // [6]
        for (std::int64_t t = 0; t < 5; ++t) {
            expect(per_step[t].item<double>() > 1e-4,
                   "gLN output at timestep " + std::to_string(t) + " ignored the last timestep");
        }
    }

    void test_initial_parameters()
    {
        Layer::GlobalLayerNorm norm(5);
        expect(norm->gamma.sizes() == torch::IntArrayRef({1, 5, 1}), "gamma shape");
        expect(torch::all(norm->gamma == 1).item<bool>(), "gamma starts at one");
        expect(torch::all(norm->beta == 0).item<bool>(), "beta starts at zero");
    }

    void test_norm_type_parsing()
    {
        std::ostringstream log;
        expect(Layer::parse_norm_type("gLN", &log) == Layer::NormType::Global, "gLN");
        expect(Layer::parse_norm_type("cLN", &log) == Layer::NormType::ChannelWise, "cLN");
        expect(Layer::parse_norm_type("BN", &log) == Layer::NormType::Batch, "BN");
        expect(log.str().empty(), "known norm types must not warn");

        expect(Layer::parse_norm_type("layer", &log) == Layer::NormType::Batch, "unknown strings fall back to BN");
        expect(log.str().find("layer") != std::string::npos, "fallback warning names the rejected value");
    }

    void test_batch_fallback_builds_batchnorm()
    {
        std::ostringstream log;
        Tasnet::ConvTasNet model(4, 4, 2, 3, 2, 1, 1, 1, "whatever", &log);
        expect(model->options().norm_type == Layer::NormType::Batch, "norm type");
        expect(!log.str().empty(), "fallback was not reported");
        const auto parameters = model->named_parameters();
        expect(parameters.contains("separator.temporal_conv_net.0.0.norm.weight"), "batch norm weight missing");
        expect(!parameters.contains("separator.temporal_conv_net.0.0.norm.gamma"), "layer norm built instead of batch norm");
        const auto buffers = model->named_buffers();
        expect(buffers.contains("separator.temporal_conv_net.0.0.norm.running_mean"), "batch norm running mean missing");
    }
}

int main()
{
    std::cout << "=== Normalization tests ===" << std::endl;
    run("cLN matches closed form", test_channelwise_formula);
    run("gLN matches closed form", test_global_formula);
    run("cLN is per timestep", test_channelwise_is_per_timestep);
    run("gLN couples timesteps", test_global_couples_timesteps);
    run("gain and bias initialisation", test_initial_parameters);
    run("norm type parsing", test_norm_type_parsing);
    run("unknown norm type builds batch norm", test_batch_fallback_builds_batchnorm);
    return finish("Normalization");
}
