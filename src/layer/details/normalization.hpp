#ifndef TASNET_NORMALIZATION_HPP
#define TASNET_NORMALIZATION_HPP

#include <cstdint>
#include <ostream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

#include "../../utils/log.hpp"
#include "../registry.hpp"
#include "batchnorm.hpp"
#include "layernorm.hpp"

namespace Tasnet::Layer::Details {
    enum class NormType {
        Global,      // gLN
        ChannelWise, // cLN
        Batch,       // BN
    };

    [[nodiscard]] inline std::string to_string(NormType type)
    {
        switch (type) {
            case NormType::Global: return "gLN";
            case NormType::ChannelWise: return "cLN";
            case NormType::Batch: return "BN";
        }
        return "BN";
    }

    // "gLN" and "cLN" select the layer norms, anything else selects batch normalisation.
    // Only "BN" selects it silently; other strings are kept for compatibility with older
    // configurations but reported on `stream`.
    [[nodiscard]] inline NormType parse_norm_type(std::string_view value, std::ostream* stream = &std::cout)
    {
        if (value == "gLN") {
            return NormType::Global;
        }
        if (value == "cLN") {
            return NormType::ChannelWise;
        }
        if (value != "BN") {
            ::Tasnet::Utils::Log::Warn(stream, "Unrecognised norm_type '" + std::string(value)
                                                   + "', falling back to batch normalisation (BN).");
        }
        return NormType::Batch;
    }

    struct NormalizationDescriptor {
        NormType type{NormType::Global};
        std::int64_t channels{};
    };

    [[nodiscard]] inline torch::nn::AnyModule make_normalization(const NormalizationDescriptor& descriptor)
    {
        switch (descriptor.type) {
            case NormType::Global:
                return torch::nn::AnyModule(GlobalLayerNorm(descriptor.channels));
            case NormType::ChannelWise:
                return torch::nn::AnyModule(ChannelwiseLayerNorm(descriptor.channels));
            case NormType::Batch:
            default:
                return torch::nn::AnyModule(make_batchnorm1d({.num_features = descriptor.channels}));
        }
    }

    // The concrete module is registered directly under `name`, so its parameters read
    // "<name>.gamma" for the layer norms and "<name>.weight" / "<name>.running_mean" for BN.
    template <class Owner>
    torch::nn::AnyModule build_registered_layer(Owner& owner, const NormalizationDescriptor& descriptor, const std::string& name)
    {
        require_name(name);
        auto module = make_normalization(descriptor);
        owner.register_module(name, module.ptr());
        return module;
    }
}

#endif //TASNET_NORMALIZATION_HPP
