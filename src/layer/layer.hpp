#ifndef TASNET_LAYER_HPP
#define TASNET_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>

#include "details/batchnorm.hpp"
#include "details/chomp.hpp"
#include "details/conv.hpp"
#include "details/fc.hpp"
#include "details/layernorm.hpp"
#include "details/normalization.hpp"
#include "details/prelu.hpp"

#include "registry.hpp"

namespace Tasnet::Layer {
    using Conv1dOptions = Details::Conv1dOptions;
    using Conv1dDescriptor = Details::Conv1dDescriptor;

    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using PReLUOptions = Details::PReLUOptions;
    using PReLUDescriptor = Details::PReLUDescriptor;

    using Chomp1dOptions = Details::Chomp1dOptions;
    using Chomp1dDescriptor = Details::Chomp1dDescriptor;
    using Chomp1d = Details::Chomp1d;

    using BatchNorm1dOptions = Details::BatchNorm1dOptions;
    using Details::make_batchnorm1d;

    using LayerNormOptions = Details::LayerNormOptions;
    using ChannelwiseLayerNorm = Details::ChannelwiseLayerNorm;
    using GlobalLayerNorm = Details::GlobalLayerNorm;

    using NormType = Details::NormType;
    using NormalizationDescriptor = Details::NormalizationDescriptor;
    using Details::parse_norm_type;
    using Details::to_string;

    [[nodiscard]] inline auto Conv1d(const Conv1dOptions& options,
                                     ::Tasnet::Initialization::Descriptor initialization = ::Tasnet::Initialization::Default) -> Conv1dDescriptor {
        return {options, initialization};
    }

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Tasnet::Initialization::Descriptor initialization = ::Tasnet::Initialization::Default) -> FCDescriptor {
        return {options, initialization};
    }

    [[nodiscard]] inline auto PReLU(const PReLUOptions& options = {}) -> PReLUDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto Chomp(std::int64_t chomp_size) -> Chomp1dDescriptor {
        return {Chomp1dOptions{chomp_size}};
    }

    [[nodiscard]] inline auto Normalization(NormType type, std::int64_t channels) -> NormalizationDescriptor {
        return {type, channels};
    }
}

#endif //TASNET_LAYER_HPP
