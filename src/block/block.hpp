#ifndef TASNET_BLOCK_HPP
#define TASNET_BLOCK_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>

#include "details/blocks/depthwise_separable.hpp"
#include "details/blocks/temporal.hpp"

namespace Tasnet::Block {
    using DepthwiseSeparableOptions = Details::DepthwiseSeparableOptions;
    using DepthwiseSeparableDescriptor = Details::DepthwiseSeparableDescriptor;
    using DepthwiseSeparableConv = Details::DepthwiseSeparableConv;

    using TemporalBlockOptions = Details::TemporalBlockOptions;
    using TemporalBlockDescriptor = Details::TemporalBlockDescriptor;
    using TemporalBlock = Details::TemporalBlock;

    [[nodiscard]] inline auto DepthwiseSeparable(const DepthwiseSeparableOptions& options,
                                                 ::Tasnet::Initialization::Descriptor initialization = ::Tasnet::Initialization::Default)
        -> DepthwiseSeparableDescriptor {
        return {options, initialization};
    }

    [[nodiscard]] inline auto Temporal(const TemporalBlockOptions& options,
                                       ::Tasnet::Initialization::Descriptor initialization = ::Tasnet::Initialization::Default)
        -> TemporalBlockDescriptor {
        return {options, initialization};
    }
}

#endif //TASNET_BLOCK_HPP
