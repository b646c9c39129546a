#ifndef TASNET_SEPARATOR_HPP
#define TASNET_SEPARATOR_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/temporal_conv_net.hpp"

namespace Tasnet::Separator {
    using TemporalConvNetOptions = Details::TemporalConvNetOptions;
    using TemporalConvNetDescriptor = Details::TemporalConvNetDescriptor;
    using TemporalConvNet = Details::TemporalConvNet;

    [[nodiscard]] inline auto TCN(const TemporalConvNetOptions& options,
                                  ::Tasnet::Initialization::Descriptor initialization = ::Tasnet::Initialization::Default)
        -> TemporalConvNetDescriptor {
        return {options, initialization};
    }
}

#endif //TASNET_SEPARATOR_HPP
