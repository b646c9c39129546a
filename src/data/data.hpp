#ifndef TASNET_DATA_HPP
#define TASNET_DATA_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/framing.hpp"

namespace Tasnet::Data {
    using FrameOptions = Details::FrameOptions;

    using Details::Frame;
    using Details::OverlapAdd;
    using Details::OverlapCount;
}

#endif //TASNET_DATA_HPP
