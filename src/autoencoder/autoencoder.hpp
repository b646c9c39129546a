#ifndef TASNET_AUTOENCODER_HPP
#define TASNET_AUTOENCODER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/decoder.hpp"
#include "details/encoder.hpp"

namespace Tasnet::AutoEncoder {
    using EncoderOptions = Details::EncoderOptions;
    using EncoderDescriptor = Details::EncoderDescriptor;
    using Encoder = Details::Encoder;

    using DecoderOptions = Details::DecoderOptions;
    using DecoderDescriptor = Details::DecoderDescriptor;
    using Decoder = Details::Decoder;
}

#endif //TASNET_AUTOENCODER_HPP
