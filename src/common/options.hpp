#ifndef TASNET_COMMON_OPTIONS_HPP
#define TASNET_COMMON_OPTIONS_HPP

#include <cstdint>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include "../layer/details/normalization.hpp"

namespace Tasnet {
    // Hyperparameters of a Conv-TasNet. Defaults are the best configuration of the paper.
    struct Options {
        std::int64_t N{256}; // filters in the autoencoder
        std::int64_t L{20};  // filter length in samples, i.e. the frame length
        std::int64_t B{256}; // bottleneck channels
        std::int64_t H{512}; // channels inside the convolutional blocks
        std::int64_t P{3};   // kernel size inside the convolutional blocks
        std::int64_t X{8};   // blocks per repeat
        std::int64_t R{4};   // repeats
        std::int64_t C{2};   // sources
        Layer::Details::NormType norm_type{Layer::Details::NormType::Global};

        friend bool operator==(const Options&, const Options&) = default;
    };

    inline void validate(const Options& options)
    {
        auto require_positive = [](std::int64_t value, const char* name) {
            if (value <= 0) {
                std::ostringstream message;
                message << "Conv-TasNet hyperparameter " << name << " must be positive, got " << value << '.';
                throw std::invalid_argument(message.str());
            }
        };
        require_positive(options.N, "N");
        require_positive(options.L, "L");
        require_positive(options.B, "B");
        require_positive(options.H, "H");
        require_positive(options.P, "P");
        require_positive(options.X, "X");
        require_positive(options.R, "R");
        require_positive(options.C, "C");
    }

    inline std::ostream& operator<<(std::ostream& stream, const Options& options)
    {
        return stream << "N=" << options.N << " L=" << options.L << " B=" << options.B << " H=" << options.H
                      << " P=" << options.P << " X=" << options.X << " R=" << options.R << " C=" << options.C
                      << " norm=" << Layer::Details::to_string(options.norm_type);
    }
}

#endif // TASNET_COMMON_OPTIONS_HPP
