#ifndef TASNET_UTILS_SHAPE_HPP
#define TASNET_UTILS_SHAPE_HPP

#include <sstream>
#include <string>

#include <torch/torch.h>

namespace Tasnet::Utils {
    inline std::string format_shape(c10::IntArrayRef sizes)
    {
        std::ostringstream stream;
        stream << '(';
        bool first = true;
        for (const auto dimension : sizes) {
            if (!first) {
                stream << ", ";
            }
            first = false;
            stream << dimension;
        }
        stream << ')';
        return stream.str();
    }

    inline std::string format_shape(const torch::Tensor& tensor)
    {
        if (!tensor.defined()) {
            return "(undefined)";
        }
        return format_shape(tensor.sizes());
    }
}

#endif // TASNET_UTILS_SHAPE_HPP
