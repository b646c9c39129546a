#ifndef TASNET_UTILS_LOG_HPP
#define TASNET_UTILS_LOG_HPP

#include <ostream>
#include <string>
#include <string_view>

#include "terminal.hpp"

// Every entry point takes the destination stream by pointer, nullptr silences it.
namespace Tasnet::Utils::Log {
    inline constexpr std::string_view kTag = "[Tasnet]";

    inline void Info(std::ostream* stream, std::string_view message)
    {
        if (stream == nullptr) {
            return;
        }
        *stream << kTag << ' ' << message << std::endl;
    }

    inline void Warn(std::ostream* stream, std::string_view message)
    {
        if (stream == nullptr) {
            return;
        }
        using Terminal::ApplyColor;
        std::string line{Terminal::Symbols::kWarn};
        line.append(" ").append(message);
        *stream << kTag << ' ' << ApplyColor(line, Terminal::Colors::kBrightYellow) << std::endl;
    }
}

#endif // TASNET_UTILS_LOG_HPP
