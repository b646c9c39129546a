#ifndef TASNET_UTILS_TERMINAL_HPP
#define TASNET_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Tasnet::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightRed     = "\033[91m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightCyan    = "\033[96m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kCross     = "✘";
        inline constexpr std::string_view kWarn      = "⚠";
    }

    // ---------- Small helpers ----------
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }
}

#endif // TASNET_UTILS_TERMINAL_HPP
