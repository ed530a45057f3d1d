#ifndef SHEAR_UTILS_TERMINAL_HPP
#define SHEAR_UTILS_TERMINAL_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace Shear::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightYellow = "\033[93m";
        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
    }

    namespace Symbols {
        inline constexpr std::string_view kWarn = "⚠";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    inline std::string PadRight(std::string_view text, std::size_t width) {
        std::string out(text);
        if (out.size() < width) out.append(width - out.size(), ' ');
        return out;
    }

    // ---------- Log lines ----------
    inline void Info(std::ostream* stream, std::string_view message) {
        if (!stream) return;
        *stream << ApplyColor("[Shear]", Colors::kTurquoise) << ' ' << message << '\n';
    }

    inline void Warn(std::ostream* stream, std::string_view message) {
        if (!stream) return;
        *stream << ApplyColor("[Shear]", Colors::kTurquoise) << ' '
                << ApplyColor(std::string(Symbols::kWarn) + " " + std::string(message), Colors::kBrightYellow) << '\n';
    }
}

#endif // SHEAR_UTILS_TERMINAL_HPP
