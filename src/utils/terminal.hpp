#ifndef REVGRAD_TERMINAL_HPP
#define REVGRAD_TERMINAL_HPP

#include <ostream>
#include <string>
#include <string_view>

namespace Revgrad::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";
        inline constexpr std::string_view kBrightBlack  = "\033[90m";

        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kArrowDown = "▼";
        inline constexpr std::string_view kWarn      = "⚠";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // ---------- Monitoring ----------
    // Every options struct carrying `bool monitor` and `std::ostream* stream` can report through here.
    // Lines look like: [Revgrad] revblock: ▼ layer 2/3 reconstructed
    template <class Options>
    inline void Report(const Options& options, std::string_view source, std::string_view message) {
        if (!options.monitor || options.stream == nullptr) {
            return;
        }
        *options.stream << ApplyColor("[Revgrad]", Colors::kTurquoise) << ' '
                        << ApplyColor(source, Colors::kBrightBlack) << ": " << message << '\n';
    }

    template <class Options>
    inline void Warn(const Options& options, std::string_view source, std::string_view message) {
        if (!options.monitor || options.stream == nullptr) {
            return;
        }
        *options.stream << ApplyColor("[Revgrad]", Colors::kTurquoise) << ' '
                        << ApplyColor(std::string(Symbols::kWarn) + " " + std::string(source), Colors::kOrange)
                        << ": " << message << '\n';
    }
}

#endif // REVGRAD_TERMINAL_HPP
