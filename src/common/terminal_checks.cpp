#include "common/terminal_checks.hpp"

#include <nexusexec/common/linux.hpp>

#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string_view>

#include <sys/ioctl.h>
#include <unistd.h>

namespace nexusexec {

// Same heuristic as spdlog's color sinks: COLORTERM, or a TERM naming a known color-capable terminal.
// NO_COLOR (https://no-color.org) always wins.
bool is_color_terminal() noexcept {
    static const bool RESULT = [] {
        if (std::getenv("NO_COLOR") != nullptr) {
            return false;
        }
        if (std::getenv("COLORTERM") != nullptr) {
            return true;
        }

        const char* term = std::getenv("TERM");
        if (term == nullptr) {
            return false;
        }

        static constexpr std::array<std::string_view, 14> COLOR_TERMS = {
            "ansi", "color", "console", "cygwin", "gnome", "konsole", "kterm",
            "linux", "putty", "rxvt", "screen", "tmux", "xterm", "alacritty"};

        std::string_view term_sv{term};
        return ranges::any_of(COLOR_TERMS,
                              [term_sv](std::string_view name) { return term_sv.find(name) != std::string_view::npos; });
    }();

    return RESULT;
}

bool in_terminal(FILE* file) noexcept {
    return ::isatty(::fileno(file)) != 0;
}

Expected<winsize> terminal_size(FILE* file) noexcept {
    winsize size{};

    if (::ioctl(::fileno(file), TIOCGWINSZ, &size) == -1) {
        return linux::make_error_code(errno);
    }

    return size;
}

} // namespace nexusexec
