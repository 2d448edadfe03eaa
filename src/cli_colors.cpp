#include "cokacenc/cli_colors.hpp"

#include "cokacenc/env.hpp"

#include <cstdio>
#include <sstream>

#include <unistd.h>

namespace cokacenc::cli {

namespace {
    // -1: auto-detect, 0: forced off, 1: forced on
    int g_colors_override = -1;
}

bool ColorsEnabled(std::ostream& os) {
    if (g_colors_override >= 0) {
        return g_colors_override == 1;
    }
    if (cokacenc::env::IsSet("NO_COLOR")) {
        return false;
    }
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_colors_override = enabled ? 1 : 0;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

void Step(std::ostream& os, const std::string& verb, const std::string& subject) {
    os << Cyan(verb + ":", os) << " " << Bold(subject, os) << "\n";
}

void Detail(std::ostream& os, const std::string& text) {
    os << "  " << Dim("→", os) << " " << text << "\n";
}

void Warn(std::ostream& os, const std::string& text) {
    os << "  " << Yellow("warning:", os) << " " << text << "\n";
}

std::string FormatSize(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    std::size_t unit = 0;
    double value = static_cast<double>(bytes);
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << value << " " << units[unit];
    return oss.str();
}

}  // namespace cokacenc::cli
