#pragma once

#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>

namespace cokacenc::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_GREEN = "\033[1;32m";
    constexpr const char* BOLD_WHITE = "\033[1;37m";

    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// True when `os` is std::cout/std::cerr attached to a terminal and neither
// NO_COLOR nor --no-color switched colors off.
bool ColorsEnabled(std::ostream& os = std::cout);

// Overrides auto-detection (--no-color).
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Green(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::GREEN, os); }
inline std::string Yellow(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::YELLOW, os); }
inline std::string Cyan(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::CYAN, os); }
inline std::string Dim(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BRIGHT_BLACK, os); }
inline std::string BoldRed(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BOLD_RED, os); }
inline std::string BoldGreen(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BOLD_GREEN, os); }
inline std::string Bold(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BOLD_WHITE, os); }

// Progress lines used by the pack/unpack drivers.
void Step(std::ostream& os, const std::string& verb, const std::string& subject);
void Detail(std::ostream& os, const std::string& text);
void Warn(std::ostream& os, const std::string& text);

// 1536 -> "1.5 KB"
std::string FormatSize(std::uint64_t bytes);

}  // namespace cokacenc::cli
