#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace b64unpack::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_WHITE = "\033[1;37m";
}

// Check if colors should be enabled for the given stream
bool ColorsEnabled(std::ostream& os = std::cout);

// Set whether colors are enabled (can be disabled via --no-color)
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color);

inline std::string Red(const std::string& text) { return Colorize(text, color::RED); }
inline std::string Green(const std::string& text) { return Colorize(text, color::GREEN); }
inline std::string Yellow(const std::string& text) { return Colorize(text, color::YELLOW); }
inline std::string Cyan(const std::string& text) { return Colorize(text, color::CYAN); }
inline std::string BoldWhite(const std::string& text) { return Colorize(text, color::BOLD_WHITE); }

// Status line prefixes: "[*]" info, "[+]" success, "[-]" failure.
std::string Info(const std::string& text);
std::string Success(const std::string& text);
std::string Failure(const std::string& text);

bool StdinIsTerminal();

// Prompts on stderr and reads one line from the terminal with echo off.
std::string ReadSecret(const std::string& prompt);

}  // namespace b64unpack::cli
