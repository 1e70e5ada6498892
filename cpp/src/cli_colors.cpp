#include "b64unpack/cli_colors.hpp"

#include <cstdio>
#include <iostream>
#include <string>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <termios.h>
    #include <unistd.h>
#endif

namespace b64unpack::cli {

namespace {
    bool g_colors_enabled = true;
    bool g_colors_checked = false;

#if defined(_WIN32) || defined(_WIN64)
    // Enable Windows 10+ ANSI color support
    bool EnableWindowsAnsiColors() {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        if (hOut == INVALID_HANDLE_VALUE) {
            return false;
        }

        DWORD mode = 0;
        if (!GetConsoleMode(hOut, &mode)) {
            return false;
        }

        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(hOut, mode) != 0;
    }

    class EchoGuard {
    public:
        EchoGuard() {
            handle_ = GetStdHandle(STD_INPUT_HANDLE);
            if (handle_ != INVALID_HANDLE_VALUE && GetConsoleMode(handle_, &saved_)) {
                active_ = SetConsoleMode(handle_, saved_ & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
            }
        }
        ~EchoGuard() {
            if (active_) {
                SetConsoleMode(handle_, saved_);
            }
        }

    private:
        HANDLE handle_ = INVALID_HANDLE_VALUE;
        DWORD saved_ = 0;
        bool active_ = false;
    };
#else
    class EchoGuard {
    public:
        EchoGuard() {
            if (tcgetattr(STDIN_FILENO, &saved_) == 0) {
                termios quiet = saved_;
                quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
                active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0;
            }
        }
        ~EchoGuard() {
            if (active_) {
                tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
            }
        }

    private:
        termios saved_{};
        bool active_ = false;
    };
#endif
}

bool ColorsEnabled(std::ostream& os) {
    if (!g_colors_checked) {
        // Auto-detect: check if output is a TTY
        bool is_tty = false;
        if (&os == &std::cout) {
            is_tty = isatty(fileno(stdout)) != 0;
        } else if (&os == &std::cerr) {
            is_tty = isatty(fileno(stderr)) != 0;
        }

        g_colors_enabled = is_tty;

#if defined(_WIN32) || defined(_WIN64)
        if (is_tty) {
            g_colors_enabled = EnableWindowsAnsiColors();
        }
#endif

        g_colors_checked = true;
    }
    return g_colors_enabled;
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled = enabled;
    g_colors_checked = true;
}

std::string Colorize(const std::string& text, const char* color) {
    if (!ColorsEnabled()) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

std::string Info(const std::string& text) {
    return Cyan("[*]") + " " + text;
}

std::string Success(const std::string& text) {
    return Green("[+]") + " " + text;
}

std::string Failure(const std::string& text) {
    return Red("[-]") + " " + text;
}

bool StdinIsTerminal() {
    return isatty(fileno(stdin)) != 0;
}

std::string ReadSecret(const std::string& prompt) {
    std::cerr << prompt << std::flush;
    std::string line;
    {
        EchoGuard guard;
        std::getline(std::cin, line);
    }
    std::cerr << "\n";
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

}  // namespace b64unpack::cli
