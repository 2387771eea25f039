#include "hb/terminal.hpp"

#include <atomic>
#include <cstdio>
#include <exception>
#include <cstdlib>

#include <termios.h>
#include <unistd.h>

namespace hb
{
namespace
{
std::atomic<bool> g_active{false};
termios g_saved{};
bool g_have_saved = false;
std::terminate_handler g_prev_terminate = nullptr;

[[noreturn]] void on_terminate()
{
    restore_terminal();
    if (g_prev_terminate) g_prev_terminate();
    std::abort();
}

void write_all(const char *s, size_t n)
{
    while (n > 0)
    {
        const ssize_t w = ::write(STDOUT_FILENO, s, n);
        if (w <= 0) return;
        s += w;
        n -= static_cast<size_t>(w);
    }
}
} // namespace

TerminalGuard::TerminalGuard()
{
    std::fflush(stdout);
    if (::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &g_saved) == 0)
    {
        g_have_saved = true;
        termios raw = g_saved;
        raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON);
        ::tcsetattr(STDIN_FILENO, TCSANOW, &raw);
    }
    // alternate screen, cursor hidden
    static const char kEnter[] = "\x1b[?1049h\x1b[?25l";
    write_all(kEnter, sizeof(kEnter) - 1);
    g_active.store(true);
    g_prev_terminate = std::set_terminate(on_terminate);
}

TerminalGuard::~TerminalGuard()
{
    restore_terminal();
    std::set_terminate(g_prev_terminate);
}

void restore_terminal()
{
    if (!g_active.exchange(false)) return;
    std::fflush(stdout);
    static const char kLeave[] = "\x1b[?25h\x1b[?1049l";
    write_all(kLeave, sizeof(kLeave) - 1);
    if (g_have_saved)
    {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &g_saved);
        g_have_saved = false;
    }
}
} // namespace hb
