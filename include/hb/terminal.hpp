#pragma once

namespace hb
{
// Puts stdout into dashboard mode (alternate screen, hidden cursor, no echo)
// for its lifetime. restore_terminal() undoes it from any exit path and may
// be called more than once.
class TerminalGuard
{
public:
    TerminalGuard();
    ~TerminalGuard();
    TerminalGuard(const TerminalGuard &) = delete;
    TerminalGuard &operator=(const TerminalGuard &) = delete;
};

void restore_terminal();
} // namespace hb
