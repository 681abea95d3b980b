#pragma once

#include <functional>
#include <memory>

namespace platform {

// Visible window of the controlling terminal, 80x24 when unknown.
struct TermSize {
    int cols = 80;
    int rows = 24;
};

TermSize terminal_size();

// True when stdout is an interactive terminal.
bool is_tty();

// Switches stdin to another input mode for its lifetime.
//
//   Relay       every byte goes straight through (interactive shell)
//   HiddenInput line editing off, nothing echoed (secret entry)
class TerminalMode {
public:
    enum Kind { Relay, HiddenInput };

    explicit TerminalMode(Kind kind);
    ~TerminalMode();

    TerminalMode(const TerminalMode&) = delete;
    TerminalMode& operator=(const TerminalMode&) = delete;

private:
    struct Saved;
    std::unique_ptr<Saved> saved_;
};

// True if stdin becomes readable within timeout_ms.
bool poll_stdin(int timeout_ms);

// Tracks window-size changes while alive.  Only one may exist at a time.
class ResizeWatch {
public:
    ResizeWatch();
    ~ResizeWatch();

    ResizeWatch(const ResizeWatch&) = delete;
    ResizeWatch& operator=(const ResizeWatch&) = delete;

    // Reports and clears a pending size change.
    bool changed();
};

// SIGINT/SIGTERM set a flag instead of killing the process, so long-running
// commands can close their sessions first.
void install_interrupt_handler();
bool interrupted();

// Returns once interrupted() or once stop() returns true.
void wait_for_interrupt(const std::function<bool()>& stop = nullptr);

} // namespace platform
