#pragma once

#include <memory>
#include "transport.hpp"

// ShellRelay: interactive terminal on a remote PTY channel.
//
// Puts the local terminal in raw mode, copies stdin to the channel and the
// channel to stdout, and propagates window resizes.  Ends when the remote
// shell exits, stdin closes or the connection drops.
//
//     auto size = platform::terminal_size();
//     auto ch = session->open_shell(size.cols, size.rows);
//     ShellRelay relay(std::move(ch.value));
//     int status = relay.run();
class ShellRelay {
public:
    explicit ShellRelay(std::unique_ptr<Channel> channel);
    ~ShellRelay();

    // Blocks until done.  Exit status of the remote shell, -1 if unknown.
    int run();

private:
    std::unique_ptr<Channel> ch_;
};
