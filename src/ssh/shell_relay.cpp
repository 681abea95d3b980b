#include "shell_relay.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#ifdef _WIN32
#  include <io.h>
#  define STDIN_FILENO  0
#  define STDOUT_FILENO 1
#  define read  _read
#  define write _write
#else
#  include <unistd.h>
#endif

ShellRelay::ShellRelay(std::unique_ptr<Channel> channel) : ch_(std::move(channel)) {}

ShellRelay::~ShellRelay() {
    if (ch_) ch_->close();
}

static bool write_stdout(const std::string& text) {
    size_t sent = 0;
    while (sent < text.size()) {
        auto w = write(STDOUT_FILENO, text.data() + sent, text.size() - sent);
        if (w <= 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

int ShellRelay::run() {
    if (!ch_) return -1;

    int status = -1;
    {
        platform::ResizeWatch window;
        platform::TerminalMode raw(platform::TerminalMode::Relay);
        auto size = platform::terminal_size();
        ch_->resize(size.cols, size.rows);

        char rbuf[SSH_READ_BUF_SIZE];
        std::string out;

        while (true) {
            // Propagate terminal resize to remote PTY
            if (window.changed()) {
                size = platform::terminal_size();
                ch_->resize(size.cols, size.rows);
            }

            // stdin → channel
            if (platform::poll_stdin(0)) {
                auto n = read(STDIN_FILENO, rbuf, sizeof(rbuf));
                if (n <= 0) break;
                auto w = ch_->write(std::string(rbuf, static_cast<size_t>(n)));
                if (w.is_err()) {
                    sshlite_log(fmt::format("ShellRelay: write failed: {}", w.error));
                    break;
                }
            }

            // channel → stdout (stderr is merged on a PTY)
            out.clear();
            auto st = ch_->poll(out, &out, 20);
            if (!out.empty() && !write_stdout(out)) break;
            if (st == ChannelStatus::Closed) {
                status = ch_->exit_status();
                break;
            }
            if (st == ChannelStatus::Error) {
                sshlite_log("ShellRelay: channel error");
                break;
            }
        }
    }

    ch_->close();
    return status;
}
