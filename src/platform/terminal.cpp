#include "terminal.hpp"
#include "platform.hpp"
#include <csignal>
#include <cstdio>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <poll.h>
#  include <signal.h>
#  include <sys/ioctl.h>
#  include <termios.h>
#  include <unistd.h>
#endif

namespace platform {

TermSize terminal_size() {
    TermSize size;
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO info;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &info)) {
        size.cols = info.srWindow.Right - info.srWindow.Left + 1;
        size.rows = info.srWindow.Bottom - info.srWindow.Top + 1;
    }
#else
    struct winsize ws {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0) {
        if (ws.ws_col > 0) size.cols = ws.ws_col;
        if (ws.ws_row > 0) size.rows = ws.ws_row;
    }
#endif
    return size;
}

bool is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

// ── Input modes ──────────────────────────────────────────────

#ifdef _WIN32

struct TerminalMode::Saved {
    DWORD console_mode = 0;
    bool valid = false;
};

TerminalMode::TerminalMode(Kind kind) : saved_(new Saved) {
    HANDLE in = GetStdHandle(STD_INPUT_HANDLE);
    if (!GetConsoleMode(in, &saved_->console_mode)) return;
    saved_->valid = true;

    DWORD mode = saved_->console_mode &
                 ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT | ENABLE_PROCESSED_INPUT);
    if (kind == Relay) mode |= ENABLE_VIRTUAL_TERMINAL_INPUT;
    SetConsoleMode(in, mode);
}

TerminalMode::~TerminalMode() {
    if (saved_->valid) SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), saved_->console_mode);
}

#else

struct TerminalMode::Saved {
    struct termios attrs {};
    bool valid = false;
};

TerminalMode::TerminalMode(Kind kind) : saved_(new Saved) {
    // stdin may be a pipe; leave it alone then
    if (tcgetattr(STDIN_FILENO, &saved_->attrs) != 0) return;
    saved_->valid = true;

    struct termios next = saved_->attrs;
    if (kind == Relay) {
        cfmakeraw(&next);
    } else {
        next.c_lflag &= ~(ICANON | ECHO);
        next.c_cc[VMIN] = 1;
        next.c_cc[VTIME] = 0;
    }
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &next);
}

TerminalMode::~TerminalMode() {
    if (saved_->valid) tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_->attrs);
}

#endif

bool poll_stdin(int timeout_ms) {
#ifdef _WIN32
    HANDLE in = GetStdHandle(STD_INPUT_HANDLE);
    if (WaitForSingleObject(in, static_cast<DWORD>(timeout_ms)) != WAIT_OBJECT_0) return false;

    // Focus and mouse records also wake the handle; drop them
    INPUT_RECORD rec;
    DWORD count = 0;
    while (PeekConsoleInputW(in, &rec, 1, &count) && count > 0) {
        if (rec.EventType == KEY_EVENT && rec.Event.KeyEvent.bKeyDown) return true;
        ReadConsoleInputW(in, &rec, 1, &count);
    }
    return false;
#else
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
#endif
}

// ── Window size changes ──────────────────────────────────────

#ifdef _WIN32

static TermSize g_last_size;

ResizeWatch::ResizeWatch() { g_last_size = terminal_size(); }
ResizeWatch::~ResizeWatch() = default;

// No SIGWINCH; compare against the last size seen
bool ResizeWatch::changed() {
    TermSize now = terminal_size();
    if (now.cols == g_last_size.cols && now.rows == g_last_size.rows) return false;
    g_last_size = now;
    return true;
}

#else

static volatile sig_atomic_t g_window_changed = 0;
static struct sigaction g_previous_winch;

static void on_winch(int) { g_window_changed = 1; }

ResizeWatch::ResizeWatch() {
    g_window_changed = 0;
    struct sigaction sa {};
    sa.sa_handler = on_winch;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, &g_previous_winch);
}

ResizeWatch::~ResizeWatch() {
    sigaction(SIGWINCH, &g_previous_winch, nullptr);
}

bool ResizeWatch::changed() {
    if (!g_window_changed) return false;
    g_window_changed = 0;
    return true;
}

#endif

// ── Interrupts ───────────────────────────────────────────────

static volatile std::sig_atomic_t g_stop_requested = 0;

static void on_interrupt(int) { g_stop_requested = 1; }

void install_interrupt_handler() {
    g_stop_requested = 0;
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
}

bool interrupted() {
    return g_stop_requested != 0;
}

void wait_for_interrupt(const std::function<bool()>& stop) {
    while (!interrupted() && !(stop && stop())) {
        sleep_ms(100);
    }
}

} // namespace platform
