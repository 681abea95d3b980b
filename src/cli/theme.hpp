#pragma once

#include <string>
#include <fmt/format.h>
#include <core/types.hpp>
#include <managers/session_registry.hpp>

namespace theme {

namespace color {
    const std::string HOST      = "\033[38;2;86;156;214m";
    const std::string HEADING   = "\033[38;2;206;145;80m";
    const std::string MUTED     = "\033[38;2;110;110;110m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string paint(const std::string& c, const std::string& s) { return c + s + color::RESET; }

inline std::string host(const std::string& s)  { return paint(color::HOST, s); }
inline std::string dim(const std::string& s)   { return paint(color::DIM, s); }
inline std::string red(const std::string& s)   { return paint(color::RED, s); }

// readline needs non-printing sequences fenced with \001 ... \002
inline std::string prompt(const std::string& label) {
    return "\001" + color::HEADING + "\002" + label + "\001" + color::RESET + "\002" + "> ";
}

inline const char* version() { return "0.4.0"; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 44) {
    std::string line = "  ";
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";
    return paint(color::DIM, line) + "\n";
}

inline std::string banner() {
    return "\n" + paint(color::HOST + color::BOLD, "  sshlite") + "\n"
           + paint(color::DIM, fmt::format("  v{}\n  Persistent SSH sessions, files and search",
                                           version()))
           + "\n\n" + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + paint(color::HEADING + color::BOLD, "  " + title) + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// One line of the command list: name column, then the help text
inline std::string command_row(const std::string& name, const std::string& help) {
    return paint(color::HOST, fmt::format("    {:<14}", name)) + paint(color::DIM, help) + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg)   { return paint(color::GREEN, "    + ") + msg + "\n"; }
inline std::string fail(const std::string& msg) { return paint(color::RED, "    x ") + msg + "\n"; }
inline std::string info(const std::string& msg) { return paint(color::HOST, "    ~ ") + msg + "\n"; }
inline std::string step(const std::string& msg) { return paint(color::HEADING, "    > ") + msg + "\n"; }

// Background notices (reconnects, watch events)
inline std::string log(const std::string& msg) {
    return paint(color::MUTED, "    \xc2\xb7 " + msg) + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return paint(color::DIM, fmt::format("    {:<12}", key)) + value + "\n";
}

// Failure line plus the remediation hint for its kind, if any
inline std::string error(const std::string& msg, const std::string& hint) {
    std::string out = fail(msg);
    if (!hint.empty()) out += paint(color::DIM, "      " + hint) + "\n";
    return out;
}

// ── Sessions ────────────────────────────────────────────

inline std::string state(ConnectionState s) {
    const std::string& c = s == ConnectionState::Connected  ? color::GREEN
                         : s == ConnectionState::Connecting ? color::YELLOW
                         : s == ConnectionState::Error      ? color::RED
                                                            : color::MUTED;
    return paint(c, connection_state_name(s));
}

// Progress line for a reconnect notification; hint is used only on give-up
inline std::string reconnect(const ReconnectEvent& ev, const std::string& hint) {
    std::string who = host(ev.host.display());
    if (ev.is_reconnecting) {
        return ev.attempt == 0
            ? log(fmt::format("Connection to {} lost, reconnecting", ev.host.display()))
            : log(fmt::format("Reconnecting to {} (attempt {})", ev.host.display(), ev.attempt));
    }
    if (ev.error.empty()) return ok("Reconnected to " + who);
    return error(fmt::format("Gave up reconnecting to {}: {}", who, ev.error), hint);
}

} // namespace theme
