#include "shell_escape.hpp"

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '\'';
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

RemoteCommand::RemoteCommand(const std::string& program) : text_(program) {}

RemoteCommand& RemoteCommand::literal(const std::string& text) {
    text_ += ' ';
    text_ += text;
    return *this;
}

RemoteCommand& RemoteCommand::arg(const std::string& value) {
    text_ += ' ';
    text_ += shell_quote(value);
    return *this;
}

RemoteCommand& RemoteCommand::args(const std::vector<std::string>& values) {
    for (const auto& v : values) arg(v);
    return *this;
}

RemoteCommand& RemoteCommand::option(const std::string& name, const std::string& value) {
    text_ += ' ';
    text_ += name;
    text_ += '=';
    text_ += shell_quote(value);
    return *this;
}

RemoteCommand& RemoteCommand::pipe(const RemoteCommand& next) {
    text_ += " | ";
    text_ += next.str();
    return *this;
}

RemoteCommand& RemoteCommand::quiet() {
    text_ += " 2>/dev/null";
    return *this;
}

bool is_decimal(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}
