#pragma once

#include <string>
#include <vector>

// Single-quote s for a POSIX shell.  Each embedded ' becomes '\'' so the
// result is always exactly one literal word, whatever s contains.
std::string shell_quote(const std::string& s);

// Builder for every remote command line the core sends.  Only arg() and
// option() accept caller-supplied text, and both quote it; literal() is for
// fixed fragments written in this codebase.
class RemoteCommand {
public:
    explicit RemoteCommand(const std::string& program);

    // Fixed text appended verbatim (flags, redirections, operators)
    RemoteCommand& literal(const std::string& text);

    // One quoted argument
    RemoteCommand& arg(const std::string& value);
    RemoteCommand& args(const std::vector<std::string>& values);

    // --name=<quoted value>
    RemoteCommand& option(const std::string& name, const std::string& value);

    // Append "| <next>"
    RemoteCommand& pipe(const RemoteCommand& next);

    // Append "2>/dev/null"
    RemoteCommand& quiet();

    const std::string& str() const { return text_; }

private:
    std::string text_;
};

// "abc" -> true; used before interpolating numbers read back from a remote.
bool is_decimal(const std::string& s);
