#include "search_engine.hpp"
#include <ssh/shell_escape.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <set>

// "~" and "~/x" must still expand on the remote, so only the tail is quoted.
static std::string root_arg(const std::string& root) {
    if (root == "~") return "\"$HOME\"";
    if (root.rfind("~/", 0) == 0) return "\"$HOME\"" + shell_quote(root.substr(1));
    return shell_quote(root);
}

static bool is_directory_glob(const std::string& glob) {
    return glob.find('/') != std::string::npos || glob.find('.') == std::string::npos;
}

RemoteSearchEngine::RemoteSearchEngine(const SshLiteConfig& config) : config_(config) {}

// ── Command construction ───────────────────────────────────

std::string RemoteSearchEngine::build_command(const std::vector<std::string>& roots,
                                              const std::string& pattern,
                                              const SearchOptions& options, int cap) {
    std::string roots_text;
    for (const auto& r : roots) {
        if (!roots_text.empty()) roots_text += " ";
        roots_text += root_arg(r);
    }

    RemoteCommand marker("echo");
    marker.literal(fmt::format("{}$$;", SEARCH_PID_MARKER));

    RemoteCommand cmd(options.content ? "grep" : "find");
    if (options.content) {
        cmd.literal("-rnH --null");
        cmd.literal(options.regex ? "-E" : "-F");
        if (!options.case_sensitive) cmd.literal("-i");
        for (const auto& g : options.includes) cmd.option("--include", g);
        for (const auto& g : options.excludes) {
            cmd.option(is_directory_glob(g) ? "--exclude-dir" : "--exclude", g);
        }
        cmd.literal("-e").arg(pattern).literal("--").literal(roots_text);
    } else {
        cmd.literal(roots_text).literal("-type f");
        cmd.literal(options.case_sensitive ? "-name" : "-iname").arg("*" + pattern + "*");
        if (!options.includes.empty()) {
            cmd.literal("\\(");
            for (size_t i = 0; i < options.includes.size(); i++) {
                if (i > 0) cmd.literal("-o");
                cmd.literal("-name").arg(options.includes[i]);
            }
            cmd.literal("\\)");
        }
        for (const auto& g : options.excludes) {
            cmd.literal("! -path").arg("*/" + g + "/*").literal("! -name").arg(g);
        }
    }
    cmd.quiet();

    if (cap > 0) {
        cmd.pipe(RemoteCommand("head").literal(fmt::format("-n {}", cap)));
    }
    return marker.str() + " " + cmd.str();
}

std::optional<SearchMatch> RemoteSearchEngine::parse_content_line(const std::string& line) {
    auto nul = line.find('\0');
    if (nul == std::string::npos || nul == 0) return std::nullopt;

    SearchMatch m;
    m.path = line.substr(0, nul);
    std::string rest = line.substr(nul + 1);

    auto colon = rest.find(':');
    if (colon == std::string::npos) {
        m.text = trimmed(rest);
        return m;
    }
    m.line = safe_stoi(rest.substr(0, colon), 0);
    m.text = trimmed(rest.substr(colon + 1));
    return m;
}

// ── Search ─────────────────────────────────────────────────

Result<std::vector<SearchMatch>> RemoteSearchEngine::search(Session& session,
                                                            const std::vector<std::string>& roots,
                                                            const std::string& pattern,
                                                            const SearchOptions& options,
                                                            const CancelToken* cancel,
                                                            MatchCallback on_match) {
    using R = Result<std::vector<SearchMatch>>;
    if (roots.empty()) return R::Err("Search needs at least one root", ErrorKind::InvalidArgument);
    if (pattern.empty()) return R::Err("Search pattern is empty", ErrorKind::InvalidArgument);

    std::vector<SearchMatch> matches;
    if (is_cancelled(cancel)) return R::Ok(std::move(matches));

    int cap = options.max_results < 0 ? config_.search_max_results : options.max_results;
    std::string command = build_command(roots, pattern, options, cap);
    sshlite_log(fmt::format("Search on {}: {}", session.id(), command));

    auto ch = session.open_exec_channel(command);
    if (ch.is_err()) {
        return propagate<std::vector<SearchMatch>>(ch, fmt::format("Search failed on {}", session.id()));
    }
    auto& channel = *ch.value;

    const std::string marker = SEARCH_PID_MARKER;
    std::string pid;
    std::string buffer;

    auto consume = [&](const std::string& line) {
        if (line.empty()) return;
        if (pid.empty() && line.rfind(marker, 0) == 0) {
            pid = line.substr(marker.size());
            return;
        }
        std::optional<SearchMatch> m;
        if (options.content) {
            m = parse_content_line(line);
        } else {
            m = SearchMatch{trimmed(line), 0, "", std::nullopt};
            if (m->path.empty()) m.reset();
        }
        if (!m) return;
        if (on_match) on_match(*m);
        matches.push_back(std::move(*m));
    };

    bool cancelled = false;
    while (true) {
        if (is_cancelled(cancel)) {
            cancelled = true;
            break;
        }
        auto status = channel.poll(buffer, nullptr, 100);

        size_t nl;
        while ((nl = buffer.find('\n')) != std::string::npos) {
            consume(buffer.substr(0, nl));
            buffer.erase(0, nl + 1);
        }

        if (status == ChannelStatus::Closed) {
            consume(buffer);
            break;
        }
        if (status == ChannelStatus::Error) {
            channel.close();
            return R::Err(fmt::format("Search channel to {} failed", session.id()),
                          ErrorKind::Connection);
        }
    }

    if (cancelled) {
        terminate(session, channel, pid);
        sshlite_log(fmt::format("Search on {} cancelled with {} matches", session.id(),
                                matches.size()));
        return R::Ok(std::move(matches));
    }
    channel.close();

    enrich(session, matches);
    std::stable_sort(matches.begin(), matches.end(), [](const SearchMatch& a, const SearchMatch& b) {
        if (a.path != b.path) return a.path < b.path;
        return a.line < b.line;
    });
    return R::Ok(std::move(matches));
}

void RemoteSearchEngine::terminate(Session& session, Channel& channel, const std::string& pid) {
    channel.signal("TERM");

    // Not every server honours channel signals; kill the group by pid as well.
    if (is_decimal(pid)) {
        auto kill = RemoteCommand("kill")
                        .literal(fmt::format("-TERM -- -{} 2>/dev/null ||", pid))
                        .literal(fmt::format("{{ pkill -TERM -P {} 2>/dev/null; kill -TERM {} 2>/dev/null; }}",
                                             pid, pid));
        auto r = session.run(kill.str());
        if (r.is_err()) {
            sshlite_log(fmt::format("Search kill on {} failed: {}", session.id(), r.error));
        }
    }
    channel.close();
}

void RemoteSearchEngine::enrich(Session& session, std::vector<SearchMatch>& matches) {
    std::vector<std::string> paths;
    std::set<std::string> seen;
    for (const auto& m : matches) {
        if (static_cast<int>(paths.size()) >= config_.search_max_stat) break;
        if (seen.insert(m.path).second) paths.push_back(m.path);
    }

    std::map<std::string, RemoteFile> stats;
    for (const auto& p : paths) {
        auto st = session.stat(p);
        if (st.is_ok()) stats[p] = st.value;
    }

    for (auto& m : matches) {
        auto it = stats.find(m.path);
        if (it != stats.end()) m.file = it->second;
    }
}
