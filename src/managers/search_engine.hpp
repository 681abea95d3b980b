#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/cancel.hpp>
#include <ssh/session.hpp>

struct SearchOptions {
    bool content = true;                    // grep file contents; false = match file names
    bool regex = false;                     // extended regex instead of a literal
    bool case_sensitive = false;
    std::vector<std::string> includes;      // file globs, e.g. "*.cpp"
    std::vector<std::string> excludes;      // file or directory globs
    int max_results = -1;                   // -1 = configured cap, 0 = unlimited
};

struct SearchMatch {
    std::string path;
    int line = 0;                           // 0 for file name matches
    std::string text;
    std::optional<RemoteFile> file;         // size, mtime, permissions when looked up
};

using MatchCallback = std::function<void(const SearchMatch&)>;

// Content and file name search over one remote invocation per call.
//
// Every root and glob is quoted through RemoteCommand.  Cancellation returns
// the matches collected so far and terminates the remote process group.
class RemoteSearchEngine {
public:
    explicit RemoteSearchEngine(const SshLiteConfig& config);

    Result<std::vector<SearchMatch>> search(Session& session,
                                            const std::vector<std::string>& roots,
                                            const std::string& pattern,
                                            const SearchOptions& options,
                                            const CancelToken* cancel = nullptr,
                                            MatchCallback on_match = nullptr);

    // Full remote command line for a search.  cap 0 means no limit.
    static std::string build_command(const std::vector<std::string>& roots,
                                     const std::string& pattern,
                                     const SearchOptions& options, int cap);

    // "path\0line:text" as printed by grep -nH --null
    static std::optional<SearchMatch> parse_content_line(const std::string& line);

private:
    const SshLiteConfig& config_;

    void terminate(Session& session, Channel& channel, const std::string& pid);
    void enrich(Session& session, std::vector<SearchMatch>& matches);
};
