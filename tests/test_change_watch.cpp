#include <gtest/gtest.h>
#include <ssh/change_watch.hpp>
#include "support/mock_transport.hpp"
#include <condition_variable>

// ── Probe ──────────────────────────────────────────────────

TEST(RemoteOsParse, KnownNames) {
    EXPECT_EQ(parse_remote_os("Linux\n"), RemoteOs::Linux);
    EXPECT_EQ(parse_remote_os("Darwin"), RemoteOs::Darwin);
    EXPECT_EQ(parse_remote_os("MINGW64_NT-10.0"), RemoteOs::Windows);
    EXPECT_EQ(parse_remote_os("CYGWIN_NT-10.0"), RemoteOs::Windows);
    EXPECT_EQ(parse_remote_os("MSYS_NT-10.0"), RemoteOs::Windows);
    EXPECT_EQ(parse_remote_os("FreeBSD"), RemoteOs::Unknown);
    EXPECT_EQ(parse_remote_os(""), RemoteOs::Unknown);
}

TEST(WatchMethodChoice, Preference) {
    CapabilityProbe p;
    EXPECT_EQ(choose_watch_method(p), WatchMethod::Poll);
    p.has_fswatch = true;
    EXPECT_EQ(choose_watch_method(p), WatchMethod::Fswatch);
    p.has_inotifywait = true;
    EXPECT_EQ(choose_watch_method(p), WatchMethod::Inotifywait);
}

static ProbeRunner scripted(const std::map<std::string, std::string>& outputs,
                            std::vector<std::string>* seen = nullptr) {
    return [outputs, seen](const std::string& cmd) {
        if (seen) seen->push_back(cmd);
        for (const auto& [needle, out] : outputs) {
            if (cmd.find(needle) != std::string::npos) {
                return Result<SSHResult>::Ok(SSHResult{0, out, ""});
            }
        }
        return Result<SSHResult>::Ok(SSHResult{0, "", ""});
    };
}

TEST(DetectCapabilities, LinuxWithInotify) {
    auto probe = detect_capabilities(scripted({{"uname", "Linux\n"}, {"inotifywait", "yes\n"}}));
    EXPECT_EQ(probe.os, RemoteOs::Linux);
    EXPECT_TRUE(probe.has_inotifywait);
    EXPECT_EQ(probe.method, WatchMethod::Inotifywait);
}

TEST(DetectCapabilities, LinuxWithoutInotifyPolls) {
    std::vector<std::string> seen;
    auto probe = detect_capabilities(scripted({{"uname", "Linux\n"}, {"inotifywait", "no\n"}}, &seen));
    EXPECT_EQ(probe.method, WatchMethod::Poll);
    // fswatch is only looked for on macOS and unknown systems
    for (const auto& c : seen) EXPECT_EQ(c.find("fswatch"), std::string::npos);
}

TEST(DetectCapabilities, DarwinWithFswatch) {
    auto probe = detect_capabilities(scripted({{"uname", "Darwin\n"}, {"fswatch", "yes\n"}}));
    EXPECT_EQ(probe.os, RemoteOs::Darwin);
    EXPECT_TRUE(probe.has_fswatch);
    EXPECT_EQ(probe.method, WatchMethod::Fswatch);
}

TEST(DetectCapabilities, RunnerFailureDegradesToPoll) {
    auto probe = detect_capabilities([](const std::string&) {
        return Result<SSHResult>::Err("channel refused", ErrorKind::Connection);
    });
    EXPECT_EQ(probe.os, RemoteOs::Unknown);
    EXPECT_EQ(probe.method, WatchMethod::Poll);
}

// ── Commands and parsing ───────────────────────────────────

TEST(WatchCommand, InotifyQuotesPath) {
    auto cmd = watch_command(WatchMethod::Inotifywait, "/srv/it's here.log");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(*cmd, "inotifywait -m -e modify,delete_self,move_self '/srv/it'\\''s here.log' 2>/dev/null");
}

TEST(WatchCommand, Fswatch) {
    auto cmd = watch_command(WatchMethod::Fswatch, "/Users/bob/a.txt");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_NE(cmd->find("fswatch -x"), std::string::npos);
    EXPECT_NE(cmd->find("'/Users/bob/a.txt'"), std::string::npos);
}

TEST(WatchCommand, PollHasNone) {
    EXPECT_FALSE(watch_command(WatchMethod::Poll, "/x").has_value());
}

TEST(ParseWatchLine, Inotify) {
    EXPECT_EQ(parse_watch_line(WatchMethod::Inotifywait, "/a MODIFY "), FileChangeKind::Modify);
    EXPECT_EQ(parse_watch_line(WatchMethod::Inotifywait, "/a DELETE_SELF "), FileChangeKind::Delete);
    EXPECT_EQ(parse_watch_line(WatchMethod::Inotifywait, "/a MOVE_SELF "), FileChangeKind::Delete);
    EXPECT_EQ(parse_watch_line(WatchMethod::Inotifywait, "/a CREATE x"), FileChangeKind::Create);
    EXPECT_FALSE(parse_watch_line(WatchMethod::Inotifywait, "   ").has_value());
}

TEST(ParseWatchLine, Fswatch) {
    EXPECT_EQ(parse_watch_line(WatchMethod::Fswatch, "/a Updated"), FileChangeKind::Modify);
    EXPECT_EQ(parse_watch_line(WatchMethod::Fswatch, "/a Removed"), FileChangeKind::Delete);
    EXPECT_EQ(parse_watch_line(WatchMethod::Fswatch, "/a Created IsFile"), FileChangeKind::Create);
}

// ── Broker ─────────────────────────────────────────────────

namespace {

struct Collected {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<std::string, FileChangeKind>> events;

    void add(const std::string& path, FileChangeKind kind) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back({path, kind});
        }
        cv.notify_all();
    }

    bool wait_for(size_t n) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [&] { return events.size() >= n; });
    }
};

std::unique_ptr<Channel> feed_channel(const std::shared_ptr<MockHost>& host,
                                      const std::shared_ptr<MockFeed>& feed) {
    MockReply r;
    r.feed = feed;
    auto alive = std::make_shared<std::atomic<bool>>(true);
    return std::make_unique<MockChannel>(host, alive, r);
}

} // namespace

TEST(ChangeWatchBroker, DeliversParsedLines) {
    auto host = std::make_shared<MockHost>();
    auto feed = std::make_shared<MockFeed>();
    Collected got;
    ChangeWatchBroker broker([&](const std::string& p, FileChangeKind k) { got.add(p, k); });

    broker.watch("/etc/app.conf", WatchMethod::Inotifywait, feed_channel(host, feed));
    EXPECT_TRUE(broker.is_watching("/etc/app.conf"));

    // A line split across reads is only parsed once complete
    feed->push("/etc/app.conf MOD");
    feed->push("IFY \n/etc/app.conf DELETE_SELF \n");
    ASSERT_TRUE(got.wait_for(2));

    std::lock_guard<std::mutex> lock(got.mutex);
    EXPECT_EQ(got.events[0].first, "/etc/app.conf");
    EXPECT_EQ(got.events[0].second, FileChangeKind::Modify);
    EXPECT_EQ(got.events[1].second, FileChangeKind::Delete);
}

TEST(ChangeWatchBroker, UnwatchStopsReader) {
    auto host = std::make_shared<MockHost>();
    auto feed = std::make_shared<MockFeed>();
    Collected got;
    ChangeWatchBroker broker([&](const std::string& p, FileChangeKind k) { got.add(p, k); });

    broker.watch("/a", WatchMethod::Inotifywait, feed_channel(host, feed));
    EXPECT_TRUE(broker.unwatch("/a"));
    EXPECT_FALSE(broker.unwatch("/a"));
    EXPECT_FALSE(broker.is_watching("/a"));
    EXPECT_TRUE(broker.watched().empty());

    feed->push("/a MODIFY \n");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::lock_guard<std::mutex> lock(got.mutex);
    EXPECT_TRUE(got.events.empty());
}

TEST(ChangeWatchBroker, ToolExitEndsWatch) {
    auto host = std::make_shared<MockHost>();
    auto feed = std::make_shared<MockFeed>();
    ChangeWatchBroker broker(nullptr);

    broker.watch("/a", WatchMethod::Fswatch, feed_channel(host, feed));
    feed->finish();

    for (int i = 0; i < 200 && broker.is_watching("/a"); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(broker.is_watching("/a"));
}

TEST(ChangeWatchBroker, RewatchReplacesChannel) {
    auto host = std::make_shared<MockHost>();
    auto first = std::make_shared<MockFeed>();
    auto second = std::make_shared<MockFeed>();
    Collected got;
    ChangeWatchBroker broker([&](const std::string& p, FileChangeKind k) { got.add(p, k); });

    broker.watch("/a", WatchMethod::Inotifywait, feed_channel(host, first));
    broker.watch("/a", WatchMethod::Inotifywait, feed_channel(host, second));
    EXPECT_EQ(broker.watched().size(), 1u);

    second->push("/a CREATE \n");
    ASSERT_TRUE(got.wait_for(1));
    std::lock_guard<std::mutex> lock(got.mutex);
    EXPECT_EQ(got.events[0].second, FileChangeKind::Create);
}
