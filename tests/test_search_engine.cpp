#include <gtest/gtest.h>
#include <managers/search_engine.hpp>
#include "support/session_fixture.hpp"

using namespace std::string_literals;

// ── Command construction ───────────────────────────────────

TEST(SearchCommand, ContentDefaults) {
    SearchOptions opts;
    auto cmd = RemoteSearchEngine::build_command({"/srv/app"}, "TODO", opts, 500);
    EXPECT_EQ(cmd, "echo __SSHLITE_PID__$$; grep -rnH --null -F -i -e 'TODO' -- '/srv/app' "
                   "2>/dev/null | head -n 500");
}

TEST(SearchCommand, ContentRegexWithGlobs) {
    SearchOptions opts;
    opts.regex = true;
    opts.case_sensitive = true;
    opts.includes = {"*.cpp"};
    opts.excludes = {"node_modules", "*.min.js"};
    auto cmd = RemoteSearchEngine::build_command({"/a", "/b c"}, "fo+", opts, 0);
    EXPECT_EQ(cmd, "echo __SSHLITE_PID__$$; grep -rnH --null -E --include='*.cpp' "
                   "--exclude-dir='node_modules' --exclude='*.min.js' -e 'fo+' -- '/a' '/b c' "
                   "2>/dev/null");
}

TEST(SearchCommand, FileNames) {
    SearchOptions opts;
    opts.content = false;
    opts.case_sensitive = true;
    opts.includes = {"*.cpp", "*.h"};
    opts.excludes = {"build"};
    auto cmd = RemoteSearchEngine::build_command({"~/src"}, "main", opts, 0);
    EXPECT_EQ(cmd, "echo __SSHLITE_PID__$$; find \"$HOME\"'/src' -type f -name '*main*' "
                   "\\( -name '*.cpp' -o -name '*.h' \\) ! -path '*/build/*' ! -name 'build' "
                   "2>/dev/null");
}

TEST(SearchCommand, HomeRootAndQuotedPattern) {
    SearchOptions opts;
    opts.content = false;
    auto cmd = RemoteSearchEngine::build_command({"~"}, "it's", opts, 10);
    EXPECT_NE(cmd.find("find \"$HOME\" -type f -iname '*it'\\''s*'"), std::string::npos) << cmd;
    EXPECT_NE(cmd.find("| head -n 10"), std::string::npos);
}

TEST(SearchCommand, HostileRootStaysQuoted) {
    SearchOptions opts;
    auto cmd = RemoteSearchEngine::build_command({"/tmp/$(reboot)"}, "x", opts, 0);
    EXPECT_NE(cmd.find("-- '/tmp/$(reboot)'"), std::string::npos) << cmd;
}

// ── Output parsing ─────────────────────────────────────────

TEST(SearchParse, ContentLine) {
    auto m = RemoteSearchEngine::parse_content_line("/srv/app/main.cpp\0"s + "42:  // TODO: fix");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->path, "/srv/app/main.cpp");
    EXPECT_EQ(m->line, 42);
    EXPECT_EQ(m->text, "// TODO: fix");
}

TEST(SearchParse, ColonsInPathAndText) {
    auto m = RemoteSearchEngine::parse_content_line("/srv/a:b.txt\0"s + "7:key: value");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->path, "/srv/a:b.txt");
    EXPECT_EQ(m->line, 7);
    EXPECT_EQ(m->text, "key: value");
}

TEST(SearchParse, RejectsLinesWithoutSeparator) {
    EXPECT_FALSE(RemoteSearchEngine::parse_content_line("Binary file matches").has_value());
    EXPECT_FALSE(RemoteSearchEngine::parse_content_line("\0"s + "3:x").has_value());
}

// ── Search against a session ───────────────────────────────

class SearchEngineTest : public SessionFixture {
protected:
    RemoteSearchEngine engine{config};
};

TEST_F(SearchEngineTest, ResultsSortedAndEnriched) {
    remote->put_dir("/srv");
    remote->put_file("/srv/a.txt", "alpha one\n\n\nalpha two\n");
    remote->put_file("/srv/b.txt", "beta\n");
    remote->respond("grep -rnH", MockHost::ok_output(
        "__SSHLITE_PID__4242\n"s +
        "/srv/b.txt\0"s + "7:beta\n" +
        "/srv/a.txt\0"s + "12:alpha two\n" +
        "/srv/a.txt\0"s + "3:alpha one\n"));
    auto s = connected();

    int streamed = 0;
    auto r = engine.search(*s, {"/srv"}, "a", SearchOptions{}, nullptr,
                           [&](const SearchMatch&) { streamed++; });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(streamed, 3);
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[0].path, "/srv/a.txt");
    EXPECT_EQ(r.value[0].line, 3);
    EXPECT_EQ(r.value[1].line, 12);
    EXPECT_EQ(r.value[2].path, "/srv/b.txt");

    ASSERT_TRUE(r.value[2].file.has_value());
    EXPECT_EQ(r.value[2].file->size, 5u);
    EXPECT_EQ(r.value[2].file->permissions, "rw-r--r--");
}

TEST_F(SearchEngineTest, MissingFileStaysUnenriched) {
    remote->respond("grep -rnH", MockHost::ok_output("/gone.txt\0"s + "1:x\n"));
    auto s = connected();
    auto r = engine.search(*s, {"/"}, "x", SearchOptions{});
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_FALSE(r.value[0].file.has_value());
}

TEST_F(SearchEngineTest, FileNameSearch) {
    remote->respond("find ", MockHost::ok_output("/srv/notes/main.cpp\n/srv/a/main.h\n"));
    auto s = connected();

    SearchOptions opts;
    opts.content = false;
    auto r = engine.search(*s, {"/srv"}, "main", opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].path, "/srv/a/main.h");
    EXPECT_EQ(r.value[0].line, 0);
    EXPECT_TRUE(r.value[0].text.empty());
    EXPECT_EQ(r.value[1].path, "/srv/notes/main.cpp");
}

TEST_F(SearchEngineTest, ConfiguredCapApplies) {
    config.search_max_results = 50;
    auto s = connected();
    ASSERT_TRUE(engine.search(*s, {"/srv"}, "x", SearchOptions{}).is_ok());
    EXPECT_TRUE(remote->ran("| head -n 50"));

    SearchOptions unlimited;
    unlimited.max_results = 0;
    ASSERT_TRUE(engine.search(*s, {"/opt"}, "x", unlimited).is_ok());
    for (const auto& c : remote->commands()) {
        if (c.find("'/opt'") != std::string::npos) EXPECT_EQ(c.find("head"), std::string::npos);
    }
}

TEST_F(SearchEngineTest, CancelKeepsPartialResultsAndKillsRemote) {
    auto feed = remote->stream("grep -rnH");
    auto s = connected();

    CancelToken cancel;
    feed->push("__SSHLITE_PID__4242\n"s + "/srv/a.txt\0"s + "1:first\n");
    auto r = engine.search(*s, {"/srv"}, "first", SearchOptions{}, &cancel,
                           [&](const SearchMatch&) { cancel.cancel(); });

    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].text, "first");

    auto sigs = remote->signals();
    ASSERT_EQ(sigs.size(), 1u);
    EXPECT_EQ(sigs[0], "TERM");
    EXPECT_TRUE(remote->ran("kill -TERM -- -4242"));
}

TEST_F(SearchEngineTest, CancelledBeforeStartRunsNothing) {
    auto s = connected();
    CancelToken cancel;
    cancel.cancel();
    auto r = engine.search(*s, {"/srv"}, "x", SearchOptions{}, &cancel);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
    EXPECT_FALSE(remote->ran("grep"));
}

TEST_F(SearchEngineTest, InvalidArguments) {
    auto s = connected();
    EXPECT_EQ(engine.search(*s, {}, "x", SearchOptions{}).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(engine.search(*s, {"/srv"}, "", SearchOptions{}).kind, ErrorKind::InvalidArgument);
}

TEST_F(SearchEngineTest, BrokenChannelFails) {
    MockReply broken;
    broken.fail = true;
    remote->respond("grep -rnH", broken);
    auto s = connected();
    auto r = engine.search(*s, {"/srv"}, "x", SearchOptions{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connection);
}

TEST_F(SearchEngineTest, NotConnected) {
    auto s = make_session();
    auto r = engine.search(*s, {"/srv"}, "x", SearchOptions{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotConnected);
}
