#include <gtest/gtest.h>
#include <ssh/shell_escape.hpp>

TEST(ShellQuote, PlainWord) {
    EXPECT_EQ(shell_quote("notes.txt"), "'notes.txt'");
}

TEST(ShellQuote, Empty) {
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(ShellQuote, EmbeddedSingleQuote) {
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(ShellQuote, MetacharactersStayLiteral) {
    // Inside single quotes none of these are special
    EXPECT_EQ(shell_quote("a b;$(rm -rf /)`x`|&"), "'a b;$(rm -rf /)`x`|&'");
}

TEST(ShellQuote, InjectionAttemptIsOneWord) {
    EXPECT_EQ(shell_quote("'; rm -rf / #"), "''\\''; rm -rf / #'");
}

TEST(RemoteCommand, LiteralAndArgs) {
    auto cmd = RemoteCommand("tail").literal("-n 20").arg("/var/log/my app.log");
    EXPECT_EQ(cmd.str(), "tail -n 20 '/var/log/my app.log'");
}

TEST(RemoteCommand, ArgsList) {
    auto cmd = RemoteCommand("ls").args({"a", "b c"});
    EXPECT_EQ(cmd.str(), "ls 'a' 'b c'");
}

TEST(RemoteCommand, OptionQuotesValue) {
    auto cmd = RemoteCommand("grep").option("--include", "*.cpp");
    EXPECT_EQ(cmd.str(), "grep --include='*.cpp'");
}

TEST(RemoteCommand, PipeAndQuiet) {
    auto cmd = RemoteCommand("find").arg("/srv").quiet().pipe(RemoteCommand("head").literal("-n 5"));
    EXPECT_EQ(cmd.str(), "find '/srv' 2>/dev/null | head -n 5");
}

TEST(IsDecimal, Values) {
    EXPECT_TRUE(is_decimal("4242"));
    EXPECT_FALSE(is_decimal(""));
    EXPECT_FALSE(is_decimal("12a"));
    EXPECT_FALSE(is_decimal("-1"));
    EXPECT_FALSE(is_decimal("1; reboot"));
}
