#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <platform/platform.hpp>

TEST(Utils, SafeStoiAcceptsWholeNumbersOnly) {
    EXPECT_EQ(safe_stoi("2200"), 2200);
    EXPECT_EQ(safe_stoi(" 42 "), 42);
    EXPECT_EQ(safe_stoi("-7"), -7);
    EXPECT_EQ(safe_stoi("22x", -1), -1);
    EXPECT_EQ(safe_stoi("", -1), -1);
    EXPECT_EQ(safe_stoi("99999999999", -1), -1);
}

TEST(Utils, FormatPermissions) {
    EXPECT_EQ(format_permissions(0755), "rwxr-xr-x");
    EXPECT_EQ(format_permissions(0100600), "rw-------");
    EXPECT_EQ(format_permissions(0), "---------");
}

TEST(Utils, SplitWhitespace) {
    auto parts = split_ws("  Linux\t x86_64\n");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "Linux");
    EXPECT_EQ(parts[1], "x86_64");
    EXPECT_TRUE(split_ws(" \n").empty());
}

TEST(Utils, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
}

TEST(Utils, ExpandPath) {
    EXPECT_EQ(expand_path("~/.ssh/id_ed25519"),
              platform::home_dir().string() + "/.ssh/id_ed25519");
    EXPECT_EQ(expand_path("~bob/key"), "~bob/key");
    EXPECT_EQ(expand_path("/etc/ssh"), "/etc/ssh");
}

TEST(Utils, Trimmed) {
    EXPECT_EQ(trimmed("  yes\r\n"), "yes");
    EXPECT_EQ(trimmed(" \t "), "");
}
