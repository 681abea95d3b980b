#include <gtest/gtest.h>
#include <core/config.hpp>
#include <fstream>
#include "support/temp_dir.hpp"

TEST(Config, EmptyTextGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value.core();
    EXPECT_EQ(c.connect_timeout_ms, CONNECT_TIMEOUT_MS);
    EXPECT_EQ(c.reconnect_interval_ms, RECONNECT_INTERVAL_MS);
    EXPECT_EQ(c.reconnect_max_attempts, 0);
    EXPECT_EQ(c.default_remote_path, "~");
    EXPECT_EQ(c.search_max_results, SEARCH_MAX_RESULTS);
    EXPECT_TRUE(r.value.hosts().empty());
}

TEST(Config, ReadsEverySection) {
    auto r = Config::parse(R"(
connection:
  connect_timeout_ms: 5000
  keepalive_interval_ms: 10000
  reconnect_interval_ms: 1500
  reconnect_max_attempts: 4
  host_verify_timeout_ms: 30000
default_remote_path: /srv
search:
  max_results: 50
  max_stat: 5
write_timeout_ms: 2000
watch_probe_wait_ms: 750
hosts:
  - name: build
    host: build.example.com
    port: 2222
    user: deploy
    key: ~/.ssh/build_key
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value.core();
    EXPECT_EQ(c.connect_timeout_ms, 5000);
    EXPECT_EQ(c.keepalive_interval_ms, 10000);
    EXPECT_EQ(c.reconnect_interval_ms, 1500);
    EXPECT_EQ(c.reconnect_max_attempts, 4);
    EXPECT_EQ(c.host_verify_timeout_ms, 30000);
    EXPECT_EQ(c.default_remote_path, "/srv");
    EXPECT_EQ(c.search_max_results, 50);
    EXPECT_EQ(c.search_max_stat, 5);
    EXPECT_EQ(c.write_timeout_ms, 2000);
    EXPECT_EQ(c.watch_probe_wait_ms, 750);

    auto build = r.value.find_host("build");
    ASSERT_TRUE(build.has_value());
    EXPECT_EQ(build->address, "build.example.com");
    EXPECT_EQ(build->port, 2222);
    EXPECT_EQ(build->username, "deploy");
    ASSERT_TRUE(build->key_path.has_value());
    EXPECT_EQ(*build->key_path, "~/.ssh/build_key");
    EXPECT_EQ(build->identity_key(), "build.example.com:2222:deploy");
    EXPECT_FALSE(r.value.find_host("missing").has_value());
}

TEST(Config, RootMustBeMapping) {
    auto r = Config::parse("- a\n- b\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

TEST(Config, HostWithoutAddressRejected) {
    auto r = Config::parse("hosts:\n  - name: nowhere\n    user: x\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("nowhere"), std::string::npos);
}

TEST(Config, NonPositiveTimeoutRejected) {
    EXPECT_TRUE(Config::parse("connection:\n  reconnect_interval_ms: 0\n").is_err());
    EXPECT_TRUE(Config::parse("connection:\n  reconnect_max_attempts: -1\n").is_err());
    EXPECT_TRUE(Config::parse("write_timeout_ms: -5\n").is_err());
}

TEST(Config, MalformedYaml) {
    auto r = Config::parse("connection: [unclosed");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

TEST(Config, LoadFromFile) {
    TempDir dir;
    {
        std::ofstream out(dir / "config.yaml");
        out << "default_remote_path: /data\n";
    }
    auto r = Config::load(dir / "config.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.core().default_remote_path, "/data");

    auto missing = Config::load(dir / "nope.yaml");
    EXPECT_TRUE(missing.is_err());
}

TEST(HostSpec, UserHostPort) {
    auto r = parse_host_spec("alice@example.com:2200");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.username, "alice");
    EXPECT_EQ(r.value.address, "example.com");
    EXPECT_EQ(r.value.port, 2200);
    EXPECT_EQ(r.value.display(), "alice@example.com:2200");
}

TEST(HostSpec, DefaultPort) {
    auto r = parse_host_spec("bob@10.0.0.5");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.port, 22);
    EXPECT_EQ(r.value.display(), "bob@10.0.0.5");
}

TEST(HostSpec, BadPort) {
    EXPECT_TRUE(parse_host_spec("bob@host:0").is_err());
    EXPECT_TRUE(parse_host_spec("bob@host:99999").is_err());
    EXPECT_TRUE(parse_host_spec("bob@host:ssh").is_err());
    EXPECT_TRUE(parse_host_spec("bob@host:22x").is_err());
}

TEST(HostSpec, MissingAddress) {
    EXPECT_TRUE(parse_host_spec("bob@").is_err());
}
