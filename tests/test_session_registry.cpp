#include <gtest/gtest.h>
#include <managers/session_registry.hpp>
#include "support/session_fixture.hpp"
#include "support/manual_scheduler.hpp"

using namespace std::chrono_literals;

class SessionRegistryTest : public SessionFixture {
protected:
    void SetUp() override {
        config.reconnect_interval_ms = 1000;
        registry.reconnect_events().subscribe(reconnects.handler());
    }

    ManualScheduler scheduler;
    Recorder<ReconnectEvent> reconnects;
    SessionRegistry registry{
        [this](const HostConfig& h, const std::optional<Credential>& c) {
            return std::make_shared<Session>(h, c, deps());
        },
        creds, prompter, scheduler, config};

    std::shared_ptr<Session> connect_host() {
        auto r = registry.connect(host);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};

TEST_F(SessionRegistryTest, ConnectReusesLiveSession) {
    auto first = connect_host();
    auto second = connect_host();
    EXPECT_EQ(first, second);
    EXPECT_EQ(remote->open_count(), 1);
    EXPECT_EQ(registry.get(host.identity_key()), first);
    EXPECT_EQ(registry.sessions().size(), 1u);
}

TEST_F(SessionRegistryTest, ForwardsSessionStateEvents) {
    Recorder<SessionStateEvent> states;
    registry.state_changed().subscribe(states.handler());
    connect_host();

    auto seen = states.snapshot();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].state, ConnectionState::Connecting);
    EXPECT_EQ(seen[1].state, ConnectionState::Connected);
}

TEST_F(SessionRegistryTest, DropAnnouncesThenReconnects) {
    auto first = connect_host();
    remote->drop();

    auto seen = reconnects.snapshot();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].identity, host.identity_key());
    EXPECT_EQ(seen[0].attempt, 0);
    EXPECT_TRUE(seen[0].is_reconnecting);
    EXPECT_TRUE(registry.is_reconnecting(host.identity_key()));
    EXPECT_EQ(scheduler.pending(), 1u);

    // Nothing happens before the interval has passed
    scheduler.advance(999ms);
    EXPECT_EQ(remote->open_count(), 1);

    scheduler.advance(1ms);
    seen = reconnects.snapshot();
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[1].attempt, 1);
    EXPECT_TRUE(seen[1].is_reconnecting);
    EXPECT_EQ(seen[2].attempt, 1);
    EXPECT_FALSE(seen[2].is_reconnecting);
    EXPECT_TRUE(seen[2].error.empty());

    auto current = registry.get(host.identity_key());
    ASSERT_NE(current, nullptr);
    EXPECT_NE(current, first);
    EXPECT_TRUE(current->is_connected());
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(SessionRegistryTest, FailedAttemptsAreRetried) {
    connect_host();
    remote->drop();
    remote->fail_next_open("Connection refused", ErrorKind::ConnectionRefused);
    remote->fail_next_open("Connection refused", ErrorKind::ConnectionRefused);

    scheduler.advance(1000ms);
    EXPECT_TRUE(registry.is_reconnecting(host.identity_key()));
    EXPECT_EQ(registry.get(host.identity_key()), nullptr);
    auto status = registry.reconnecting();
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].attempt, 1);

    scheduler.advance(1000ms);
    EXPECT_TRUE(registry.is_reconnecting(host.identity_key()));

    scheduler.advance(1000ms);
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));
    ASSERT_NE(registry.get(host.identity_key()), nullptr);

    auto seen = reconnects.snapshot();
    ASSERT_EQ(seen.size(), 5u);
    for (int i = 0; i < 4; i++) {
        EXPECT_EQ(seen[i].attempt, i);
        EXPECT_TRUE(seen[i].is_reconnecting);
    }
    EXPECT_EQ(seen[4].attempt, 3);
    EXPECT_FALSE(seen[4].is_reconnecting);
}

TEST_F(SessionRegistryTest, AuthenticationFailureEndsReconnect) {
    connect_host();
    remote->drop();
    remote->fail_next_open("Permission denied", ErrorKind::Authentication);

    scheduler.advance(1000ms);

    auto seen = reconnects.snapshot();
    ASSERT_FALSE(seen.empty());
    EXPECT_FALSE(seen.back().is_reconnecting);
    EXPECT_EQ(seen.back().kind, ErrorKind::Authentication);
    EXPECT_EQ(seen.back().error, "Permission denied");
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_EQ(registry.get(host.identity_key()), nullptr);
}

TEST_F(SessionRegistryTest, HostKeyChangeEndsReconnect) {
    connect_host();
    remote->drop();
    remote->set_fingerprint("SHA256:someoneelse");
    prompter.host_key_answer = HostKeyDecision::Accept;

    scheduler.advance(1000ms);

    auto seen = reconnects.snapshot();
    ASSERT_FALSE(seen.empty());
    EXPECT_FALSE(seen.back().is_reconnecting);
    EXPECT_EQ(seen.back().kind, ErrorKind::HostVerification);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(SessionRegistryTest, AttemptCapGivesUp) {
    config.reconnect_max_attempts = 2;
    connect_host();
    remote->drop();
    remote->fail_next_open("Connection refused", ErrorKind::ConnectionRefused);
    remote->fail_next_open("Connection refused", ErrorKind::ConnectionRefused);

    scheduler.advance(1000ms);
    EXPECT_TRUE(registry.is_reconnecting(host.identity_key()));
    scheduler.advance(1000ms);
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));

    auto seen = reconnects.snapshot();
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back().attempt, 2);
    EXPECT_FALSE(seen.back().is_reconnecting);
    EXPECT_EQ(seen.back().kind, ErrorKind::ConnectionRefused);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(SessionRegistryTest, ManualDisconnectDoesNotReconnect) {
    auto s = connect_host();
    registry.disconnect(host.identity_key());

    EXPECT_FALSE(s->is_connected());
    EXPECT_TRUE(reconnects.snapshot().empty());
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));
    EXPECT_EQ(registry.get(host.identity_key()), nullptr);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(SessionRegistryTest, DisconnectCancelsPendingReconnect) {
    connect_host();
    remote->drop();
    ASSERT_TRUE(registry.is_reconnecting(host.identity_key()));

    registry.disconnect(host.identity_key());
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));
    EXPECT_EQ(scheduler.pending(), 0u);

    scheduler.advance(5000ms);
    EXPECT_EQ(remote->open_count(), 1);
    EXPECT_EQ(registry.get(host.identity_key()), nullptr);
}

TEST_F(SessionRegistryTest, ExplicitConnectEndsReconnect) {
    auto first = connect_host();
    remote->drop();

    auto second = connect_host();
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second, first);
    EXPECT_TRUE(second->is_connected());
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));
    EXPECT_EQ(scheduler.pending(), 0u);

    auto seen = reconnects.snapshot();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen[1].is_reconnecting);
}

TEST_F(SessionRegistryTest, ExplicitConnectFailureKeepsRetrying) {
    connect_host();
    remote->drop();
    remote->fail_next_open("Connection timed out", ErrorKind::ConnectionTimeout);

    auto r = registry.connect(host);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConnectionTimeout);
    EXPECT_TRUE(registry.is_reconnecting(host.identity_key()));
    EXPECT_EQ(scheduler.pending(), 1u);

    scheduler.advance(1000ms);
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));
    EXPECT_NE(registry.get(host.identity_key()), nullptr);
}

TEST_F(SessionRegistryTest, ReconnectAsksWhichCredential) {
    auto a = creds.add(host.identity_key(), "deploy", CredentialKind::Password, "one", std::nullopt);
    auto b = creds.add(host.identity_key(), "admin", CredentialKind::Password, "two", std::nullopt);
    ASSERT_TRUE(a.is_ok() && b.is_ok());
    auto listed = creds.list(host.identity_key());
    ASSERT_EQ(listed.size(), 2u);
    prompter.credential_choice = 1;

    connect_host();
    remote->drop();
    scheduler.advance(1000ms);

    auto offers = remote->offers();
    ASSERT_EQ(offers.size(), 2u);
    ASSERT_TRUE(offers[1].credential_id.has_value());
    EXPECT_EQ(*offers[1].credential_id, listed[1].id);
    auto current = registry.get(host.identity_key());
    ASSERT_NE(current, nullptr);
    ASSERT_TRUE(current->credential().has_value());
    EXPECT_EQ(current->credential()->label, listed[1].label);
    EXPECT_EQ(prompter.choose_prompts, 1);
}

TEST_F(SessionRegistryTest, ReconnectKeepsSessionCredential) {
    auto cred = creds.add(host.identity_key(), "deploy", CredentialKind::Password, "pw", std::nullopt);
    ASSERT_TRUE(cred.is_ok());
    auto r = registry.connect(host, cred.value);
    ASSERT_TRUE(r.is_ok()) << r.error;

    remote->drop();
    scheduler.advance(1000ms);

    auto offers = remote->offers();
    ASSERT_EQ(offers.size(), 2u);
    EXPECT_EQ(offers[1].credential_id, std::optional<std::string>(cred.value.id));
    EXPECT_EQ(prompter.choose_prompts, 0);
}

TEST_F(SessionRegistryTest, ShutdownDisconnectsAndRefuses) {
    auto s = connect_host();
    registry.shutdown();

    EXPECT_FALSE(s->is_connected());
    EXPECT_TRUE(registry.sessions().empty());
    EXPECT_TRUE(reconnects.snapshot().empty());

    auto r = registry.connect(host);
    EXPECT_TRUE(r.is_err());
}

TEST_F(SessionRegistryTest, ShutdownCancelsReconnect) {
    connect_host();
    remote->drop();
    ASSERT_EQ(scheduler.pending(), 1u);

    registry.shutdown();
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_FALSE(registry.is_reconnecting(host.identity_key()));
}
