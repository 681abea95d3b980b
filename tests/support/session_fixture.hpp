#pragma once

#include <gtest/gtest.h>
#include <ssh/session.hpp>
#include <ssh/auth.hpp>
#include <ssh/host_verifier.hpp>
#include <core/store.hpp>
#include <core/credentials.hpp>
#include <condition_variable>
#include "mock_transport.hpp"
#include "scripted_prompter.hpp"

// Everything a Session needs, wired to one MockHost.  Auth offers only the
// agent so no test is ever prompted for a password.
struct SessionFixture : ::testing::Test {
    std::shared_ptr<MockHost> remote = std::make_shared<MockHost>();
    MemoryStore trust;
    MemoryStore secrets;
    MemoryStore index;
    CredentialManager creds{secrets, index};
    ScriptedPrompter prompter;
    AuthResolver auth{creds, prompter, agent_only()};
    HostIdentityVerifier verifier{trust, prompter};
    SshLiteConfig config;
    HostConfig host = make_host();

    static AuthEnvironment agent_only() {
        AuthEnvironment env;
        env.agent_socket = "/tmp/mock-agent.sock";
        return env;
    }

    static HostConfig make_host() {
        HostConfig h;
        h.address = "example.com";
        h.username = "alice";
        return h;
    }

    SessionDeps deps() {
        std::shared_ptr<MockHost> r = remote;
        return SessionDeps{[r] { return std::unique_ptr<Transport>(new MockTransport(r)); },
                           auth, verifier, config};
    }

    std::shared_ptr<Session> make_session(const std::optional<Credential>& cred = std::nullopt) {
        return std::make_shared<Session>(host, cred, deps());
    }

    std::shared_ptr<Session> connected() {
        auto s = make_session();
        auto r = s->connect();
        EXPECT_TRUE(r.is_ok()) << r.error;
        return s;
    }
};

// Thread-safe event recorder with a bounded wait.
template <typename Event>
struct Recorder {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Event> events;

    std::function<void(const Event&)> handler() {
        return [this](const Event& e) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                events.push_back(e);
            }
            cv.notify_all();
        };
    }

    bool wait_for(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return events.size() >= n; });
    }

    std::vector<Event> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};
