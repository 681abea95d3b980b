#include <gtest/gtest.h>
#include <ssh/host_verifier.hpp>
#include <core/store.hpp>
#include <thread>
#include "support/scripted_prompter.hpp"

namespace {

PresentedHostKey key(const std::string& fp) {
    return PresentedHostKey{"example.com", 22, "ssh-ed25519", fp};
}

// Never answers in time
class SlowPrompter : public ScriptedPrompter {
public:
    HostKeyDecision confirm_host_key(const HostKeyPrompt&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return HostKeyDecision::Accept;
    }
};

} // namespace

TEST(HostIdentityVerifier, FirstSightAcceptStoresKey) {
    MemoryStore store;
    ScriptedPrompter prompter;
    HostIdentityVerifier v(store, prompter);

    auto r = v.verify(key("SHA256:aaa"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(v.trusted("example.com", 22).value_or(""), "SHA256:aaa");

    ASSERT_EQ(prompter.host_prompt_count(), 1u);
    EXPECT_FALSE(prompter.host_prompts[0].stored.has_value());
    EXPECT_EQ(prompter.host_prompts[0].presented, "SHA256:aaa");
}

TEST(HostIdentityVerifier, FirstSightReject) {
    MemoryStore store;
    ScriptedPrompter prompter;
    prompter.host_key_answer = HostKeyDecision::Reject;
    HostIdentityVerifier v(store, prompter);

    auto r = v.verify(key("SHA256:aaa"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::HostVerification);
    EXPECT_FALSE(v.trusted("example.com", 22).has_value());
}

TEST(HostIdentityVerifier, KnownKeyNeedsNoPrompt) {
    MemoryStore store;
    ScriptedPrompter prompter;
    HostIdentityVerifier v(store, prompter);
    ASSERT_TRUE(store.set("example.com:22", "SHA256:aaa").is_ok());

    EXPECT_TRUE(v.verify(key("SHA256:aaa")).is_ok());
    EXPECT_EQ(prompter.host_prompt_count(), 0u);
}

TEST(HostIdentityVerifier, PortsAreDistinct) {
    MemoryStore store;
    ScriptedPrompter prompter;
    HostIdentityVerifier v(store, prompter);
    ASSERT_TRUE(store.set("example.com:22", "SHA256:aaa").is_ok());

    EXPECT_TRUE(v.verify(PresentedHostKey{"example.com", 2222, "ssh-ed25519", "SHA256:bbb"}).is_ok());
    EXPECT_EQ(prompter.host_prompt_count(), 1u);
    EXPECT_EQ(v.trusted("example.com", 22).value_or(""), "SHA256:aaa");
}

TEST(HostIdentityVerifier, ChangedKeyNeedsExplicitReplacement) {
    MemoryStore store;
    ScriptedPrompter prompter;
    HostIdentityVerifier v(store, prompter);
    ASSERT_TRUE(store.set("example.com:22", "SHA256:old").is_ok());

    // A plain accept is not enough for a changed key
    auto r = v.verify(key("SHA256:new"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::HostVerification);
    EXPECT_NE(r.error.find("SHA256:old"), std::string::npos);
    EXPECT_NE(r.error.find("SHA256:new"), std::string::npos);
    ASSERT_EQ(prompter.host_prompt_count(), 1u);
    EXPECT_EQ(prompter.host_prompts[0].stored.value_or(""), "SHA256:old");
    EXPECT_EQ(v.trusted("example.com", 22).value_or(""), "SHA256:old");
}

TEST(HostIdentityVerifier, RejectedReplacementIsRemembered) {
    MemoryStore store;
    ScriptedPrompter prompter;
    prompter.host_key_answer = HostKeyDecision::Reject;
    HostIdentityVerifier v(store, prompter);
    ASSERT_TRUE(store.set("example.com:22", "SHA256:old").is_ok());

    EXPECT_TRUE(v.verify(key("SHA256:new")).is_err());
    EXPECT_TRUE(v.verify(key("SHA256:new")).is_err());
    EXPECT_EQ(prompter.host_prompt_count(), 1u);

    // The original key still works
    EXPECT_TRUE(v.verify(key("SHA256:old")).is_ok());
}

TEST(HostIdentityVerifier, AcceptNewKeyReplaces) {
    MemoryStore store;
    ScriptedPrompter prompter;
    prompter.host_key_answer = HostKeyDecision::AcceptNewKey;
    HostIdentityVerifier v(store, prompter);
    ASSERT_TRUE(store.set("example.com:22", "SHA256:old").is_ok());

    ASSERT_TRUE(v.verify(key("SHA256:new")).is_ok());
    EXPECT_EQ(v.trusted("example.com", 22).value_or(""), "SHA256:new");
    EXPECT_FALSE(store.get("rejected:example.com:22").has_value());
}

TEST(HostIdentityVerifier, ForgetClearsTrustAndRejection) {
    MemoryStore store;
    ScriptedPrompter prompter;
    prompter.host_key_answer = HostKeyDecision::Reject;
    HostIdentityVerifier v(store, prompter);
    ASSERT_TRUE(store.set("example.com:22", "SHA256:old").is_ok());
    EXPECT_TRUE(v.verify(key("SHA256:new")).is_err());

    ASSERT_TRUE(v.forget("example.com", 22).is_ok());
    EXPECT_FALSE(v.trusted("example.com", 22).has_value());
    EXPECT_FALSE(store.get("rejected:example.com:22").has_value());

    prompter.host_key_answer = HostKeyDecision::Accept;
    EXPECT_TRUE(v.verify(key("SHA256:new")).is_ok());
}

TEST(HostIdentityVerifier, UnansweredPromptTimesOut) {
    MemoryStore store;
    static SlowPrompter prompter;  // the detached prompt thread outlives the test body
    HostIdentityVerifier v(store, prompter, 20);

    auto r = v.verify(key("SHA256:aaa"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::HostVerification);
    EXPECT_NE(r.error.find("timed out"), std::string::npos);
    EXPECT_FALSE(v.trusted("example.com", 22).has_value());
}

TEST(HostIdentityVerifier, CheckAdapter) {
    MemoryStore store;
    ScriptedPrompter prompter;
    HostIdentityVerifier v(store, prompter);
    auto check = v.as_check();
    EXPECT_TRUE(check(key("SHA256:aaa")).is_ok());
    EXPECT_TRUE(v.trusted("example.com", 22).has_value());
}
