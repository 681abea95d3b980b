#include <gtest/gtest.h>
#include <core/credentials.hpp>
#include <core/store.hpp>
#include "support/scripted_prompter.hpp"

namespace {

struct CredentialsTest : ::testing::Test {
    MemoryStore secrets;
    MemoryStore index;
    CredentialManager creds{secrets, index};
    const std::string host = "example.com:22:alice";
};

} // namespace

TEST_F(CredentialsTest, AddListRemove) {
    auto a = creds.add(host, "Work laptop", CredentialKind::Password, "hunter2");
    ASSERT_TRUE(a.is_ok()) << a.error;
    auto b = creds.add(host, "Deploy key", CredentialKind::PrivateKey, "", std::string("/keys/deploy"));
    ASSERT_TRUE(b.is_ok()) << b.error;

    auto list = creds.list(host);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].label, "Work laptop");
    EXPECT_EQ(list[1].kind, CredentialKind::PrivateKey);
    EXPECT_EQ(list[1].key_path.value_or(""), "/keys/deploy");
    EXPECT_NE(list[0].id, list[1].id);

    EXPECT_EQ(creds.secret(host, a.value.id).value_or(""), "hunter2");
    EXPECT_FALSE(creds.secret(host, b.value.id).has_value());

    ASSERT_TRUE(creds.remove(host, a.value.id).is_ok());
    EXPECT_EQ(creds.list(host).size(), 1u);
    EXPECT_FALSE(creds.secret(host, a.value.id).has_value());
}

TEST_F(CredentialsTest, PrivateKeyNeedsPath) {
    auto r = creds.add(host, "Key", CredentialKind::PrivateKey, "");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

TEST_F(CredentialsTest, RemoveUnknownFails) {
    EXPECT_TRUE(creds.remove(host, "cred_nope").is_err());
}

TEST_F(CredentialsTest, HostsAreIsolated) {
    ASSERT_TRUE(creds.add(host, "A", CredentialKind::Password, "x").is_ok());
    EXPECT_TRUE(creds.list("other.com:22:alice").empty());
}

TEST_F(CredentialsTest, SessionSecretIsNotPersisted) {
    auto a = creds.add(host, "A", CredentialKind::Password, "");
    ASSERT_TRUE(a.is_ok());
    creds.set_session_secret(host, a.value.id, "temporary");

    EXPECT_EQ(creds.secret(host, a.value.id).value_or(""), "temporary");
    EXPECT_FALSE(secrets.get(CredentialManager::secret_key(host, a.value.id)).has_value());
}

TEST_F(CredentialsTest, InvalidateKeepsLabels) {
    auto a = creds.add(host, "A", CredentialKind::Password, "old");
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(creds.store_default(host, "password", "pw").is_ok());
    ASSERT_TRUE(creds.add("other.com:22:alice", "B", CredentialKind::Password, "keep").is_ok());

    creds.invalidate_secrets(host);

    EXPECT_FALSE(creds.secret(host, a.value.id).has_value());
    EXPECT_FALSE(creds.secret(host, CredentialManager::default_id("password")).has_value());
    EXPECT_EQ(creds.list(host).size(), 2u);  // "A" and "Default"
    auto other = creds.list("other.com:22:alice");
    ASSERT_EQ(other.size(), 1u);
    EXPECT_EQ(creds.secret("other.com:22:alice", other[0].id).value_or(""), "keep");
}

TEST_F(CredentialsTest, StoreDefaultPasswordAddsLabelOnce) {
    ASSERT_TRUE(creds.store_default(host, "password", "one").is_ok());
    ASSERT_TRUE(creds.store_default(host, "password", "two").is_ok());
    auto list = creds.list(host);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].label, "Default");
    EXPECT_EQ(creds.secret(host, list[0].id).value_or(""), "two");
}

TEST_F(CredentialsTest, GetOrPromptPrefersStored) {
    ScriptedPrompter prompter;
    prompter.secrets.push_back(std::string("typed"));

    bool prompted = true;
    ASSERT_TRUE(creds.store_default(host, "password", "saved").is_ok());
    auto v = creds.get_or_prompt(host, "password", "Password?", prompter, &prompted);
    EXPECT_EQ(v.value_or(""), "saved");
    EXPECT_FALSE(prompted);
    EXPECT_EQ(prompter.secret_prompt_count(), 0u);
}

TEST_F(CredentialsTest, GetOrPromptAsksWhenMissing) {
    ScriptedPrompter prompter;
    prompter.secrets.push_back(std::string("typed"));

    bool prompted = false;
    auto v = creds.get_or_prompt(host, "password", "Password?", prompter, &prompted);
    EXPECT_EQ(v.value_or(""), "typed");
    EXPECT_TRUE(prompted);
    // Prompted values are not saved until they have worked
    EXPECT_FALSE(creds.secret(host, CredentialManager::default_id("password")).has_value());
}

TEST_F(CredentialsTest, GetOrPromptCancelled) {
    ScriptedPrompter prompter;
    EXPECT_FALSE(creds.get_or_prompt(host, "password", "Password?", prompter).has_value());
}
