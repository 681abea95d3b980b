#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include "types.hpp"
#include "store.hpp"
#include "prompter.hpp"

// Per-host credential bookkeeping.
//
// The labelled index (id, label, kind, key path) lives in `index`, one YAML
// document per host identity.  Secrets live in `secrets` under
// "sshlite:<identity>:<credential id>".  A session-only overlay is consulted
// before the persistent store and is never written to disk.
class CredentialManager {
public:
    CredentialManager(KeyValueStore& secrets, KeyValueStore& index);

    std::vector<Credential> list(const std::string& identity);
    std::optional<Credential> find(const std::string& identity, const std::string& id);

    // Add a labelled credential; the secret is stored when non-empty.
    Result<Credential> add(const std::string& identity, const std::string& label,
                           CredentialKind kind, const std::string& secret,
                           const std::optional<std::string>& key_path = std::nullopt);

    Result<void> remove(const std::string& identity, const std::string& id);

    // Session overlay first, then the persistent store
    std::optional<std::string> secret(const std::string& identity, const std::string& id);

    void set_session_secret(const std::string& identity, const std::string& id,
                            const std::string& value);
    Result<void> store_secret(const std::string& identity, const std::string& id,
                              const std::string& value);

    // Drop every stored and session secret for a host; labels stay.
    void invalidate_secrets(const std::string& identity);

    // Stored "default" secret of the given slot (password, passphrase), else
    // prompt.  A prompted value is returned but not saved: call
    // store_default once it has been shown to work.
    std::optional<std::string> get_or_prompt(const std::string& identity,
                                             const std::string& slot,
                                             const std::string& message,
                                             Prompter& prompter,
                                             bool* prompted = nullptr);

    Result<void> store_default(const std::string& identity, const std::string& slot,
                               const std::string& value);

    static std::string secret_key(const std::string& identity, const std::string& id);
    static std::string default_id(const std::string& slot);

private:
    KeyValueStore& secrets_;
    KeyValueStore& index_;
    MemoryStore session_;
    std::mutex mutex_;

    std::vector<Credential> load_index(const std::string& identity);
    Result<void> save_index(const std::string& identity, const std::vector<Credential>& creds);
    static std::string new_id();
};
