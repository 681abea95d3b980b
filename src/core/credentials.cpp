#include "credentials.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <random>

CredentialManager::CredentialManager(KeyValueStore& secrets, KeyValueStore& index)
    : secrets_(secrets), index_(index) {}

std::string CredentialManager::secret_key(const std::string& identity, const std::string& id) {
    return fmt::format("sshlite:{}:{}", identity, id);
}

std::string CredentialManager::default_id(const std::string& slot) {
    return "default_" + slot;
}

std::string CredentialManager::new_id() {
    static std::mt19937 rng(std::random_device{}());
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<int> dist(0, 35);
    std::string suffix;
    for (int i = 0; i < 6; i++) suffix += alphabet[dist(rng)];
    return fmt::format("cred_{}_{}", now_ms(), suffix);
}

// ── Index ──────────────────────────────────────────────────

std::vector<Credential> CredentialManager::load_index(const std::string& identity) {
    std::vector<Credential> out;
    auto raw = index_.get(identity);
    if (!raw) return out;

    try {
        YAML::Node root = YAML::Load(*raw);
        if (!root.IsSequence()) return out;
        for (const auto& n : root) {
            Credential c;
            c.id = n["id"].as<std::string>("");
            c.label = n["label"].as<std::string>("");
            c.kind = n["type"].as<std::string>("password") == "privateKey"
                         ? CredentialKind::PrivateKey : CredentialKind::Password;
            if (n["key_path"]) c.key_path = n["key_path"].as<std::string>();
            if (!c.id.empty()) out.push_back(c);
        }
    } catch (const YAML::Exception& e) {
        sshlite_log(fmt::format("Credentials: bad index for {}: {}", identity, e.what()));
    }
    return out;
}

Result<void> CredentialManager::save_index(const std::string& identity,
                                           const std::vector<Credential>& creds) {
    if (creds.empty()) return index_.remove(identity);

    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& c : creds) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << c.id;
        out << YAML::Key << "label" << YAML::Value << c.label;
        out << YAML::Key << "type" << YAML::Value << credential_kind_name(c.kind);
        if (c.key_path) out << YAML::Key << "key_path" << YAML::Value << *c.key_path;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    return index_.set(identity, out.c_str());
}

std::vector<Credential> CredentialManager::list(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_index(identity);
}

std::optional<Credential> CredentialManager::find(const std::string& identity,
                                                  const std::string& id) {
    for (const auto& c : list(identity)) {
        if (c.id == id) return c;
    }
    return std::nullopt;
}

Result<Credential> CredentialManager::add(const std::string& identity, const std::string& label,
                                          CredentialKind kind, const std::string& secret,
                                          const std::optional<std::string>& key_path) {
    if (kind == CredentialKind::PrivateKey && !key_path) {
        return Result<Credential>::Err("A private-key credential needs a key path",
                                       ErrorKind::InvalidArgument);
    }

    Credential c;
    c.id = new_id();
    c.label = label;
    c.kind = kind;
    c.key_path = key_path;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto creds = load_index(identity);
        creds.push_back(c);
        auto saved = save_index(identity, creds);
        if (saved.is_err()) return propagate<Credential>(saved, "Failed to save credential index");
    }

    if (!secret.empty()) {
        auto r = store_secret(identity, c.id, secret);
        if (r.is_err()) return propagate<Credential>(r);
    }
    return Result<Credential>::Ok(c);
}

Result<void> CredentialManager::remove(const std::string& identity, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto creds = load_index(identity);
    auto before = creds.size();
    creds.erase(std::remove_if(creds.begin(), creds.end(),
                               [&](const Credential& c) { return c.id == id; }),
                creds.end());
    if (creds.size() == before) {
        return Result<void>::Err("Credential not found", ErrorKind::InvalidArgument);
    }
    session_.remove(secret_key(identity, id));
    auto r = secrets_.remove(secret_key(identity, id));
    if (r.is_err()) return r;
    return save_index(identity, creds);
}

// ── Secrets ────────────────────────────────────────────────

std::optional<std::string> CredentialManager::secret(const std::string& identity,
                                                     const std::string& id) {
    auto key = secret_key(identity, id);
    if (auto v = session_.get(key)) return v;
    return secrets_.get(key);
}

void CredentialManager::set_session_secret(const std::string& identity, const std::string& id,
                                           const std::string& value) {
    session_.set(secret_key(identity, id), value);
}

Result<void> CredentialManager::store_secret(const std::string& identity, const std::string& id,
                                             const std::string& value) {
    session_.remove(secret_key(identity, id));
    return secrets_.set(secret_key(identity, id), value);
}

void CredentialManager::invalidate_secrets(const std::string& identity) {
    std::string prefix = secret_key(identity, "");
    int dropped = 0;
    for (KeyValueStore* store : {static_cast<KeyValueStore*>(&session_), &secrets_}) {
        for (const auto& key : store->keys()) {
            if (key.compare(0, prefix.size(), prefix) != 0) continue;
            auto r = store->remove(key);
            if (r.is_err()) {
                sshlite_log(fmt::format("Credentials: failed to drop {}: {}", key, r.error));
            } else {
                dropped++;
            }
        }
    }
    sshlite_log(fmt::format("Credentials: invalidated {} secret(s) for {}", dropped, identity));
}

std::optional<std::string> CredentialManager::get_or_prompt(const std::string& identity,
                                                            const std::string& slot,
                                                            const std::string& message,
                                                            Prompter& prompter,
                                                            bool* prompted) {
    if (prompted) *prompted = false;
    if (auto stored = secret(identity, default_id(slot))) return stored;

    auto entered = prompter.prompt_secret(message);
    if (!entered || entered->empty()) return std::nullopt;
    if (prompted) *prompted = true;
    return entered;
}

Result<void> CredentialManager::store_default(const std::string& identity,
                                              const std::string& slot,
                                              const std::string& value) {
    std::string id = default_id(slot);
    if (slot == "password") {
        std::lock_guard<std::mutex> lock(mutex_);
        auto creds = load_index(identity);
        bool listed = std::any_of(creds.begin(), creds.end(),
                                  [&](const Credential& c) { return c.id == id; });
        if (!listed) {
            Credential c;
            c.id = id;
            c.label = "Default";
            c.kind = CredentialKind::Password;
            creds.push_back(c);
            auto r = save_index(identity, creds);
            if (r.is_err()) return r;
        }
    }
    return store_secret(identity, id, value);
}
