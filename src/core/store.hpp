#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// String key/value persistence handed to the core by the driver.  Used for
// the host trust store, the credential index and secrets.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual Result<void> set(const std::string& key, const std::string& value) = 0;
    virtual Result<void> remove(const std::string& key) = 0;
    virtual std::vector<std::string> keys() = 0;
};

// Process-lifetime store (session overlay, tests).
class MemoryStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    Result<void> set(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    std::vector<std::string> keys() override;

private:
    std::mutex mutex_;
    std::map<std::string, std::string> data_;
};

// Flat YAML mapping persisted to a file; rewritten on every change.
class YamlFileStore : public KeyValueStore {
public:
    explicit YamlFileStore(fs::path path);

    std::optional<std::string> get(const std::string& key) override;
    Result<void> set(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    std::vector<std::string> keys() override;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::mutex mutex_;

    std::map<std::string, std::string> load();
    Result<void> save(const std::map<std::string, std::string>& data);
};

// key=value lines in a file restricted to the owner (chmod 600).
class SecretFileStore : public KeyValueStore {
public:
    explicit SecretFileStore(fs::path path);

    std::optional<std::string> get(const std::string& key) override;
    Result<void> set(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    std::vector<std::string> keys() override;

private:
    fs::path path_;
    std::mutex mutex_;

    std::map<std::string, std::string> read_all();
    bool write_all(const std::map<std::string, std::string>& m);
};
