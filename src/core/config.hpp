#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Flat option set consumed by the session core.  The core never reads files;
// the driver fills this in (see Config below) and passes it down.
struct SshLiteConfig {
    int connect_timeout_ms = CONNECT_TIMEOUT_MS;
    int keepalive_interval_ms = KEEPALIVE_INTERVAL_MS;
    int reconnect_interval_ms = RECONNECT_INTERVAL_MS;
    int reconnect_max_attempts = 0;                 // 0 = retry forever
    std::string default_remote_path = "~";
    int search_max_results = SEARCH_MAX_RESULTS;
    int search_max_stat = SEARCH_MAX_STAT;
    int write_timeout_ms = WRITE_TIMEOUT_MS;
    int watch_probe_wait_ms = WATCH_PROBE_WAIT_MS;
    int host_verify_timeout_ms = HOST_VERIFY_TIMEOUT_MS;
};

class Config {
public:
    // Load ~/.sshlite/config.yaml (defaults if the file is absent)
    static Result<Config> load_global();

    // Load a specific file; a missing file is an error
    static Result<Config> load(const fs::path& path);

    // Parse YAML text
    static Result<Config> parse(const std::string& yaml_text);

    const SshLiteConfig& core() const { return core_; }
    const std::vector<HostConfig>& hosts() const { return hosts_; }
    const fs::path& trust_store_path() const { return trust_store_path_; }
    const fs::path& credential_index_path() const { return credential_index_path_; }
    const fs::path& secrets_path() const { return secrets_path_; }

    // Named host from the hosts: list
    std::optional<HostConfig> find_host(const std::string& name) const;

public:
    Config();

private:
    SshLiteConfig core_;
    std::vector<HostConfig> hosts_;
    fs::path trust_store_path_;
    fs::path credential_index_path_;
    fs::path secrets_path_;
};

// Parse "user@host[:port]".  The user defaults to $USER.
Result<HostConfig> parse_host_spec(const std::string& spec);

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
bool global_config_exists();

// Create default global config
Result<void> create_default_global_config();
