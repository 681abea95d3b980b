#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <cstdlib>

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sshlite";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

Config::Config()
    : trust_store_path_(get_global_config_dir() / "known_hosts.yaml"),
      credential_index_path_(get_global_config_dir() / "credentials.yaml"),
      secrets_path_(get_global_config_dir() / "secrets") {
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# sshlite configuration

connection:
  connect_timeout_ms: 10000
  keepalive_interval_ms: 30000
  reconnect_interval_ms: 3000
  reconnect_max_attempts: 0        # 0 = keep retrying

default_remote_path: "~"

search:
  max_results: 500
  max_stat: 100

write_timeout_ms: 60000

# Named hosts, usable in place of user@host[:port]
hosts: []
#  - name: build
#    host: build.example.com
#    port: 22
#    user: deploy
#    key: ~/.ssh/id_ed25519
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static void parse_connection(const YAML::Node& node, SshLiteConfig& c) {
    c.connect_timeout_ms = node["connect_timeout_ms"].as<int>(c.connect_timeout_ms);
    c.keepalive_interval_ms = node["keepalive_interval_ms"].as<int>(c.keepalive_interval_ms);
    c.reconnect_interval_ms = node["reconnect_interval_ms"].as<int>(c.reconnect_interval_ms);
    c.reconnect_max_attempts = node["reconnect_max_attempts"].as<int>(c.reconnect_max_attempts);
    c.host_verify_timeout_ms = node["host_verify_timeout_ms"].as<int>(c.host_verify_timeout_ms);
}

static HostConfig parse_host(const YAML::Node& node) {
    HostConfig h;
    h.name = node["name"].as<std::string>("");
    h.address = node["host"].as<std::string>("");
    h.port = node["port"].as<int>(22);
    h.username = node["user"].as<std::string>("");
    if (node["key"]) {
        h.key_path = node["key"].as<std::string>();
    }
    return h;
}

static Result<void> from_node(const YAML::Node& root, SshLiteConfig& core,
                              std::vector<HostConfig>& hosts) {
    if (!root || root.IsNull()) {
        return Result<void>::Ok();
    }
    if (!root.IsMap()) {
        return Result<void>::Err("Config root must be a mapping", ErrorKind::InvalidArgument);
    }

    if (root["connection"] && root["connection"].IsMap()) {
        parse_connection(root["connection"], core);
    }
    core.default_remote_path = root["default_remote_path"].as<std::string>(core.default_remote_path);
    if (root["search"] && root["search"].IsMap()) {
        core.search_max_results = root["search"]["max_results"].as<int>(core.search_max_results);
        core.search_max_stat = root["search"]["max_stat"].as<int>(core.search_max_stat);
    }
    core.write_timeout_ms = root["write_timeout_ms"].as<int>(core.write_timeout_ms);
    core.watch_probe_wait_ms = root["watch_probe_wait_ms"].as<int>(core.watch_probe_wait_ms);

    if (root["hosts"] && root["hosts"].IsSequence()) {
        for (const auto& n : root["hosts"]) {
            HostConfig h = parse_host(n);
            if (h.address.empty()) {
                return Result<void>::Err("Host entry '" + h.name + "' has no host",
                                         ErrorKind::InvalidArgument);
            }
            hosts.push_back(h);
        }
    }

    if (core.connect_timeout_ms <= 0 || core.reconnect_interval_ms <= 0 ||
        core.reconnect_max_attempts < 0 || core.write_timeout_ms <= 0) {
        return Result<void>::Err("Timeouts must be positive and the attempt cap non-negative",
                                 ErrorKind::InvalidArgument);
    }

    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        auto r = from_node(root, config.core_, config.hosts_);
        if (r.is_err()) return propagate<Config>(r);
        return Result<Config>::Ok(std::move(config));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()),
                                   ErrorKind::InvalidArgument);
    }
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string(),
                                   ErrorKind::InvalidArgument);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    auto r = parse(ss.str());
    if (r.is_err()) {
        return Result<Config>::Err(path.string() + ": " + r.error, r.kind);
    }
    return r;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load(get_global_config_path());
}

std::optional<HostConfig> Config::find_host(const std::string& name) const {
    for (const auto& h : hosts_) {
        if (h.name == name) return h;
    }
    return std::nullopt;
}

Result<HostConfig> parse_host_spec(const std::string& spec) {
    HostConfig h;
    std::string rest = spec;

    auto at = rest.find('@');
    if (at != std::string::npos) {
        h.username = rest.substr(0, at);
        rest = rest.substr(at + 1);
    } else {
        h.username = platform::current_user();
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        int port = safe_stoi(rest.substr(colon + 1), -1);
        if (port <= 0 || port > 65535) {
            return Result<HostConfig>::Err("Invalid port in '" + spec + "'",
                                           ErrorKind::InvalidArgument);
        }
        h.port = port;
        rest = rest.substr(0, colon);
    }

    h.address = rest;
    if (h.address.empty() || h.username.empty()) {
        return Result<HostConfig>::Err("Expected user@host[:port], got '" + spec + "'",
                                       ErrorKind::InvalidArgument);
    }
    return Result<HostConfig>::Ok(h);
}
