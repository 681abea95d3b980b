#include "store.hpp"
#include "log.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <platform/platform.hpp>

// ── MemoryStore ────────────────────────────────────────────

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

Result<void> MemoryStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
    return Result<void>::Ok();
}

Result<void> MemoryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key);
    return Result<void>::Ok();
}

std::vector<std::string> MemoryStore::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [k, v] : data_) out.push_back(k);
    return out;
}

// ── YamlFileStore ──────────────────────────────────────────

YamlFileStore::YamlFileStore(fs::path path) : path_(std::move(path)) {}

std::map<std::string, std::string> YamlFileStore::load() {
    std::map<std::string, std::string> data;
    if (!fs::exists(path_)) return data;

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        if (root.IsMap()) {
            for (const auto& kv : root) {
                data[kv.first.as<std::string>()] = kv.second.as<std::string>("");
            }
        }
    } catch (const YAML::Exception& e) {
        // Corrupted file: start fresh, the next save rewrites it
        sshlite_log(fmt::format("YamlFileStore: ignoring unreadable {}: {}",
                                path_.string(), e.what()));
        return {};
    }
    return data;
}

Result<void> YamlFileStore::save(const std::map<std::string, std::string>& data) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [k, v] : data) {
        out << YAML::Key << k << YAML::Value << v;
    }
    out << YAML::EndMap;

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);

    // Write to temp file then rename for atomicity
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream f(tmp);
        if (!f) {
            return Result<void>::Err("Failed to write " + tmp.string());
        }
        f << out.c_str() << "\n";
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        return Result<void>::Err("Failed to replace " + path_.string() + ": " + ec.message());
    }
    return Result<void>::Ok();
}

std::optional<std::string> YamlFileStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = load();
    auto it = data.find(key);
    if (it == data.end()) return std::nullopt;
    return it->second;
}

Result<void> YamlFileStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = load();
    data[key] = value;
    return save(data);
}

Result<void> YamlFileStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = load();
    if (data.erase(key) == 0) return Result<void>::Ok();
    return save(data);
}

std::vector<std::string> YamlFileStore::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [k, v] : load()) out.push_back(k);
    return out;
}

// ── SecretFileStore ────────────────────────────────────────

SecretFileStore::SecretFileStore(fs::path path) : path_(std::move(path)) {}

// Read all key=value pairs from the secrets file
std::map<std::string, std::string> SecretFileStore::read_all() {
    std::map<std::string, std::string> m;
    std::ifstream f(path_);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

// Write all key=value pairs to the secrets file (chmod 600)
bool SecretFileStore::write_all(const std::map<std::string, std::string>& m) {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);

    std::ofstream f(path_, std::ios::trunc);
    if (!f) return false;
    if (!platform::restrict_to_owner(path_)) {
        sshlite_log(fmt::format("SecretFileStore: cannot restrict {}", path_.string()));
    }

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();
    return static_cast<bool>(f);
}

std::optional<std::string> SecretFileStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto m = read_all();
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    return it->second;
}

Result<void> SecretFileStore::set(const std::string& key, const std::string& value) {
    if (value.find('\n') != std::string::npos || key.find('=') != std::string::npos) {
        return Result<void>::Err("Secret keys may not contain '=' and values may not span lines",
                                 ErrorKind::InvalidArgument);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto m = read_all();
    m[key] = value;
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write secrets file " + path_.string());
    }
    return Result<void>::Ok();
}

Result<void> SecretFileStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto m = read_all();
    if (m.erase(key) == 0) return Result<void>::Ok();
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write secrets file " + path_.string());
    }
    return Result<void>::Ok();
}

std::vector<std::string> SecretFileStore::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [k, v] : read_all()) out.push_back(k);
    return out;
}
