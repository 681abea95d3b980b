#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Failure categories surfaced by the session core.  Callers branch on these
// instead of parsing error strings.
enum class ErrorKind {
    None,
    Generic,
    InvalidArgument,
    Authentication,
    ConnectionTimeout,
    ConnectionRefused,
    HostNotFound,
    Connection,
    NotConnected,
    HostVerification,
    Transfer,
    Timeout,
    Cancelled,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Generic) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Generic) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Re-wrap a failure into another Result type, keeping its kind.
template <typename T, typename U>
Result<T> propagate(const Result<U>& r, const std::string& context = "") {
    return Result<T>::Err(context.empty() ? r.error : context + ": " + r.error, r.kind);
}

const char* error_kind_name(ErrorKind kind);

// One-line hint a front end can show next to a failure.
std::string remediation_hint(ErrorKind kind);

// Timeout, refused, DNS and generic transport failures.
bool is_connection_error(ErrorKind kind);

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// ── Hosts and credentials ──────────────────────────────────

struct HostConfig {
    std::string name;                       // display name
    std::string address;
    int port = 22;
    std::string username;
    std::optional<std::string> key_path;

    // address:port:username
    std::string identity_key() const;
    std::string display() const;
};

enum class CredentialKind { Password, PrivateKey };

struct Credential {
    std::string id;
    std::string label;
    CredentialKind kind = CredentialKind::Password;
    std::optional<std::string> key_path;    // PrivateKey only
};

const char* credential_kind_name(CredentialKind kind);

// ── Session state ──────────────────────────────────────────

enum class ConnectionState { Disconnected, Connecting, Connected, Error };

const char* connection_state_name(ConnectionState state);

// ── Remote files ───────────────────────────────────────────

struct RemoteFile {
    std::string name;
    std::string path;
    bool is_directory = false;
    bool is_link = false;
    uint64_t size = 0;
    int64_t modified_ms = 0;
    int64_t accessed_ms = 0;
    std::string permissions;                // "rwxr-xr-x"
    std::string owner;
    std::string group;
};

enum class FileChangeKind { Modify, Delete, Create };

const char* file_change_kind_name(FileChangeKind kind);

struct FileChangeEvent {
    std::string identity;
    std::string path;
    FileChangeKind kind = FileChangeKind::Modify;
};

struct ForwardInfo {
    int local_port = 0;
    std::string remote_host;
    int remote_port = 0;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
