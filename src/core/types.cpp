#include "types.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::Generic:           return "error";
        case ErrorKind::InvalidArgument:   return "invalid-argument";
        case ErrorKind::Authentication:    return "authentication";
        case ErrorKind::ConnectionTimeout: return "connection-timeout";
        case ErrorKind::ConnectionRefused: return "connection-refused";
        case ErrorKind::HostNotFound:      return "host-not-found";
        case ErrorKind::Connection:        return "connection";
        case ErrorKind::NotConnected:      return "not-connected";
        case ErrorKind::HostVerification:  return "host-verification";
        case ErrorKind::Transfer:          return "transfer";
        case ErrorKind::Timeout:           return "timeout";
        case ErrorKind::Cancelled:         return "cancelled";
    }
    return "error";
}

std::string remediation_hint(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Authentication:
            return "Check the username and re-enter the password or key passphrase.";
        case ErrorKind::ConnectionTimeout:
            return "The host did not answer. Check the network, VPN or firewall.";
        case ErrorKind::ConnectionRefused:
            return "Nothing is listening on that port. Check that sshd is running and the port is right.";
        case ErrorKind::HostNotFound:
            return "The host name could not be resolved. Check the spelling or DNS.";
        case ErrorKind::Connection:
            return "The connection failed. Retry, or check the server's SSH configuration.";
        case ErrorKind::HostVerification:
            return "The host key was not trusted. Review the fingerprint, or forget the stored key if it changed legitimately.";
        case ErrorKind::NotConnected:
            return "Connect to the host first.";
        case ErrorKind::Timeout:
            return "The server did not confirm the operation in time.";
        default:
            return "";
    }
}

bool is_connection_error(ErrorKind kind) {
    return kind == ErrorKind::ConnectionTimeout ||
           kind == ErrorKind::ConnectionRefused ||
           kind == ErrorKind::HostNotFound ||
           kind == ErrorKind::Connection;
}

std::string HostConfig::identity_key() const {
    return fmt::format("{}:{}:{}", address, port, username);
}

std::string HostConfig::display() const {
    if (!name.empty()) return name;
    return port == 22 ? fmt::format("{}@{}", username, address)
                      : fmt::format("{}@{}:{}", username, address, port);
}

const char* credential_kind_name(CredentialKind kind) {
    return kind == CredentialKind::PrivateKey ? "privateKey" : "password";
}

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Error:        return "error";
    }
    return "unknown";
}

const char* file_change_kind_name(FileChangeKind kind) {
    switch (kind) {
        case FileChangeKind::Modify: return "modify";
        case FileChangeKind::Delete: return "delete";
        case FileChangeKind::Create: return "create";
    }
    return "modify";
}
