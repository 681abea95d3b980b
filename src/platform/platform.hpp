#pragma once

#include <string>
#include <filesystem>

namespace platform {

// HOME on Unix, USERPROFILE on Windows.  Falls back to temp_dir().
std::filesystem::path home_dir();

std::filesystem::path temp_dir();

// Login name used when a host spec has no "user@" part.
std::string current_user();

// Where the running ssh-agent listens; empty when there is none.
std::string agent_socket();

// Owner read/write only.  Trust and secret files go through this.
bool restrict_to_owner(const std::filesystem::path& path);

void sleep_ms(int ms);

} // namespace platform
