#include "platform.hpp"
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <pwd.h>
#  include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace platform {

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

fs::path home_dir() {
#ifdef _WIN32
    std::string home = env_or_empty("USERPROFILE");
    if (home.empty()) home = env_or_empty("HOME");
#else
    std::string home = env_or_empty("HOME");
    if (home.empty()) {
        if (auto* pw = getpwuid(getuid())) home = pw->pw_dir;
    }
#endif
    if (home.empty()) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    return ec ? fs::path(".") : p;
}

std::string current_user() {
#ifdef _WIN32
    return env_or_empty("USERNAME");
#else
    std::string user = env_or_empty("USER");
    if (!user.empty()) return user;
    if (auto* pw = getpwuid(getuid())) return pw->pw_name;
    return "";
#endif
}

std::string agent_socket() {
    std::string sock = env_or_empty("SSH_AUTH_SOCK");
#ifdef _WIN32
    // Win32-OpenSSH agent service
    if (sock.empty()) sock = "\\\\.\\pipe\\openssh-ssh-agent";
#endif
    return sock;
}

bool restrict_to_owner(const fs::path& path) {
#ifdef _WIN32
    // NTFS ACLs under the profile already limit access to the user
    return fs::exists(path);
#else
    return chmod(path.c_str(), S_IRUSR | S_IWUSR) == 0;
#endif
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(static_cast<DWORD>(ms));
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
