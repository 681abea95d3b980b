#pragma once

#include <filesystem>
#include <string>
#include <atomic>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <platform/platform.hpp>

// Fresh directory under the system temp dir, removed on destruction.
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        path = platform::temp_dir() / fmt::format("sshlite_test_{}_{}", now_ms(), counter++);
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path operator/(const std::string& name) const { return path / name; }
};
