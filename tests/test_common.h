#ifndef PARLEY_TEST_COMMON_H
#define PARLEY_TEST_COMMON_H

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>  // NOLINT(build/c++17)
#include <functional>
#include <string>
#include <thread>

inline int testsPassed = 0;
inline int testsFailed = 0;

inline void check(bool ok, const char* name) {
    if (ok) {
        fprintf(stderr, "  [PASS] %s\n", name);
        ++testsPassed;
    } else {
        fprintf(stderr, "  [FAIL] %s\n", name);
        ++testsFailed;
    }
}

inline void section(const char* name) {
    fprintf(stderr, "\n--- %s ---\n", name);
}

inline int finish() {
    fprintf(stderr, "\n=== Results ===\nPassed: %d\nFailed: %d\n", testsPassed, testsFailed);
    return testsFailed > 0 ? 1 : 0;
}

/// @brief Poll until pred() holds or the timeout expires
inline bool waitFor(const std::function<bool()>& pred, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

/// @brief Fresh scratch directory under the system temp dir
inline std::string makeTempDir(const std::string& tag) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() /
        ("parley_" + tag + "_" + std::to_string(std::rand()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir.string();
}

#endif  // PARLEY_TEST_COMMON_H
