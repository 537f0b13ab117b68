#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

// Tiny check helpers shared by the standalone test programs

inline int& test_failures() {
    static int failures = 0;
    return failures;
}

inline void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  ✅ " << what << "\n";
    } else {
        std::cout << "  ❌ " << what << "\n";
        ++test_failures();
    }
}

template <typename A, typename B>
void check_eq(const A& actual, const B& expected, const std::string& what) {
    bool ok = actual == expected;
    if (ok) {
        std::cout << "  ✅ " << what << "\n";
    } else {
        std::cout << "  ❌ " << what << " (got '" << actual << "', expected '" << expected << "')\n";
        ++test_failures();
    }
}

// Polls pred until it holds or the timeout passes
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

inline void section(const std::string& name) {
    std::cout << "\n=== " << name << " ===\n";
}

inline int finish_tests(const char* suite) {
    if (test_failures() == 0) {
        std::cout << "\n✅ " << suite << ": all checks passed\n";
        return 0;
    }
    std::cout << "\n❌ " << suite << ": " << test_failures() << " check(s) failed\n";
    return 1;
}
