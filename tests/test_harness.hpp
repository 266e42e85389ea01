#pragma once

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

int passed = 0, failed = 0;
#define TEST(name) \
    std::cout << "Testing " << name << "... "; \
    try {
#define PASS() \
        std::cout << "PASS" << std::endl; \
        ++passed; \
    } catch (const std::exception& e) { \
        std::cout << "FAIL: " << e.what() << std::endl; \
        ++failed; \
    }
#define ASSERT(cond) if (!(cond)) throw std::runtime_error(#cond)
#define ASSERT_THROWS(expr, type) \
    do { \
        bool caught = false; \
        try { \
            expr; \
        } catch (const type&) { \
            caught = true; \
        } \
        if (!caught) throw std::runtime_error(#expr " did not throw " #type); \
    } while (false)

inline int summary() {
    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    return failed > 0 ? 1 : 0;
}

// Fresh directory under the system temp dir, removed on destruction.
struct ScratchDir {
    std::filesystem::path path;

    explicit ScratchDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("macrorec_" + name)) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};
