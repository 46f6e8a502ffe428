// tests/test_utils.hpp
#pragma once

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace tinylm_test {

inline int& failures() {
    static int count = 0;
    return count;
}

inline int& checks() {
    static int count = 0;
    return count;
}

inline void check(bool condition, const std::string& what) {
    ++checks();
    if (condition) {
        std::cout << "  ok: " << what << std::endl;
    } else {
        ++failures();
        std::cerr << "  FAILED: " << what << std::endl;
    }
}

inline bool near(double a, double b, double tolerance = 1e-6) {
    return std::fabs(a - b) <= tolerance * std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
}

// True when f throws exactly an E (or a subclass of it)
template <typename E, typename F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  unexpected exception: " << e.what() << std::endl;
        return false;
    }
    return false;
}

inline void section(const std::string& name) {
    std::cout << "\n=== " << name << " ===" << std::endl;
}

// Empty scratch directory under the system temp dir
inline std::filesystem::path fresh_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("tinylm_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline std::string sample_corpus(size_t repeats = 40) {
    const std::string passage =
        "the quick brown fox jumps over the lazy dog. "
        "a small model learns which letter tends to follow which. "
        "training runs until the loss stops falling, then we sample.\n";
    std::string text;
    for (size_t i = 0; i < repeats; ++i) {
        text += passage;
    }
    return text;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    file << content;
}

inline int finish(const std::string& suite) {
    if (failures() > 0) {
        std::cerr << "\n" << suite << ": " << failures() << " of " << checks() << " checks failed" << std::endl;
        return 1;
    }
    std::cout << "\n" << suite << ": all " << checks() << " checks passed" << std::endl;
    return 0;
}

} // namespace tinylm_test
