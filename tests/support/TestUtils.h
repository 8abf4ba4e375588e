#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace testutil {

inline std::string readAll(const fs::path& p) {
    std::string s;
    std::ifstream f(p, std::ios::binary);
    if (f) s.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return s;
}

inline void writeAll(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

// Fresh directory under the system temp dir, unique per process and tag.
inline fs::path makeTempDir(const std::string& tag) {
    fs::path root = fs::temp_directory_path() /
                    ("cortex_act_" + tag + "_" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
    return root;
}

inline bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

}  // namespace testutil
