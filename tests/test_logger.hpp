#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace context_engine::tests {

inline bool is_truthy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

inline bool logging_enabled() {
    static const bool enabled = []() {
        const char* env = std::getenv("CONTEXT_ENGINE_TEST_LOG");
        return env != nullptr && is_truthy(env);
    }();
    return enabled;
}

// Engine logs go through spdlog too, so one switch silences both.
inline void init_logging() {
    spdlog::set_pattern("[context-engine-test] [%^%l%$] %v");
    spdlog::set_level(logging_enabled() ? spdlog::level::debug : spdlog::level::off);
}

inline void log(const std::string& message) {
    if (logging_enabled()) spdlog::info("{}", message);
}

inline void log_error(const std::string& message) {
    // Failures are always reported
    spdlog::set_level(spdlog::level::err);
    spdlog::error("{}", message);
}

inline void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

// Scratch directory removed on scope exit.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "context-engine-test") {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "-" + std::to_string(gen() % 1000000000ULL));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out << content;
        return target;
    }

private:
    std::filesystem::path path_;
};

} // namespace context_engine::tests
