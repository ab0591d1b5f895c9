#include "workspace.hpp"
#include "utils.hpp"
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace context_engine {

FilesystemWorkspace::FilesystemWorkspace(fs::path root, std::vector<std::string> exclude_patterns)
    : root_(fs::absolute(root).lexically_normal()) {
    for (const auto& p : exclude_patterns) {
        try {
            excludes_.emplace_back(p);
        } catch (const std::regex_error& e) {
            spdlog::warn("⚠️ Ignoring bad exclude pattern '{}': {}", p, e.what());
        }
    }
}

fs::path FilesystemWorkspace::resolve(const fs::path& path) const {
    if (path.is_absolute()) return path.lexically_normal();
    return (root_ / path).lexically_normal();
}

std::optional<EditorDocument> FilesystemWorkspace::active_document() const {
    std::lock_guard<std::mutex> lock(editor_mutex_);
    return active_;
}

std::vector<EditorDocument> FilesystemWorkspace::open_documents() const {
    std::lock_guard<std::mutex> lock(editor_mutex_);
    return open_;
}

void FilesystemWorkspace::set_active_document(std::optional<EditorDocument> doc) {
    std::lock_guard<std::mutex> lock(editor_mutex_);
    active_ = std::move(doc);
}

void FilesystemWorkspace::set_open_documents(std::vector<EditorDocument> docs) {
    std::lock_guard<std::mutex> lock(editor_mutex_);
    open_ = std::move(docs);
}

std::optional<std::string> FilesystemWorkspace::read_file(const fs::path& path) const {
    std::ifstream file(resolve(path), std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return buffer.str();
}

std::optional<uintmax_t> FilesystemWorkspace::file_size(const fs::path& path) const {
    std::error_code ec;
    auto size = fs::file_size(resolve(path), ec);
    if (ec) return std::nullopt;
    return size;
}

std::optional<fs::file_time_type> FilesystemWorkspace::last_write_time(const fs::path& path) const {
    std::error_code ec;
    auto t = fs::last_write_time(resolve(path), ec);
    if (ec) return std::nullopt;
    return t;
}

bool FilesystemWorkspace::is_excluded(const std::string& rel) const {
    for (const auto& re : excludes_) {
        if (std::regex_search(rel, re)) return true;
    }
    return false;
}

void FilesystemWorkspace::scan_directory_recursive(const fs::path& current_dir,
                                                   const std::unordered_set<std::string>& ext_set,
                                                   size_t limit,
                                                   std::vector<fs::path>& results) const {
    try {
        for (const auto& entry : fs::directory_iterator(current_dir)) {
            if (results.size() >= limit) return;

            const auto& path = entry.path();
            std::string rel = fs::relative(path, root_).generic_string();
            if (is_excluded(rel)) continue;

            if (entry.is_directory()) {
                scan_directory_recursive(path, ext_set, limit, results);
            } else if (entry.is_regular_file()) {
                if (ext_set.empty() || ext_set.count(file_extension(path))) {
                    results.push_back(path);
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::error("Scanner error at {}: {}", current_dir.string(), e.what());
    }
}

std::vector<fs::path> FilesystemWorkspace::find_files(const std::unordered_set<std::string>& extensions,
                                                      size_t limit) const {
    std::vector<fs::path> files;
    if (!fs::exists(root_)) return files;
    scan_directory_recursive(root_, extensions, limit, files);
    return files;
}

} // namespace context_engine
