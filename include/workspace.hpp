#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace context_engine {

namespace fs = std::filesystem;

struct DocumentSelection {
    int line_start = 0;
    int line_end = 0;
};

// Editor-side view of a document. Content is what the editor holds, which
// may be ahead of disk.
struct EditorDocument {
    std::string path;
    std::string language;
    std::string content;
    std::optional<DocumentSelection> selection;
};

// The engine's only window onto the host editor and filesystem.
class WorkspaceProvider {
public:
    virtual ~WorkspaceProvider() = default;

    virtual fs::path root() const = 0;
    virtual std::optional<EditorDocument> active_document() const = 0;
    virtual std::vector<EditorDocument> open_documents() const = 0;

    virtual std::optional<std::string> read_file(const fs::path& path) const = 0;
    virtual std::optional<uintmax_t> file_size(const fs::path& path) const = 0;
    virtual std::optional<fs::file_time_type> last_write_time(const fs::path& path) const = 0;

    // Files under root() whose extension is in `extensions` (all when empty).
    virtual std::vector<fs::path> find_files(const std::unordered_set<std::string>& extensions,
                                             size_t limit) const = 0;
};

// Workspace backed by a directory on disk plus editor state pushed by the host.
class FilesystemWorkspace : public WorkspaceProvider {
public:
    FilesystemWorkspace(fs::path root, std::vector<std::string> exclude_patterns);

    fs::path root() const override { return root_; }
    std::optional<EditorDocument> active_document() const override;
    std::vector<EditorDocument> open_documents() const override;

    std::optional<std::string> read_file(const fs::path& path) const override;
    std::optional<uintmax_t> file_size(const fs::path& path) const override;
    std::optional<fs::file_time_type> last_write_time(const fs::path& path) const override;
    std::vector<fs::path> find_files(const std::unordered_set<std::string>& extensions,
                                     size_t limit) const override;

    void set_active_document(std::optional<EditorDocument> doc);
    void set_open_documents(std::vector<EditorDocument> docs);

    // Resolves a path relative to the root; absolute paths pass through.
    fs::path resolve(const fs::path& path) const;

private:
    bool is_excluded(const std::string& rel) const;
    void scan_directory_recursive(const fs::path& current_dir,
                                  const std::unordered_set<std::string>& ext_set,
                                  size_t limit,
                                  std::vector<fs::path>& results) const;

    fs::path root_;
    std::vector<std::regex> excludes_;

    mutable std::mutex editor_mutex_;
    std::optional<EditorDocument> active_;
    std::vector<EditorDocument> open_;
};

} // namespace context_engine
