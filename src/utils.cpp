#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <random>
#include <unordered_map>

namespace context_engine {

namespace fs = std::filesystem;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    // Drop a trailing partial sequence: continuation bytes first, then its lead byte.
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

uint64_t fnv1a64(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string hash_id(const std::string& key) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fnv1a64(key)));
    return std::string(buf);
}

int64_t vector_id_for(const std::string& key) {
    return static_cast<int64_t>(fnv1a64(key) & 0x7FFFFFFFFFFFFFFFULL);
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string generate_uuid() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);

    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  static_cast<unsigned long long>(hi >> 32),
                  static_cast<unsigned long long>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned long long>(hi & 0xFFFF),
                  static_cast<unsigned long long>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string file_extension(const fs::path& p) {
    return to_lower(p.extension().string());
}

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

bool is_inside(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;

    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();

    auto it_c = c.begin();
    auto it_p = p.begin();

    while (it_p != p.end()) {
        // A trailing slash leaves an empty segment after normalisation.
        if (it_p->string() == "." || it_p->string().empty()) {
            ++it_p;
            continue;
        }
        if (it_c == c.end()) return false;
        if (it_c->string() != it_p->string()) return false;
        ++it_c;
        ++it_p;
    }
    return true;
}

std::string language_for_path(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> language_map = {
        {".ts", "typescript"}, {".tsx", "typescriptreact"},
        {".js", "javascript"}, {".jsx", "javascriptreact"},
        {".py", "python"}, {".java", "java"},
        {".c", "c"}, {".h", "cpp"}, {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hpp", "cpp"},
        {".cs", "csharp"}, {".go", "go"}, {".rb", "ruby"}, {".php", "php"},
        {".rs", "rust"}, {".swift", "swift"}, {".kt", "kotlin"},
        {".html", "html"}, {".css", "css"}, {".json", "json"}, {".md", "markdown"},
        {".yaml", "yaml"}, {".yml", "yaml"}
    };
    auto it = language_map.find(file_extension(path));
    return it != language_map.end() ? it->second : "plaintext";
}

} // namespace context_engine
