#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace context_engine {

// Cuts at most `length` bytes without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

uint64_t fnv1a64(const std::string& data);

// Stable 16-char hex id for paths and composite keys.
std::string hash_id(const std::string& key);

// Numeric id used by the vector index; always non-negative.
int64_t vector_id_for(const std::string& key);

int64_t now_ms();

std::string generate_uuid();

std::string to_lower(std::string s);

// Lowercased extension including the dot, e.g. ".cpp".
std::string file_extension(const std::filesystem::path& p);

// Editor language id for a file, "plaintext" when unknown.
std::string language_for_path(const std::filesystem::path& p);

// Collapse runs of whitespace into one space and trim both ends.
std::string collapse_whitespace(const std::string& text);

// True when `child` equals `parent` or lies below it.
bool is_inside(const std::filesystem::path& child, const std::filesystem::path& parent);

} // namespace context_engine
