#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace bx {

// "<path>.bak": the original bytes while (and after) a file is rewritten.
std::string backup_path(std::string_view path);

// "<path>.broken": the partial output kept when a rewrite fails.
std::string broken_path(std::string_view path);

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Rename with error capture; false and *err set on failure.
bool rename_path(const std::filesystem::path& from,
                 const std::filesystem::path& to,
                 std::string* err = nullptr);

// Slug generation per config: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// First `len` hex chars of SHA-256(data).
std::string hex_hash_prefix(std::string_view data, int len);

}
