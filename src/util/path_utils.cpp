#include "bcp_exorcist/path_utils.hpp"
#include <iomanip>
#include <sstream>
#include <system_error>
#include <openssl/sha.h>

namespace bx {

std::string backup_path(std::string_view path) {
  return std::string(path) + ".bak";
}

std::string broken_path(std::string_view path) {
  return std::string(path) + ".broken";
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool rename_path(const std::filesystem::path& from,
                 const std::filesystem::path& to,
                 std::string* err) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (!ec) return true;
  if (err) *err = "rename " + from.string() + " -> " + to.string() + ": " + ec.message();
  return false;
}

std::string hex_hash_prefix(std::string_view data, int len) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256_CTX ctx; SHA256_Init(&ctx);
  SHA256_Update(&ctx, data.data(), data.size());
  SHA256_Final(md, &ctx);
  std::ostringstream o;
  for (int i = 0; i < (len+1)/2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  auto s = o.str();
  if ((int)s.size() > len) s.resize(len);
  return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    if ((int)base.size() > len) base.resize(len);
    return base;
  }
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) if (c=='/' || c=='\\') c='-';
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
