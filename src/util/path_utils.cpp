#include "csvlint/path_utils.hpp"
#include <iomanip>
#include <sstream>
#include <system_error>
#include <openssl/sha.h>

namespace csvlint {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::string hex_hash_prefix(std::string_view data, int len) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < (len + 1) / 2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  auto s = o.str();
  if (len >= 0 && static_cast<int>(s.size()) > len) s.resize(len);
  return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    for (auto& c : base) if (c == ' ') c = '_';
    if (static_cast<int>(base.size()) > len) base.resize(len);
    return base;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
