#include "split_reader/path_utils.hpp"
#include <cctype>
#include <functional>
#include <iomanip>
#include <sstream>

namespace sr {

bool has_uri_scheme(std::string_view path) noexcept {
  auto colon = path.find(':');
  if (colon == std::string_view::npos || colon == 0) return false;
  for (std::size_t i = 0; i < colon; ++i) {
    unsigned char c = static_cast<unsigned char>(path[i]);
    if (!(std::isalnum(c) || c == '+' || c == '-' || c == '.')) return false;
  }
  if (!std::isalpha(static_cast<unsigned char>(path[0]))) return false;
  auto rest = path.substr(colon + 1);
  return rest.rfind("//", 0) == 0 || path.substr(0, colon) == "file";
}

std::string qualify_path(std::string_view path) {
  if (has_uri_scheme(path)) return std::string(path);
  std::error_code ec;
  auto abs = std::filesystem::absolute(std::filesystem::path(std::string(path)), ec);
  if (ec) return std::filesystem::path(std::string(path)).lexically_normal().string();
  return abs.lexically_normal().string();
}

bool path_in_partition(std::string_view qualified_path, std::string_view partition_prefix) noexcept {
  return qualified_path.substr(0, partition_prefix.size()) == partition_prefix;
}

std::string local_path_from_url(std::string_view url) {
  if (url.rfind("file://", 0) == 0) return std::string(url.substr(7));
  if (url.rfind("file:", 0) == 0)   return std::string(url.substr(5));
  return std::string(url);
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::string hex_hash_prefix(std::string_view data, int len) {
  if (len < 1) len = 1;
  size_t h = std::hash<std::string_view>{}(data);
  std::ostringstream o; o << std::hex << std::setw(16) << std::setfill('0') << h;
  auto s = o.str(); if ((int)s.size() > len) s.resize(len); return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (len < 1) len = 1;
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    if ((int)base.size() > len) base.resize(len);
    return base;
  }
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) if (c=='/' || c=='\\' || c==':') c='-';
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
