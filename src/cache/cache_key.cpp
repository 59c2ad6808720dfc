#include "mnemo/cache/cache_manager.hpp"

#include "mnemo/common/text.hpp"

namespace mnemo::cache {

namespace {

constexpr std::size_t kKeyHashPrefixLength = 10;

} // namespace

std::string make_cache_key(const CacheKind kind, const std::string &user,
                           const std::string_view content) {
  std::string key = std::string(cache_kind_name(kind)) + "_" + user;
  if (content.empty()) {
    return key;
  }
  key += ":";
  key += common::sha256_hex(content).substr(0, kKeyHashPrefixLength);
  return key;
}

} // namespace mnemo::cache
