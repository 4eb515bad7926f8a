#include "internal/model/manifest.hpp"

#include <cstdio>

namespace uploader::model {

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime  = 0x100000001b3ULL;

void Mix(std::uint64_t& hash, unsigned char byte) {
  hash ^= byte;
  hash *= kFnvPrime;
}

} // namespace

std::string ManifestFingerprint(const Manifest& manifest) {
  std::uint64_t hash = kFnvOffset;
  for (const auto& entry : manifest) {
    for (char c : entry.remote_key) {
      Mix(hash, static_cast<unsigned char>(c));
    }
    // keys never contain NUL, so it separates key from size unambiguously
    Mix(hash, 0);
    for (int shift = 0; shift < 64; shift += 8) {
      Mix(hash, static_cast<unsigned char>((entry.size_bytes >> shift) & 0xff));
    }
  }

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
  return buf;
}

} // namespace uploader::model
