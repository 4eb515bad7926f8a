#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/category.hpp"

namespace uploader::model {

enum class Origin : std::uint8_t {
  kOrganized = 0, // already inside a subfolder of the task root
  kLoose     = 1, // was directly under the task root and got relocated
};

constexpr std::string_view ToString(Origin origin) {
  return origin == Origin::kLoose ? "loose" : "organized";
}

/*
  One file scheduled for transfer.

  Immutable after the scan. The manifest order is the resume cursor's
  coordinate system, so it must be reproducible.
*/
struct ManifestEntry {
  std::string   local_path;
  std::string   remote_key;
  std::uint64_t size_bytes = 0;
  FileCategory  category   = FileCategory::kOther;
  std::string   extension; // lowercase, with leading dot; empty when none
  Origin        origin = Origin::kOrganized;

  bool operator==(const ManifestEntry&) const = default;
};

using Manifest = std::vector<ManifestEntry>;

inline std::uint64_t TotalBytes(const Manifest& manifest) {
  std::uint64_t total = 0;
  for (const auto& entry : manifest) {
    total += entry.size_bytes;
  }
  return total;
}

/*
  Identity of the manifest's cursor coordinates: 64-bit FNV-1a over the
  ordered (remote_key, size_bytes) pairs, as 16 lowercase hex digits.

  Two scans with the same fingerprint put the same file at every index, so
  a saved cursor means the same thing in both. Stable across builds and
  platforms because it is stored in checkpoints.
*/
std::string ManifestFingerprint(const Manifest& manifest);

} // namespace uploader::model
