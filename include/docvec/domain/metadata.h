#pragma once

#include "docvec/core/clock.h"
#include "docvec/domain/tags.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docvec::domain {

// valid_time value meaning "never expires".
inline constexpr std::int64_t kIndefiniteValidity = -1;

// Metadata attached to every stored document.
//
// Schema:
// - ids: metadata-level identifier (distinct from the storage id). Defaults to the
//   SHA-256 hex digest of a fresh random UUID's raw bytes.
// - splitter: name of the text splitter that produced the content.
// - valid_time: validity duration in seconds, or kIndefiniteValidity.
// - start_time: epoch seconds at which validity starts.
// - related: free-form relation flag carried through storage and filters.
// - tags: ordered unique tag list used by tag filters.
struct Metadata {
  std::string ids;
  std::string splitter{"default"};
  std::int64_t valid_time{kIndefiniteValidity};
  std::int64_t start_time{0};
  bool related{false};
  Tags tags;

  bool operator==(const Metadata&) const = default;
};

// MetadataOptions enumerates every recognised metadata field for construction.
// Unset optionals take the documented defaults in make_metadata().
struct MetadataOptions {
  std::optional<std::string> ids;          // default: sha256(raw bytes of uuid4)
  std::string splitter{"default"};         // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> valid_time;  // default: kIndefiniteValidity
  std::optional<std::int64_t> start_time;  // default: clock.now_epoch_seconds()
  bool related{false};                     // NOLINT(readability-identifier-naming)
  std::vector<std::string> tags;           // duplicates dropped, first occurrence kept
};

// make_metadata applies defaults. The clock is read only when start_time is unset.
[[nodiscard]] Metadata make_metadata(const MetadataOptions& options, core::IClock& clock);

// JSON form uses the keys filters are written against:
// ids, related, splitter, start_time, tags, valid_time.
[[nodiscard]] nlohmann::json metadata_to_json(const Metadata& metadata);

// Inverse of metadata_to_json. Throws nlohmann::json::exception on malformed input.
[[nodiscard]] Metadata metadata_from_json(const nlohmann::json& j);

// Reads user-supplied options; every key is optional.
// Throws core::ValidationError when a present key has the wrong type.
[[nodiscard]] MetadataOptions metadata_options_from_json(const nlohmann::json& j);

}  // namespace docvec::domain
