#include "docvec/domain/metadata.h"

#include "docvec/core/errors.h"
#include "docvec/core/uuid.h"

namespace docvec::domain {

namespace {

// Reads j[key] as T when present, converting nlohmann type errors into ValidationError
// so callers see one error kind for bad user input.
template <typename T>
std::optional<T> optional_field(const nlohmann::json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw core::ValidationError(std::string("metadata field '") + key + "': " + e.what());
  }
}

void check_valid_time(const std::optional<std::int64_t>& valid_time) {
  if (valid_time.has_value() && valid_time.value() < kIndefiniteValidity) {
    throw core::ValidationError("valid_time must be -1 or a non-negative duration, got " +
                                std::to_string(valid_time.value()));
  }
}

}  // namespace

Metadata make_metadata(const MetadataOptions& options, core::IClock& clock) {
  check_valid_time(options.valid_time);

  Metadata metadata;
  metadata.ids = options.ids.has_value() ? options.ids.value()
                                         : core::uuid_to_sha256(core::new_uuid_string());
  metadata.splitter = options.splitter;
  metadata.valid_time = options.valid_time.value_or(kIndefiniteValidity);
  metadata.start_time = options.start_time.has_value() ? options.start_time.value()
                                                       : clock.now_epoch_seconds();
  metadata.related = options.related;
  metadata.tags = Tags(options.tags);
  return metadata;
}

nlohmann::json metadata_to_json(const Metadata& metadata) {
  nlohmann::json j;
  j["ids"] = metadata.ids;
  j["related"] = metadata.related;
  j["splitter"] = metadata.splitter;
  j["start_time"] = metadata.start_time;
  j["tags"] = metadata.tags.get_tags();
  j["valid_time"] = metadata.valid_time;
  return j;
}

Metadata metadata_from_json(const nlohmann::json& j) {
  Metadata metadata;
  metadata.ids = j.at("ids").get<std::string>();
  metadata.related = j.at("related").get<bool>();
  metadata.splitter = j.at("splitter").get<std::string>();
  metadata.start_time = j.at("start_time").get<std::int64_t>();
  metadata.tags = Tags(j.at("tags").get<std::vector<std::string>>());
  metadata.valid_time = j.at("valid_time").get<std::int64_t>();
  return metadata;
}

MetadataOptions metadata_options_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw core::ValidationError("metadata must be a JSON object");
  }

  MetadataOptions options;
  options.ids = optional_field<std::string>(j, "ids");
  options.splitter = optional_field<std::string>(j, "splitter").value_or("default");
  options.valid_time = optional_field<std::int64_t>(j, "valid_time");
  check_valid_time(options.valid_time);
  options.start_time = optional_field<std::int64_t>(j, "start_time");
  options.related = optional_field<bool>(j, "related").value_or(false);
  options.tags = optional_field<std::vector<std::string>>(j, "tags").value_or(
      std::vector<std::string>{});
  return options;
}

}  // namespace docvec::domain
