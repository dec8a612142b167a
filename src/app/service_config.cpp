#include "docvec/app/service_config.h"

#include "docvec/core/errors.h"

namespace docvec::app {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw core::ValidationError(std::string("config field '") + key + "': " + e.what());
  }
}

}  // namespace

ServiceConfig service_config_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw core::ValidationError("service config must be a JSON object");
  }

  ServiceConfig config;
  read_field(j, "default_tags", config.default_tags);

  const auto find = j.find("find");
  if (find != j.end() && !find->is_null()) {
    if (!find->is_object()) {
      throw core::ValidationError("config field 'find' must be an object");
    }
    read_field(*find, "initial_threshold", config.find_policy.initial_threshold);
    read_field(*find, "step", config.find_policy.step);
    read_field(*find, "attempt_limit", config.find_policy.attempt_limit);
    read_field(*find, "min_documents", config.find_policy.min_documents);
    read_field(*find, "k", config.find_k);
  }

  if (config.find_policy.step < 0.0) {
    throw core::ValidationError("find.step must not be negative");
  }
  if (config.find_policy.attempt_limit == 0) {
    throw core::ValidationError("find.attempt_limit must be at least 1");
  }
  if (config.find_k == 0) {
    throw core::ValidationError("find.k must be at least 1");
  }
  return config;
}

}  // namespace docvec::app
