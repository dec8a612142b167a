#include "cli_context.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

constexpr std::size_t kDefaultDimension = 128;
constexpr const char* kDefaultStoreDir = "data/docvec";

nlohmann::json load_config_file(const std::optional<std::string>& path) {
  if (!path.has_value()) {
    return nlohmann::json::object();
  }
  std::ifstream in(path.value());
  if (!in) {
    throw std::runtime_error("cannot open config file " + path.value());
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("config file " + path.value() + ": " + e.what());
  }
}

}  // namespace

bool apply_log_level(const std::string& level) {
  const auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    std::cerr << "Invalid --log-level: " << level
              << " (valid: trace, debug, info, warn, error, off)\n";
    return false;
  }
  spdlog::set_level(parsed);
  return true;
}

CliContext::CliContext(const CommonCliOptions& options) {
  const auto file = load_config_file(options.config_path);

  auto store_config = file.contains("store")
                          ? docvec::store::vector_store_config_from_json(file.at("store"))
                          : docvec::store::VectorStoreConfig{};
  if (!file.contains("store")) {
    store_config.folder_path = kDefaultStoreDir;
  }
  if (options.store_dir.has_value()) {
    store_config.folder_path = options.store_dir.value();
  }
  if (file.contains("service")) {
    service_config_ = docvec::app::service_config_from_json(file.at("service"));
  }

  const auto dimension = file.value("embedding_dimension", kDefaultDimension);
  embedder_ = std::make_unique<docvec::embedding::DeterministicStubEmbeddingProvider>(dimension);

  std::filesystem::create_directories(store_config.folder_path);
  const auto db_path = (std::filesystem::path(store_config.folder_path) / "audit.db").string();
  auto db_result = docvec::storage::sqlite::SqliteDb::open(db_path);
  if (!db_result.has_value()) {
    throw std::runtime_error(db_result.error());
  }
  db_ = db_result.value();
  const auto schema_result = db_->ensure_schema_v1();
  if (!schema_result.has_value()) {
    throw std::runtime_error(schema_result.error());
  }
  audit_log_ = std::make_unique<docvec::storage::sqlite::SqliteDocumentAuditLog>(db_);

  store_ = std::make_unique<docvec::store::VectorStore>(store_config, *embedder_, clock_, id_gen_);
  services_ = std::make_unique<docvec::app::Services>(*store_, *audit_log_, reranker_, clock_);
}

CliContext::~CliContext() {
  services_.reset();
  store_.reset();
}
