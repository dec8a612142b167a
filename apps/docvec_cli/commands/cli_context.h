#pragma once

#include "docvec/app/service_config.h"
#include "docvec/app/services.h"
#include "docvec/core/clock.h"
#include "docvec/core/id_generator.h"
#include "docvec/embedding/embedding_provider.h"
#include "docvec/retrieval/reranker.h"
#include "docvec/storage/sqlite/sqlite_db.h"
#include "docvec/storage/sqlite/sqlite_document_audit_log.h"
#include "docvec/store/vector_store.h"

#include "shared/arg_parser.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Flags shared by every subcommand.
struct CommonCliOptions {
  std::optional<std::string> store_dir;    // overrides store.folder_path from --config
  std::optional<std::string> config_path;  // JSON: {"store": {...}, "service": {...},
                                           //        "embedding_dimension": 128}
  std::string log_level{"info"};
  std::optional<std::string> editor;
};

// Registers --store-dir, --config, --log-level and --editor for a subcommand whose
// config struct carries a `common` member.
template <typename Config>
void add_common_options(std::vector<docvec::apps::Option<Config>>& options) {
  options.push_back({"--store-dir", true, "Folder holding the index snapshot and audit.db",
                     [](Config& c, const std::string& v) {
                       c.common.store_dir = v;
                       return true;
                     }});
  options.push_back({"--config", true, "JSON config file",
                     [](Config& c, const std::string& v) {
                       c.common.config_path = v;
                       return true;
                     }});
  options.push_back({"--log-level", true, "trace|debug|info|warn|error|off",
                     [](Config& c, const std::string& v) {
                       c.common.log_level = v;
                       return true;
                     }});
  options.push_back({"--editor", true, "Editor id recorded in the audit trail",
                     [](Config& c, const std::string& v) {
                       c.common.editor = v;
                       return true;
                     }});
}

// CliContext owns every concrete service one CLI invocation needs.
// Member order matters: the store is destroyed (draining its persistence worker)
// before the embedder and clock it references.
class CliContext {
 public:
  // Throws on a bad config file, an unreadable snapshot or an unopenable audit db.
  explicit CliContext(const CommonCliOptions& options);
  ~CliContext();

  CliContext(const CliContext&) = delete;
  CliContext& operator=(const CliContext&) = delete;
  CliContext(CliContext&&) = delete;
  CliContext& operator=(CliContext&&) = delete;

  [[nodiscard]] docvec::app::Services& services() { return *services_; }
  [[nodiscard]] docvec::store::VectorStore& store() { return *store_; }
  [[nodiscard]] const docvec::app::ServiceConfig& service_config() const {
    return service_config_;
  }
  [[nodiscard]] docvec::storage::IDocumentAuditLog& audit_log() { return *audit_log_; }

 private:
  docvec::core::SystemClock clock_;
  docvec::core::UuidIdGenerator id_gen_;
  std::unique_ptr<docvec::embedding::IEmbeddingProvider> embedder_;
  std::shared_ptr<docvec::storage::sqlite::SqliteDb> db_;
  std::unique_ptr<docvec::storage::sqlite::SqliteDocumentAuditLog> audit_log_;
  docvec::retrieval::IdentityReranker reranker_;
  docvec::app::ServiceConfig service_config_;
  std::unique_ptr<docvec::store::VectorStore> store_;
  std::unique_ptr<docvec::app::Services> services_;
};

// Applies --log-level to the default spdlog logger. Returns false on an unknown level.
bool apply_log_level(const std::string& level);
