#include "commands.h"

#include "docvec/app/document_service.h"

#include "cli_context.h"
#include "output.h"
#include "shared/arg_parser.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct DocumentCliConfig {
  CommonCliOptions common;
  std::optional<std::string> text;
  std::optional<std::string> file;
  std::optional<std::string> target_id;
  docvec::domain::MetadataOptions metadata;
};

struct DeleteCliConfig {
  CommonCliOptions common;
  std::vector<std::string> ids;
};

std::vector<docvec::apps::Option<DocumentCliConfig>> document_options(bool with_target) {
  using Opt = docvec::apps::Option<DocumentCliConfig>;
  std::vector<Opt> options = {
      {"--text", true, "Document content",
       [](DocumentCliConfig& c, const std::string& v) {
         c.text = v;
         return true;
       }},
      {"--file", true, "Read document content from a file",
       [](DocumentCliConfig& c, const std::string& v) {
         c.file = v;
         return true;
       }},
      {"--tags", true, "Comma-separated tags, highest priority first",
       [](DocumentCliConfig& c, const std::string& v) {
         c.metadata.tags = docvec::apps::split_csv(v);
         return true;
       }},
      {"--metadata-id", true, "Metadata id (default: generated)",
       [](DocumentCliConfig& c, const std::string& v) {
         c.metadata.ids = v;
         return true;
       }},
      {"--splitter", true, "Splitter name (default: default)",
       [](DocumentCliConfig& c, const std::string& v) {
         c.metadata.splitter = v;
         return true;
       }},
      {"--valid-time", true, "Validity in seconds, -1 for indefinite",
       [](DocumentCliConfig& c, const std::string& v) {
         std::int64_t value = 0;
         if (!docvec::apps::parse_number("--valid-time", v, value)) {
           return false;
         }
         c.metadata.valid_time = value;
         return true;
       }},
      {"--start-time", true, "Validity start, epoch seconds (default: now)",
       [](DocumentCliConfig& c, const std::string& v) {
         std::int64_t value = 0;
         if (!docvec::apps::parse_number("--start-time", v, value)) {
           return false;
         }
         c.metadata.start_time = value;
         return true;
       }},
      {"--related", false, "Mark the document as related",
       [](DocumentCliConfig& c, const std::string& /*v*/) {
         c.metadata.related = true;
         return true;
       }},
  };
  if (with_target) {
    options.push_back({"--id", true, "Metadata id of the document to replace",
                       [](DocumentCliConfig& c, const std::string& v) {
                         c.target_id = v;
                         return true;
                       }});
  }
  add_common_options(options);
  return options;
}

// Content from --text or --file; exactly one must be given.
std::optional<std::string> resolve_content(const DocumentCliConfig& config) {
  if (config.text.has_value() == config.file.has_value()) {
    std::cerr << "Exactly one of --text or --file is required\n";
    return std::nullopt;
  }
  if (config.text.has_value()) {
    return config.text;
  }
  std::ifstream in(config.file.value());
  if (!in) {
    std::cerr << "Cannot read " << config.file.value() << "\n";
    return std::nullopt;
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

}  // namespace

int cmd_add(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = document_options(false);
  const auto config = docvec::apps::parse_options(argc, argv, options);
  if (!config.has_value()) {
    docvec::apps::print_usage(std::cerr, "docvec_cli add [options]", options);
    return 1;
  }
  if (!apply_log_level(config->common.log_level)) {
    return 1;
  }
  const auto content = resolve_content(config.value());
  if (!content.has_value()) {
    return 1;
  }

  try {
    CliContext context(config->common);
    const auto stored = docvec::app::run_add_document(
        docvec::app::AddDocumentRequest{content.value(), config->metadata, config->common.editor},
        context.services());
    if (!finish_writes(context.store())) {
      return 1;
    }
    print_json(stored_to_json(stored));
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_update(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = document_options(true);
  const auto config = docvec::apps::parse_options(argc, argv, options);
  if (!config.has_value()) {
    docvec::apps::print_usage(std::cerr, "docvec_cli update --id <metadata id> [options]",
                              options);
    return 1;
  }
  if (!apply_log_level(config->common.log_level)) {
    return 1;
  }
  if (!config->target_id.has_value()) {
    std::cerr << "--id is required\n";
    return 1;
  }
  const auto content = resolve_content(config.value());
  if (!content.has_value()) {
    return 1;
  }

  try {
    CliContext context(config->common);
    const auto stored = docvec::app::run_update_document(
        docvec::app::UpdateDocumentRequest{config->target_id.value(), content, config->metadata,
                                           config->common.editor},
        context.services());
    if (!finish_writes(context.store())) {
      return 1;
    }
    print_json(stored_to_json(stored));
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_delete(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<docvec::apps::Option<DeleteCliConfig>> options = {
      {"--ids", true, "Comma-separated metadata ids",
       [](DeleteCliConfig& c, const std::string& v) {
         c.ids = docvec::apps::split_csv(v);
         return true;
       }},
  };
  add_common_options(options);

  const auto config = docvec::apps::parse_options(argc, argv, options);
  if (!config.has_value()) {
    docvec::apps::print_usage(std::cerr, "docvec_cli delete --ids a,b [options]", options);
    return 1;
  }
  if (!apply_log_level(config->common.log_level)) {
    return 1;
  }

  try {
    CliContext context(config->common);
    const auto result = docvec::app::run_delete_documents(
        docvec::app::DeleteDocumentsRequest{config->ids, config->common.editor},
        context.services());
    if (!finish_writes(context.store())) {
      return 1;
    }
    print_json({{"n_removed", result.n_removed},
                {"n_total", result.n_total},
                {"removed", documents_to_json(result.removed)}});
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
