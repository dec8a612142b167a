#include "commands.h"

#include "docvec/app/document_service.h"

#include "cli_context.h"
#include "output.h"
#include "shared/arg_parser.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct SearchCliConfig {
  CommonCliOptions common;
  std::string query;
  std::size_t k{6};
  std::optional<std::vector<std::string>> tags;
  std::optional<std::size_t> fetch_k;
  std::optional<double> score_threshold;
  bool powerset{true};
};

struct FindCliConfig {
  CommonCliOptions common;
  std::string query;
  std::vector<std::string> tags;
};

struct ListCliConfig {
  CommonCliOptions common;
  std::optional<std::string> document_id;
};

}  // namespace

int cmd_search(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using Opt = docvec::apps::Option<SearchCliConfig>;
  std::vector<Opt> options = {
      {"--query", true, "Query text",
       [](SearchCliConfig& c, const std::string& v) {
         c.query = v;
         return true;
       }},
      {"--k", true, "Number of results (default: 6)",
       [](SearchCliConfig& c, const std::string& v) {
         return docvec::apps::parse_number("--k", v, c.k);
       }},
      {"--tags", true, "Comma-separated filter tags, highest priority first",
       [](SearchCliConfig& c, const std::string& v) {
         c.tags = docvec::apps::split_csv(v);
         return true;
       }},
      {"--fetch-k", true, "Candidates fetched before filtering",
       [](SearchCliConfig& c, const std::string& v) {
         std::size_t value = 0;
         if (!docvec::apps::parse_number("--fetch-k", v, value)) {
           return false;
         }
         c.fetch_k = value;
         return true;
       }},
      {"--score-threshold", true, "Maximum squared L2 distance",
       [](SearchCliConfig& c, const std::string& v) {
         double value = 0.0;
         if (!docvec::apps::parse_number("--score-threshold", v, value)) {
           return false;
         }
         c.score_threshold = value;
         return true;
       }},
      {"--priority", false, "Priority tag expansion instead of powerset",
       [](SearchCliConfig& c, const std::string& /*v*/) {
         c.powerset = false;
         return true;
       }},
  };
  add_common_options(options);

  const auto config = docvec::apps::parse_options(argc, argv, options);
  if (!config.has_value() || config->query.empty()) {
    docvec::apps::print_usage(std::cerr, "docvec_cli search --query <q> [options]", options);
    return 1;
  }
  if (!apply_log_level(config->common.log_level)) {
    return 1;
  }

  try {
    CliContext context(config->common);
    const auto documents = docvec::app::run_get_documents(
        docvec::app::GetDocumentsRequest{config->query, config->k, config->tags, config->fetch_k,
                                         config->score_threshold, config->powerset},
        context.services());
    print_json(documents_to_json(documents));
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_find(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<docvec::apps::Option<FindCliConfig>> options = {
      {"--query", true, "Query text",
       [](FindCliConfig& c, const std::string& v) {
         c.query = v;
         return true;
       }},
      {"--tags", true, "Comma-separated tags appended to the configured defaults",
       [](FindCliConfig& c, const std::string& v) {
         c.tags = docvec::apps::split_csv(v);
         return true;
       }},
  };
  add_common_options(options);

  const auto config = docvec::apps::parse_options(argc, argv, options);
  if (!config.has_value() || config->query.empty()) {
    docvec::apps::print_usage(std::cerr, "docvec_cli find --query <q> [options]", options);
    return 1;
  }
  if (!apply_log_level(config->common.log_level)) {
    return 1;
  }

  try {
    CliContext context(config->common);
    const auto documents =
        docvec::app::run_find_documents(docvec::app::FindDocumentsRequest{config->query, config->tags},
                                        context.services(), context.service_config());
    print_json(documents_to_json(documents));
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_list(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<docvec::apps::Option<ListCliConfig>> options;
  add_common_options(options);

  const auto config = docvec::apps::parse_options(argc, argv, options);
  if (!config.has_value()) {
    docvec::apps::print_usage(std::cerr, "docvec_cli list [options]", options);
    return 1;
  }
  if (!apply_log_level(config->common.log_level)) {
    return 1;
  }

  try {
    CliContext context(config->common);
    auto out = nlohmann::json::array();
    for (const auto& stored : context.store().get_all_documents()) {
      out.push_back(stored_to_json(stored));
    }
    print_json(out);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_audit(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<docvec::apps::Option<ListCliConfig>> options = {
      {"--document", true, "Only records for this metadata id",
       [](ListCliConfig& c, const std::string& v) {
         c.document_id = v;
         return true;
       }},
  };
  add_common_options(options);

  const auto config = docvec::apps::parse_options(argc, argv, options);
  if (!config.has_value()) {
    docvec::apps::print_usage(std::cerr, "docvec_cli audit [options]", options);
    return 1;
  }
  if (!apply_log_level(config->common.log_level)) {
    return 1;
  }

  try {
    CliContext context(config->common);
    const auto rows = config->document_id.has_value()
                          ? context.audit_log().query_by_document(config->document_id.value())
                          : context.audit_log().list_all();
    print_json(audit_to_json(rows));
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_rebuild(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<docvec::apps::Option<ListCliConfig>> options;
  add_common_options(options);

  const auto config = docvec::apps::parse_options(argc, argv, options);
  if (!config.has_value()) {
    docvec::apps::print_usage(std::cerr, "docvec_cli rebuild [options]", options);
    return 1;
  }
  if (!apply_log_level(config->common.log_level)) {
    return 1;
  }

  try {
    CliContext context(config->common);
    context.store().rebuild_index();
    context.store().save_index();
    if (!finish_writes(context.store())) {
      return 1;
    }
    print_json({{"documents", context.store().size()}});
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
