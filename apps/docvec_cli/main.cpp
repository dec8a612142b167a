#include "commands/commands.h"

#include "docvec/core/version.h"

#include <iostream>
#include <string>
#include <unordered_map>

namespace {

using CommandFn = int (*)(int, char**);

void print_usage() {
  std::cerr << "Usage: docvec_cli <command> [options]\n"
            << "Commands:\n"
            << "  add       Add a document\n"
            << "  update    Replace the document carrying a metadata id\n"
            << "  delete    Delete documents by metadata id\n"
            << "  search    Similarity search with optional tag filter\n"
            << "  find      Adaptive search over the configured default tags\n"
            << "  list      Print every stored document\n"
            << "  rebuild   Re-embed every document and save the index\n"
            << "  audit     Print the document audit trail\n"
            << "  version   Print the version\n"
            << "An unknown flag prints the options of a command.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::unordered_map<std::string, CommandFn> commands = {
      {"add", cmd_add},       {"update", cmd_update}, {"delete", cmd_delete},
      {"search", cmd_search}, {"find", cmd_find},     {"list", cmd_list},
      {"rebuild", cmd_rebuild}, {"audit", cmd_audit},
  };

  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (subcommand == "version") {
    std::cout << "docvec " << docvec::core::kBuildVersion << "\n";
    return 0;
  }

  const auto it = commands.find(subcommand);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_usage();
    return 1;
  }
  return it->second(argc, argv);
}
