#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace docvec::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
// handler returns false to reject the value; it reports the reason itself.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Every problem (unknown flag, missing value, stray positional
// token, rejected value) is reported to stderr; the result is nullopt when there
// was at least one.
template <typename Config>
std::optional<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 2,
                                    Config default_config = {}) {
  Config config = std::move(default_config);
  bool ok = true;

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << (arg.rfind('-', 0) == 0 ? "Unknown option: " : "Unexpected argument: ") << arg
                << "\n";
      ok = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      ok = opt->handler(config, "") && ok;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Option " << arg << " requires a value\n";
      ok = false;
      continue;
    }
    ok = opt->handler(config, argv[++i]) && ok;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }

  if (!ok) {
    return std::nullopt;
  }
  return config;
}

// print_usage lists the registered flags under a one-line synopsis.
template <typename Config>
void print_usage(std::ostream& out, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << synopsis << "\n";
  std::size_t width = 0;
  for (const auto& opt : options) {
    width = std::max(width, opt.name.size() + (opt.requires_value ? 8 : 0));
  }
  for (const auto& opt : options) {
    std::ostringstream flag;
    flag << opt.name << (opt.requires_value ? " <value>" : "");
    out << "  " << std::left << std::setw(static_cast<int>(width + 2)) << flag.str()
        << opt.description << "\n";
  }
}

// split_csv turns "a,b,,c" into {"a", "b", "c"}.
inline std::vector<std::string> split_csv(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

// parse_number reports a bad value on stderr and returns false.
template <typename T>
bool parse_number(const std::string& flag, const std::string& value, T& out) {
  std::istringstream in(value);
  T parsed{};
  if (!(in >> parsed) || !in.eof()) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected a number)\n";
    return false;
  }
  out = parsed;
  return true;
}

}  // namespace docvec::apps
