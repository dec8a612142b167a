#pragma once

// Each subcommand parses argv[2..] with its own option registry and returns the
// process exit code: 0 on success, 1 on a usage error or a failed operation.

// docvec_cli add --text <t>|--file <path> --tags a,b --editor <id>
//                [--metadata-id <id>] [--splitter <s>] [--valid-time <s>] [--start-time <epoch>]
//                [--related]
int cmd_add(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// docvec_cli update --id <metadata id> --text <t>|--file <path> --tags a,b --editor <id> [...]
int cmd_update(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// docvec_cli delete --ids a,b --editor <id>
int cmd_delete(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// docvec_cli search --query <q> [--k n] [--tags a,b] [--fetch-k n] [--score-threshold d]
//                   [--priority]
int cmd_search(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// docvec_cli find --query <q> [--tags a,b]
int cmd_find(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// docvec_cli list
int cmd_list(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// docvec_cli rebuild
int cmd_rebuild(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// docvec_cli audit [--document <metadata id>]
int cmd_audit(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
