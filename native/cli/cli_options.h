// cli_options.h
// Command-line parsing for the forensics_lab tool

#ifndef FORENSICS_LAB_CLI_OPTIONS_H
#define FORENSICS_LAB_CLI_OPTIONS_H

#include <cstdint>
#include <string>
#include <vector>

#include "case_session/case_session.h"

namespace forensics_lab {

enum class Command : uint8_t {
  NONE = 0,
  COLLECT = 1,
  VERIFY = 2,
  HELP = 3,
};

enum class ParseStatus : uint8_t {
  OK = 0,
  MISSING_COMMAND = 1,
  UNKNOWN_COMMAND = 2,
  UNKNOWN_OPTION = 3,
  MISSING_VALUE = 4,
  MISSING_CASE = 5,
  NO_INPUTS = 6,
};

const char *parse_status_name(ParseStatus s);

struct CliOptions {
  Command command;
  CaseInfo info;
  std::string root_dir; // empty: keep the environment default
  bool mock;
  bool report;
  bool upload_plan;
  bool quiet;
  std::vector<std::string> inputs; // evidence files or digest files
};

// argv[0] is the program name. error_message names the offending argument.
ParseStatus parse_cli(int argc, const char *const *argv, CliOptions *out,
                      std::string *error_message);

// Applies --root / --quiet over an environment-derived config
SessionConfig resolve_config(const CliOptions &opts, const SessionConfig &env);

void print_usage(const char *prog);

} // namespace forensics_lab

#endif // FORENSICS_LAB_CLI_OPTIONS_H
