/*
 * cli_options.cpp — forensics_lab command-line parsing
 *
 *   forensics_lab collect --case N [--investigator S] [--victim S]
 *                         [--suspect S] [--crime S] [--root DIR]
 *                         [--mock] [--report] [--upload-plan] [--quiet]
 *                         FILE...
 *   forensics_lab verify DIGEST_FILE...
 */

#include "cli/cli_options.h"

#include <cstdio>
#include <cstring>

namespace forensics_lab {

const char *parse_status_name(ParseStatus s) {
  switch (s) {
  case ParseStatus::OK:
    return "OK";
  case ParseStatus::MISSING_COMMAND:
    return "MISSING_COMMAND";
  case ParseStatus::UNKNOWN_COMMAND:
    return "UNKNOWN_COMMAND";
  case ParseStatus::UNKNOWN_OPTION:
    return "UNKNOWN_OPTION";
  case ParseStatus::MISSING_VALUE:
    return "MISSING_VALUE";
  case ParseStatus::MISSING_CASE:
    return "MISSING_CASE";
  case ParseStatus::NO_INPUTS:
    return "NO_INPUTS";
  default:
    return "UNKNOWN";
  }
}

struct StringOption {
  const char *flag;
  std::string CaseInfo::*field;
};

static const StringOption CASE_OPTIONS[] = {
    {"--case", &CaseInfo::case_number},
    {"--investigator", &CaseInfo::investigator},
    {"--victim", &CaseInfo::victim},
    {"--suspect", &CaseInfo::suspect},
    {"--crime", &CaseInfo::crime_type},
};

static void reset(CliOptions *o) {
  o->command = Command::NONE;
  o->info = CaseInfo();
  o->root_dir.clear();
  o->mock = false;
  o->report = false;
  o->upload_plan = false;
  o->quiet = false;
  o->inputs.clear();
}

static ParseStatus parse_collect(int argc, const char *const *argv,
                                 CliOptions *out, std::string *err) {
  bool files_only = false;
  for (int i = 2; i < argc; i++) {
    const char *a = argv[i];

    if (files_only || a[0] != '-' || a[1] == '\0') {
      out->inputs.push_back(a);
      continue;
    }
    if (std::strcmp(a, "--") == 0) {
      files_only = true;
      continue;
    }

    bool matched = false;
    for (const StringOption &opt : CASE_OPTIONS) {
      if (std::strcmp(a, opt.flag) != 0)
        continue;
      if (i + 1 >= argc) {
        *err = std::string(a) + " requires a value";
        return ParseStatus::MISSING_VALUE;
      }
      out->info.*opt.field = argv[++i];
      matched = true;
      break;
    }
    if (matched)
      continue;

    if (std::strcmp(a, "--root") == 0) {
      if (i + 1 >= argc) {
        *err = "--root requires a value";
        return ParseStatus::MISSING_VALUE;
      }
      out->root_dir = argv[++i];
    } else if (std::strcmp(a, "--mock") == 0) {
      out->mock = true;
    } else if (std::strcmp(a, "--report") == 0) {
      out->report = true;
    } else if (std::strcmp(a, "--upload-plan") == 0) {
      out->upload_plan = true;
    } else if (std::strcmp(a, "--quiet") == 0) {
      out->quiet = true;
    } else {
      *err = std::string("unknown option: ") + a;
      return ParseStatus::UNKNOWN_OPTION;
    }
  }

  if (out->info.case_number.empty()) {
    *err = "--case is required";
    return ParseStatus::MISSING_CASE;
  }
  if (out->inputs.empty() && !out->mock) {
    *err = "no evidence files given (use --mock for a test artifact)";
    return ParseStatus::NO_INPUTS;
  }
  return ParseStatus::OK;
}

ParseStatus parse_cli(int argc, const char *const *argv, CliOptions *out,
                      std::string *error_message) {
  reset(out);
  std::string err;

  if (argc < 2) {
    if (error_message)
      *error_message = "no command given";
    return ParseStatus::MISSING_COMMAND;
  }

  const char *cmd = argv[1];
  ParseStatus status = ParseStatus::OK;
  if (std::strcmp(cmd, "collect") == 0) {
    out->command = Command::COLLECT;
    status = parse_collect(argc, argv, out, &err);
  } else if (std::strcmp(cmd, "verify") == 0) {
    out->command = Command::VERIFY;
    for (int i = 2; i < argc; i++)
      out->inputs.push_back(argv[i]);
    if (out->inputs.empty()) {
      err = "no digest files given";
      status = ParseStatus::NO_INPUTS;
    }
  } else if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 ||
             std::strcmp(cmd, "-h") == 0) {
    out->command = Command::HELP;
  } else {
    err = std::string("unknown command: ") + cmd;
    status = ParseStatus::UNKNOWN_COMMAND;
  }

  if (status != ParseStatus::OK && error_message)
    *error_message = err;
  return status;
}

SessionConfig resolve_config(const CliOptions &opts, const SessionConfig &env) {
  SessionConfig cfg = env;
  if (!opts.root_dir.empty())
    cfg.root_dir = opts.root_dir;
  if (opts.quiet)
    cfg.verbose = false;
  return cfg;
}

void print_usage(const char *prog) {
  std::fprintf(stderr,
               "Usage:\n"
               "  %s collect --case N [--investigator S] [--victim S]\n"
               "      [--suspect S] [--crime S] [--root DIR] [--mock]\n"
               "      [--report] [--upload-plan] [--quiet] FILE...\n"
               "  %s verify DIGEST_FILE...\n"
               "\n"
               "Environment:\n"
               "  FORENSICS_LAB_ROOT   case root (default $HOME/forensics)\n"
               "  FORENSICS_LAB_QUIET  set to 1 to silence console echo\n",
               prog, prog);
}

} // namespace forensics_lab
