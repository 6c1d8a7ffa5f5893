/*
 * forensics_lab.cpp — Evidence collection command-line tool
 *
 * collect: open case -> process files -> summary -> [report] -> [upload plan]
 * verify:  re-hash stored copies named by digest files
 *
 * Exit codes: 0 ok, 1 session or verification failure, 2 usage error.
 */

#include <cstdio>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

#include "case_session/case_session.h"
#include "cli/cli_options.h"
#include "evidence_ledger/evidence_ledger.h"
#include "report_engine/report_engine.h"

using namespace forensics_lab;

static constexpr int EXIT_OK = 0;
static constexpr int EXIT_FAILURE_STATUS = 1;
static constexpr int EXIT_USAGE = 2;

static int run_collect(const CliOptions &opts) {
  SessionConfig cfg = resolve_config(opts, SessionConfig::from_environment());

  SessionStatus status = SessionStatus::OK;
  std::string err;
  std::unique_ptr<CaseSession> session =
      CaseSession::open(opts.info, cfg, &status, &err);
  if (!session) {
    std::fprintf(stderr, "ABORT: cannot open case %s: %s (%s)\n",
                 opts.info.case_number.c_str(), err.c_str(),
                 session_status_name(status));
    return EXIT_FAILURE_STATUS;
  }

  std::vector<std::string> inputs = opts.inputs;
  if (opts.mock) {
    std::string mock = create_mock_evidence(session->layout().base_dir, &err);
    if (mock.empty())
      std::fprintf(stderr, "WARNING: mock evidence not created: %s\n",
                   err.c_str());
    else
      inputs.push_back(mock);
  }

  BatchResult batch = session->process_evidence_files(inputs);
  session->complete_collection();

  std::string summary = generate_evidence_summary(*session);
  if (summary.empty() && cfg.verbose)
    std::printf("[CASE] No evidence files were processed\n");

  if (opts.report) {
    ReportResult r = generate_html_report(*session, std::time(nullptr));
    if (r.status != ReportStatus::OK)
      std::fprintf(stderr, "WARNING: report skipped: %s\n",
                   r.error_message.c_str());
  }
  if (opts.upload_plan) {
    ReportResult r = write_upload_plan(*session);
    if (r.status == ReportStatus::WRITE_FAILED)
      std::fprintf(stderr, "WARNING: upload plan skipped: %s\n",
                   r.error_message.c_str());
  } else {
    skip_upload_plan(*session);
  }

  session->close();

  std::printf("Case %s: %d processed, %d failed\n",
              session->case_id().str().c_str(), batch.processed, batch.failed);
  for (const ProcessResult &r : batch.results) {
    if (r.status != ProcessStatus::OK)
      std::printf("  FAILED [%s] %s\n", process_status_name(r.status),
                  r.source_path.c_str());
  }
  for (const std::string &q : session->quarantined())
    std::printf("  QUARANTINED %s\n", q.c_str());
  std::printf("Case directory: %s\n", session->layout().base_dir.c_str());
  return EXIT_OK;
}

static int run_verify(const CliOptions &opts) {
  int failures = 0;
  for (const std::string &path : opts.inputs) {
    IntegrityResult r = verify_digest_file(path);
    std::printf("%-21s %s\n", integrity_status_name(r.status), path.c_str());
    if (r.status != IntegrityStatus::VERIFIED)
      failures++;
  }
  return failures == 0 ? EXIT_OK : EXIT_FAILURE_STATUS;
}

int main(int argc, char **argv) {
  CliOptions opts;
  std::string err;
  ParseStatus ps = parse_cli(argc, argv, &opts, &err);
  if (ps != ParseStatus::OK) {
    std::fprintf(stderr, "ERROR: %s\n", err.c_str());
    print_usage(argv[0]);
    return EXIT_USAGE;
  }

  switch (opts.command) {
  case Command::COLLECT:
    return run_collect(opts);
  case Command::VERIFY:
    return run_verify(opts);
  case Command::HELP:
    print_usage(argv[0]);
    return EXIT_OK;
  default:
    print_usage(argv[0]);
    return EXIT_USAGE;
  }
}
