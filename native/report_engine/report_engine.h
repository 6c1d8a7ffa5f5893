// report_engine.h
// Case reporting: console summary, HTML report, upload plan
//
// STRICT RULES:
// - Reports only read the ledger, never modify it
// - The HTML integrity badge reflects a real re-verification of every record
// - All case and file text is HTML-escaped before interpolation

#ifndef FORENSICS_LAB_REPORT_ENGINE_H
#define FORENSICS_LAB_REPORT_ENGINE_H

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include "case_session/case_session.h"
#include "evidence_ledger/evidence_ledger.h"

namespace forensics_lab {

static constexpr char UPLOAD_MANIFEST_FILENAME[] = "upload_manifest.txt";

enum class ReportStatus : uint8_t {
  OK = 0,
  NO_EVIDENCE = 1,
  WRITE_FAILED = 2,
};

const char *report_status_name(ReportStatus s);

struct ReportResult {
  ReportStatus status;
  std::string path;     // file written, empty unless OK
  std::string filename; // basename of path
  std::string error_message;
};

// =========================================================================
// EVIDENCE SUMMARY
// =========================================================================

std::string render_evidence_summary(const CaseInfo &info,
                                    const std::vector<EvidenceRecord> &records);

// Renders the summary, prints it when verbose and logs
// "Evidence summary: N files, X.XX MB total". Empty ledger: returns "".
std::string generate_evidence_summary(CaseSession &session);

// =========================================================================
// HTML REPORT
// =========================================================================

std::string html_escape(const std::string &text);

// forensic_report_case_{id}_{YYYYmmdd_HHMMSS}.html
std::string report_filename(const std::string &case_id, time_t when);

// Counts per category as "{Name}: {n} files ({p.p}%)" in category order
std::vector<std::string> category_breakdown(const LedgerSummary &summary);

struct ReportContext {
  CaseInfo info;
  std::string case_id;
  std::string base_dir;
  std::string filename;
  time_t generated_at;
};

// integrity[i] must be the verification of records[i]
std::string render_html_report(const ReportContext &ctx,
                               const std::vector<EvidenceRecord> &records,
                               const std::vector<IntegrityResult> &integrity);

// Re-verifies every record, writes reports/{report_filename}, logs
// "Professional forensic report generated: {filename}"
ReportResult generate_html_report(CaseSession &session, time_t now);

// =========================================================================
// UPLOAD PLAN
// =========================================================================

struct UploadObject {
  std::string local_path;
  std::string object_key;
};

// case_{id}/evidence/{stored name} and case_{id}/hashes/{digest name}
std::vector<UploadObject>
build_upload_plan(const std::string &case_id,
                  const std::vector<EvidenceRecord> &records);

// Writes reports/upload_manifest.txt ("{local}\t{key}\n" per object).
// Empty ledger: NO_EVIDENCE and "Upload plan skipped: no evidence".
ReportResult write_upload_plan(CaseSession &session);

// Records in the case log that the operator did not request a plan.
void skip_upload_plan(CaseSession &session);

} // namespace forensics_lab

#endif // FORENSICS_LAB_REPORT_ENGINE_H
