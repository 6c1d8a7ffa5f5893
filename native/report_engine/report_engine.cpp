/*
 * report_engine.cpp — Case Report Engine
 *
 * Builds case reports purely from recorded state:
 *   - console evidence summary
 *   - self-contained HTML report with re-verified integrity badge
 *   - upload plan (object keys for stored copies and digest files)
 * NO network access. Upload itself is left to external tooling.
 */

#include "report_engine/report_engine.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <unistd.h>

namespace forensics_lab {

static constexpr char REPORT_PREFIX[] = "forensic_report_case_";
static constexpr char PRODUCT_NAME[] = "Digital Forensics Lab Automation System";

const char *report_status_name(ReportStatus s) {
  switch (s) {
  case ReportStatus::OK:
    return "OK";
  case ReportStatus::NO_EVIDENCE:
    return "NO_EVIDENCE";
  case ReportStatus::WRITE_FAILED:
    return "WRITE_FAILED";
  default:
    return "UNKNOWN";
  }
}

// =========================================================================
// HELPERS
// =========================================================================

static std::string format(const char *fmt, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

static std::string format_time(time_t t, const char *fmt) {
  struct tm tm_buf;
  localtime_r(&t, &tm_buf);
  char buf[64];
  std::strftime(buf, sizeof(buf), fmt, &tm_buf);
  return buf;
}

// "image" -> "Image"
static std::string title_case(const char *name) {
  std::string s = name;
  if (!s.empty() && s[0] >= 'a' && s[0] <= 'z')
    s[0] = static_cast<char>(s[0] - 'a' + 'A');
  return s;
}

static std::string path_basename(const std::string &path) {
  size_t slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

// temp -> fflush -> fsync -> rename
static bool write_file_atomic(const std::string &path, const std::string &body,
                              std::string *error_message) {
  std::string tmp = path + ".tmp";
  FILE *f = std::fopen(tmp.c_str(), "w");
  if (!f) {
    *error_message = "cannot create " + tmp + ": " + std::strerror(errno);
    return false;
  }

  size_t n = std::fwrite(body.data(), 1, body.size(), f);
  bool ok = n == body.size() && std::fflush(f) == 0 && ::fsync(fileno(f)) == 0;
  if (std::fclose(f) != 0)
    ok = false;
  if (!ok) {
    *error_message = "cannot write " + tmp + ": " + std::strerror(errno);
    std::remove(tmp.c_str());
    return false;
  }

  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    *error_message = "cannot rename " + tmp + ": " + std::strerror(errno);
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

static void log_entry(CaseSession &session, const std::string &message) {
  // Failure already reported on stderr by the log itself
  if (session.audit_log().append(message) != AuditStatus::OK &&
      session.verbose())
    std::fprintf(stderr, "WARNING: audit entry not persisted: %s\n",
                 message.c_str());
}

// =========================================================================
// EVIDENCE SUMMARY
// =========================================================================

std::string render_evidence_summary(const CaseInfo &info,
                                    const std::vector<EvidenceRecord> &records) {
  LedgerSummary s = summarize_records(records);
  std::string out;
  out += "EVIDENCE SUMMARY\n";
  out += std::string(40, '=') + "\n";
  out += "Case Number: " + info.case_number + "\n";
  out += "Investigator: " + info.investigator + "\n";
  out += "Total Evidence Files: " + std::to_string(s.total_files) + "\n";
  out += "Total Size: " + format("%.2f", s.total_size_mb) + " MB\n";
  out += "\nFiles by Type:\n";
  for (int c = 0; c < FILE_CATEGORY_COUNT; c++) {
    if (s.category_counts[c] == 0)
      continue;
    out += "  " + title_case(file_category_name(static_cast<FileCategory>(c))) +
           ": " + std::to_string(s.category_counts[c]) + "\n";
  }

  out += "\nEvidence Files:\n";
  for (size_t i = 0; i < records.size(); i++) {
    const EvidenceRecord &r = records[i];
    out += "  " + std::to_string(i + 1) + ". " + r.original_filename + "\n";
    out += "     Size: " + format("%.2f", r.descriptor.size_mb) + " MB\n";
    out += std::string("     Type: ") +
           file_category_name(r.descriptor.category) + "\n";
    out += "     Hash: " + r.sha256.substr(0, 16) + "...\n";
  }
  return out;
}

std::string generate_evidence_summary(CaseSession &session) {
  std::vector<EvidenceRecord> records = session.ledger().snapshot();
  if (records.empty())
    return "";

  CaseInfo info = session.info();
  info.case_number = session.case_id().str();
  std::string text = render_evidence_summary(info, records);
  if (session.verbose())
    std::printf("\n%s", text.c_str());

  LedgerSummary s = summarize_records(records);
  log_entry(session, "Evidence summary: " + std::to_string(s.total_files) +
                         " files, " + format("%.2f", s.total_size_mb) +
                         " MB total");
  return text;
}

// =========================================================================
// HTML REPORT
// =========================================================================

std::string html_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string report_filename(const std::string &case_id, time_t when) {
  return std::string(REPORT_PREFIX) + case_id + "_" +
         format_time(when, "%Y%m%d_%H%M%S") + ".html";
}

std::vector<std::string> category_breakdown(const LedgerSummary &summary) {
  std::vector<std::string> lines;
  if (summary.total_files <= 0)
    return lines;
  for (int c = 0; c < FILE_CATEGORY_COUNT; c++) {
    int n = summary.category_counts[c];
    if (n == 0)
      continue;
    double pct = 100.0 * n / summary.total_files;
    lines.push_back(title_case(file_category_name(static_cast<FileCategory>(c))) +
                    ": " + std::to_string(n) + " files (" +
                    format("%.1f", pct) + "%)");
  }
  return lines;
}

static const char *REPORT_STYLE =
    "body { font-family: 'Segoe UI', Tahoma, sans-serif; line-height: 1.6; "
    "margin: 0; padding: 20px; background-color: #f5f5f5; }\n"
    ".container { max-width: 1200px; margin: 0 auto; background: white; "
    "padding: 30px; border-radius: 10px; }\n"
    ".header { background: #1e3c72; color: white; padding: 30px; "
    "border-radius: 10px; text-align: center; }\n"
    ".section { margin: 30px 0; padding: 20px; border-left: 4px solid #2a5298; "
    "background-color: #f8f9fa; }\n"
    ".case-info, .stats-grid { display: grid; grid-template-columns: "
    "repeat(auto-fit, minmax(200px, 1fr)); gap: 20px; }\n"
    ".info-label { font-weight: bold; color: #1e3c72; text-transform: "
    "uppercase; font-size: 0.9em; }\n"
    ".stat-card { background: #667eea; color: white; padding: 20px; "
    "border-radius: 10px; text-align: center; }\n"
    ".stat-number { font-size: 2.5em; font-weight: bold; }\n"
    ".evidence-table { width: 100%; border-collapse: collapse; }\n"
    ".evidence-table th { background: #1e3c72; color: white; padding: 12px; "
    "text-align: left; }\n"
    ".evidence-table td { padding: 10px 12px; border-bottom: 1px solid #eee; }\n"
    ".file-type { padding: 4px 12px; border-radius: 20px; font-size: 0.85em; "
    "font-weight: bold; text-transform: uppercase; }\n"
    ".type-image { background: #e8f5e8; color: #2e7d32; }\n"
    ".type-video { background: #fff3e0; color: #f57c00; }\n"
    ".type-document { background: #e3f2fd; color: #1976d2; }\n"
    ".type-archive { background: #fce4ec; color: #c2185b; }\n"
    ".type-unknown { background: #f5f5f5; color: #757575; }\n"
    ".hash { font-family: 'Courier New', monospace; word-break: break-all; }\n"
    ".integrity-badge { padding: 6px 12px; color: white; border-radius: 20px; "
    "font-weight: bold; }\n"
    ".verified { background: #4caf50; }\n"
    ".failed { background: #d32f2f; }\n"
    ".neutral { background: #757575; }\n"
    ".footer { margin-top: 40px; text-align: center; color: #666; }\n";

static std::string info_item(const char *label, const std::string &value) {
  return std::string("<div class=\"info-item\"><div class=\"info-label\">") +
         label + "</div><div class=\"info-value\">" + html_escape(value) +
         "</div></div>\n";
}

static std::string stat_card(const std::string &number, const char *label) {
  return "<div class=\"stat-card\"><div class=\"stat-number\">" + number +
         "</div><div class=\"stat-label\">" + label + "</div></div>\n";
}

std::string render_html_report(const ReportContext &ctx,
                               const std::vector<EvidenceRecord> &records,
                               const std::vector<IntegrityResult> &integrity) {
  LedgerSummary s = summarize_records(records);

  int verified = 0;
  for (size_t i = 0; i < records.size() && i < integrity.size(); i++) {
    if (integrity[i].status == IntegrityStatus::VERIFIED)
      verified++;
  }
  bool all_verified =
      integrity.size() == records.size() &&
      verified == static_cast<int>(records.size());

  std::string case_id = html_escape(ctx.case_id);
  std::string h;
  h += "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n";
  h += "<meta charset=\"UTF-8\">\n";
  h += "<title>Digital Forensic Report - Case " + case_id + "</title>\n";
  h += "<style>\n";
  h += REPORT_STYLE;
  h += "</style>\n</head>\n<body>\n<div class=\"container\">\n";

  // Header
  h += "<div class=\"header\">\n<h1>DIGITAL FORENSIC REPORT</h1>\n";
  h += "<h2>Case #" + case_id + "</h2>\n";
  h += "<p>Generated on " +
       format_time(ctx.generated_at, "%B %d, %Y at %I:%M %p") + "</p>\n";
  h += "</div>\n";

  // Case information
  h += "<div class=\"section\">\n<h3>Case Information</h3>\n";
  h += "<div class=\"case-info\">\n";
  h += info_item("Case Number", ctx.case_id);
  h += info_item("Investigator", ctx.info.investigator);
  h += info_item("Victim", ctx.info.victim);
  h += info_item("Suspect", ctx.info.suspect);
  h += info_item("Crime Type", ctx.info.crime_type);
  h += info_item("Report Generated",
                 format_time(ctx.generated_at, "%Y-%m-%d %H:%M:%S"));
  h += "</div>\n</div>\n";

  // Statistics
  h += "<div class=\"section\">\n<h3>Evidence Summary</h3>\n";
  h += "<div class=\"stats-grid\">\n";
  h += stat_card(std::to_string(s.total_files), "Evidence Files");
  h += stat_card(format("%.1f", s.total_size_mb), "Total Size (MB)");
  h += stat_card(std::to_string(s.distinct_categories), "File Types");
  h += stat_card(std::to_string(verified) + "/" +
                     std::to_string(records.size()),
                 "Integrity Verified");
  h += "</div>\n";
  std::vector<std::string> breakdown = category_breakdown(s);
  if (!breakdown.empty()) {
    h += "<h4>File Type Breakdown:</h4>\n<ul>\n";
    for (const std::string &line : breakdown)
      h += "<li>" + html_escape(line) + "</li>\n";
    h += "</ul>\n";
  }
  h += "</div>\n";

  // Inventory
  h += "<div class=\"section\">\n<h3>Evidence Inventory</h3>\n";
  if (records.empty()) {
    h += "<p>No evidence files were processed for this case.</p>\n";
  } else {
    h += "<table class=\"evidence-table\">\n<thead>\n<tr><th>#</th>"
         "<th>Original Filename</th><th>File Type</th><th>Size (MB)</th>"
         "<th>SHA-256 Hash</th><th>Processed Time</th><th>Integrity</th>"
         "</tr>\n</thead>\n<tbody>\n";
    for (size_t i = 0; i < records.size(); i++) {
      const EvidenceRecord &r = records[i];
      const char *cat = file_category_name(r.descriptor.category);
      const char *state = i < integrity.size()
                              ? integrity_status_name(integrity[i].status)
                              : "NOT_CHECKED";
      h += "<tr><td><strong>" + std::to_string(i + 1) + "</strong></td>";
      h += "<td>" + html_escape(r.original_filename) + "</td>";
      h += std::string("<td><span class=\"file-type type-") + cat + "\">" +
           cat + "</span></td>";
      h += "<td>" + format("%.2f", r.descriptor.size_mb) + "</td>";
      h += "<td class=\"hash\">" + html_escape(r.sha256) + "</td>";
      h += "<td>" + format_time(r.processed_at, "%Y-%m-%d %H:%M:%S") + "</td>";
      h += std::string("<td>") + state + "</td></tr>\n";
    }
    h += "</tbody>\n</table>\n";
  }
  h += "</div>\n";

  // Chain of custody
  h += "<div class=\"section\">\n<h3>Chain of Custody &amp; Integrity</h3>\n";
  if (records.empty()) {
    h += "<p><span class=\"integrity-badge neutral\">NO EVIDENCE</span> "
         "Nothing was collected, so there is nothing to verify.</p>\n";
  } else if (all_verified) {
    h += "<p><span class=\"integrity-badge verified\">INTEGRITY VERIFIED"
         "</span> All evidence files were re-hashed with SHA-256 and match "
         "their recorded digests.</p>\n";
  } else {
    h += "<p><span class=\"integrity-badge failed\">INTEGRITY CHECK FAILED"
         "</span> " +
         std::to_string(records.size() - verified) + " of " +
         std::to_string(records.size()) +
         " evidence files do not match their recorded digests.</p>\n";
  }
  h += "<p><strong>Processing Details:</strong></p>\n<ul>\n";
  h += "<li>All files copied to the case evidence directory</li>\n";
  h += "<li>SHA-256 digests calculated and stored per file</li>\n";
  h += "<li>File modification times preserved on stored copies</li>\n";
  h += "<li>Audit trail maintained in logs/case_log.txt</li>\n";
  h += std::string("<li>Files processed by: ") + PRODUCT_NAME + "</li>\n";
  h += "</ul>\n</div>\n";

  // Footer
  h += "<div class=\"footer\">\n";
  h += std::string("<p><strong>") + PRODUCT_NAME + "</strong></p>\n";
  h += "<p>Case Directory: " + html_escape(ctx.base_dir) + "</p>\n";
  h += "<p>Report File: " + html_escape(ctx.filename) + "</p>\n";
  h += "</div>\n</div>\n</body>\n</html>\n";
  return h;
}

ReportResult generate_html_report(CaseSession &session, time_t now) {
  ReportResult result;
  result.status = ReportStatus::OK;

  std::vector<EvidenceRecord> records = session.ledger().snapshot();
  std::vector<IntegrityResult> integrity;
  integrity.reserve(records.size());
  for (const EvidenceRecord &r : records)
    integrity.push_back(verify_record(r));

  ReportContext ctx;
  ctx.info = session.info();
  ctx.case_id = session.case_id().str();
  ctx.base_dir = session.layout().base_dir;
  ctx.filename = report_filename(ctx.case_id, now);
  ctx.generated_at = now;

  std::string path = session.layout().reports_dir + "/" + ctx.filename;
  std::string err;
  if (!write_file_atomic(path, render_html_report(ctx, records, integrity),
                         &err)) {
    result.status = ReportStatus::WRITE_FAILED;
    result.error_message = err;
    std::fprintf(stderr, "ERROR: report not written: %s\n", err.c_str());
    log_entry(session, "ERROR: Report generation failed: " + err);
    return result;
  }

  result.path = path;
  result.filename = ctx.filename;
  if (session.verbose())
    std::printf("[REPORT] HTML report: %s\n", path.c_str());
  log_entry(session, "Professional forensic report generated: " + ctx.filename);
  return result;
}

// =========================================================================
// UPLOAD PLAN
// =========================================================================

std::vector<UploadObject>
build_upload_plan(const std::string &case_id,
                  const std::vector<EvidenceRecord> &records) {
  std::vector<UploadObject> plan;
  std::string prefix = "case_" + case_id + "/";
  for (const EvidenceRecord &r : records) {
    UploadObject ev;
    ev.local_path = r.stored_path;
    ev.object_key = prefix + "evidence/" + r.stored_filename;
    plan.push_back(ev);

    UploadObject dg;
    dg.local_path = r.digest_path;
    dg.object_key = prefix + "hashes/" + path_basename(r.digest_path);
    plan.push_back(dg);
  }
  return plan;
}

ReportResult write_upload_plan(CaseSession &session) {
  ReportResult result;
  std::vector<EvidenceRecord> records = session.ledger().snapshot();
  if (records.empty()) {
    result.status = ReportStatus::NO_EVIDENCE;
    if (session.verbose())
      std::printf("[UPLOAD] No evidence files to upload\n");
    log_entry(session, "Upload plan skipped: no evidence");
    return result;
  }

  std::vector<UploadObject> plan =
      build_upload_plan(session.case_id().str(), records);
  std::string body;
  for (const UploadObject &o : plan)
    body += o.local_path + "\t" + o.object_key + "\n";

  std::string path =
      session.layout().reports_dir + "/" + UPLOAD_MANIFEST_FILENAME;
  std::string err;
  if (!write_file_atomic(path, body, &err)) {
    result.status = ReportStatus::WRITE_FAILED;
    result.error_message = err;
    std::fprintf(stderr, "ERROR: upload plan not written: %s\n", err.c_str());
    log_entry(session, "ERROR: Upload plan failed: " + err);
    return result;
  }

  result.status = ReportStatus::OK;
  result.path = path;
  result.filename = UPLOAD_MANIFEST_FILENAME;
  if (session.verbose())
    std::printf("[UPLOAD] Upload plan: %zu objects -> %s\n", plan.size(),
                path.c_str());
  log_entry(session,
            "Upload plan written: " + std::to_string(plan.size()) + " objects");
  return result;
}

void skip_upload_plan(CaseSession &session) {
  if (session.verbose())
    std::printf("[UPLOAD] Upload plan not requested\n");
  log_entry(session, "Upload plan skipped by operator");
}

} // namespace forensics_lab
