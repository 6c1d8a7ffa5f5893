/*
 * test_report_engine.cpp — Tests for summary, HTML report and upload plan
 */

#include "report_engine/report_engine.h"
#include "test_harness.h"

using namespace forensics_lab;

static int tests_passed = 0;
static int tests_failed = 0;

static std::unique_ptr<CaseSession> open_case(const std::string &root,
                                              const std::string &number,
                                              const std::string &investigator) {
  CaseInfo info;
  info.case_number = number;
  info.investigator = investigator;
  info.victim = "Jane <Doe>";
  info.suspect = "J. \"Shadow\" Smith";
  info.crime_type = "Fraud & Theft";

  SessionConfig cfg;
  cfg.root_dir = root;
  cfg.verbose = false;

  SessionStatus status;
  std::string err;
  return CaseSession::open(info, cfg, &status, &err);
}

static bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

static void test_html_escape() {
  ASSERT_EQ(html_escape("<a href=\"x\">&'</a>"),
            std::string("&lt;a href=&quot;x&quot;&gt;&amp;&#39;&lt;/a&gt;"),
            "All markup characters escaped");
  ASSERT_EQ(html_escape("plain text"), std::string("plain text"),
            "Plain text unchanged");
}

static void test_report_filename() {
  std::string name = report_filename("012", 1709979330);
  ASSERT_EQ(name.substr(0, 25), std::string("forensic_report_case_012_"),
            "Report name prefix");
  ASSERT_EQ(name.size(),
            std::string("forensic_report_case_012_YYYYmmdd_HHMMSS.html").size(),
            "Report name has timestamp");
  ASSERT_EQ(name.substr(name.size() - 5), std::string(".html"),
            "Report name extension");
}

static void test_category_breakdown() {
  LedgerSummary s;
  std::memset(&s, 0, sizeof(s));
  s.total_files = 3;
  s.category_counts[(int)FileCategory::IMAGE] = 2;
  s.category_counts[(int)FileCategory::ARCHIVE] = 1;
  std::vector<std::string> lines = category_breakdown(s);
  ASSERT_EQ(lines.size(), (size_t)2, "Only present categories listed");
  ASSERT_EQ(lines[0], std::string("Image: 2 files (66.7%)"), "Image share");
  ASSERT_EQ(lines[1], std::string("Archive: 1 files (33.3%)"), "Archive share");

  s.total_files = 0;
  ASSERT_TRUE(category_breakdown(s).empty(), "Empty ledger has no breakdown");
}

static void test_summary() {
  std::string root = test_harness::make_scratch_dir("report_summary");
  test_harness::write_file(root + "/a.jpg", "aaaa");
  test_harness::write_file(root + "/b.docx", "bbbbbb");

  std::unique_ptr<CaseSession> s = open_case(root, "21", "Ana");
  if (!s) {
    ASSERT_TRUE(false, "Session opens");
    return;
  }
  ASSERT_EQ(generate_evidence_summary(*s), std::string(""),
            "Empty ledger gives no summary");

  s->process_evidence_file(root + "/a.jpg");
  s->process_evidence_file(root + "/b.docx");
  int lines_before = s->audit_log().line_count();

  std::string text = generate_evidence_summary(*s);
  ASSERT_TRUE(contains(text, "Case Number: 021"), "Summary names the case");
  ASSERT_TRUE(contains(text, "Investigator: Ana"), "Summary names investigator");
  ASSERT_TRUE(contains(text, "Total Evidence Files: 2"), "Summary counts files");
  ASSERT_TRUE(contains(text, "  Image: 1\n"), "Image count listed");
  ASSERT_TRUE(contains(text, "  Document: 1\n"), "Document count listed");
  ASSERT_TRUE(contains(text, "  1. a.jpg\n"), "Evidence #1 listed");
  ASSERT_TRUE(contains(text, "  2. b.docx\n"), "Evidence #2 listed");
  EvidenceRecord first;
  ASSERT_TRUE(s->ledger().get(0, &first), "Evidence #1 readable");
  ASSERT_TRUE(contains(text, first.sha256.substr(0, 16) + "..."),
              "Hash prefix listed");

  ASSERT_EQ(s->audit_log().line_count(), lines_before + 1, "Summary logged once");
  ASSERT_TRUE(contains(test_harness::read_file(s->layout().log_path),
                       "Evidence summary: 2 files, 0.00 MB total"),
              "Summary log line");

  test_harness::remove_tree(root);
}

static void test_html_report_verified() {
  std::string root = test_harness::make_scratch_dir("report_html");
  test_harness::write_file(root + "/<evil>.png", "png");
  test_harness::write_file(root + "/clip.mp4", "mp4");

  std::unique_ptr<CaseSession> s = open_case(root, "22", "Ana");
  if (!s) {
    ASSERT_TRUE(false, "Session opens");
    return;
  }
  s->process_evidence_file(root + "/<evil>.png");
  s->process_evidence_file(root + "/clip.mp4");

  ReportResult r = generate_html_report(*s, 1709979330);
  ASSERT_TRUE(r.status == ReportStatus::OK, "Report written");
  ASSERT_EQ(r.filename, report_filename("022", 1709979330), "Report filename");
  ASSERT_EQ(r.path, s->layout().reports_dir + "/" + r.filename,
            "Report lives in reports/");

  std::string html = test_harness::read_file(r.path);
  ASSERT_TRUE(contains(html, "<title>Digital Forensic Report - Case 022"),
              "Title names the case");
  ASSERT_TRUE(contains(html, "Jane &lt;Doe&gt;"), "Victim escaped");
  ASSERT_TRUE(contains(html, "J. &quot;Shadow&quot; Smith"), "Suspect escaped");
  ASSERT_TRUE(contains(html, "Fraud &amp; Theft"), "Crime type escaped");
  ASSERT_TRUE(contains(html, "&lt;evil&gt;.png"), "Filename escaped");
  ASSERT_FALSE(contains(html, "<evil>"), "No raw markup from input");
  ASSERT_TRUE(contains(html, "Image: 1 files (50.0%)"), "Breakdown rendered");
  EvidenceRecord second;
  ASSERT_TRUE(s->ledger().get(1, &second), "Evidence #2 readable");
  ASSERT_TRUE(contains(html, second.sha256), "Full hash rendered");
  ASSERT_TRUE(contains(html, "INTEGRITY VERIFIED"), "Badge shows verified");
  ASSERT_FALSE(test_harness::path_exists(r.path + ".tmp"),
               "Temp file renamed away");
  ASSERT_TRUE(contains(test_harness::read_file(s->layout().log_path),
                       "Professional forensic report generated: " + r.filename),
              "Report logged");

  test_harness::remove_tree(root);
}

static void test_html_report_tampered() {
  std::string root = test_harness::make_scratch_dir("report_tamper");
  test_harness::write_file(root + "/ledger.xlsx", "numbers");

  std::unique_ptr<CaseSession> s = open_case(root, "23", "Ana");
  if (!s) {
    ASSERT_TRUE(false, "Session opens");
    return;
  }
  ProcessResult p = s->process_evidence_file(root + "/ledger.xlsx");
  test_harness::write_file(p.record.stored_path, "numberz");

  ReportResult r = generate_html_report(*s, 1709979330);
  std::string html = test_harness::read_file(r.path);
  ASSERT_FALSE(contains(html, "INTEGRITY VERIFIED"),
               "Tampered evidence never reported verified");
  ASSERT_TRUE(contains(html, "INTEGRITY CHECK FAILED"), "Failure badge shown");
  ASSERT_TRUE(contains(html, "MODIFIED"), "Row shows MODIFIED");

  test_harness::remove_tree(root);
}

static void test_html_report_empty() {
  std::string root = test_harness::make_scratch_dir("report_empty");
  std::unique_ptr<CaseSession> s = open_case(root, "24", "Ana");
  if (!s) {
    ASSERT_TRUE(false, "Session opens");
    return;
  }
  ReportResult r = generate_html_report(*s, 1709979330);
  ASSERT_TRUE(r.status == ReportStatus::OK, "Empty case still reports");
  std::string html = test_harness::read_file(r.path);
  ASSERT_TRUE(contains(html, "No evidence files were processed for this case."),
              "Empty inventory message");
  ASSERT_TRUE(contains(html, "integrity-badge neutral\">NO EVIDENCE"),
              "Empty case gets the neutral badge");
  ASSERT_FALSE(contains(html, "INTEGRITY VERIFIED"),
               "Empty case never claims verified");
  ASSERT_FALSE(contains(html, "INTEGRITY CHECK FAILED"),
               "Empty case is not a failure either");

  test_harness::remove_tree(s->layout().reports_dir);
  ReportResult bad = generate_html_report(*s, 1709979330);
  ASSERT_TRUE(bad.status == ReportStatus::WRITE_FAILED,
              "Missing reports/ is WRITE_FAILED");
  ASSERT_FALSE(bad.error_message.empty(), "Write failure described");

  test_harness::remove_tree(root);
}

static void test_upload_plan() {
  std::string root = test_harness::make_scratch_dir("report_upload");
  test_harness::write_file(root + "/memo.txt", "memo");

  std::unique_ptr<CaseSession> s = open_case(root, "25", "Ana");
  if (!s) {
    ASSERT_TRUE(false, "Session opens");
    return;
  }
  skip_upload_plan(*s);
  ASSERT_TRUE(contains(test_harness::read_file(s->layout().log_path),
                       "Upload plan skipped by operator"),
              "Operator skip logged");
  ASSERT_FALSE(test_harness::path_exists(s->layout().reports_dir + "/" +
                                         UPLOAD_MANIFEST_FILENAME),
               "Operator skip writes no manifest");

  ReportResult skipped = write_upload_plan(*s);
  ASSERT_TRUE(skipped.status == ReportStatus::NO_EVIDENCE,
              "Empty ledger skips upload plan");
  ASSERT_TRUE(contains(test_harness::read_file(s->layout().log_path),
                       "Upload plan skipped: no evidence"),
              "Skip logged");

  ProcessResult p = s->process_evidence_file(root + "/memo.txt");
  std::vector<UploadObject> plan =
      build_upload_plan("025", s->ledger().snapshot());
  ASSERT_EQ(plan.size(), (size_t)2, "Copy and digest per record");
  ASSERT_EQ(plan[0].object_key,
            "case_025/evidence/" + p.record.stored_filename, "Evidence key");
  ASSERT_EQ(plan[0].local_path, p.record.stored_path, "Evidence local path");
  ASSERT_EQ(plan[1].object_key,
            "case_025/hashes/" +
                p.record.digest_path.substr(p.record.digest_path.rfind('/') + 1),
            "Digest key");

  ReportResult r = write_upload_plan(*s);
  ASSERT_TRUE(r.status == ReportStatus::OK, "Upload plan written");
  ASSERT_EQ(test_harness::read_file(r.path),
            plan[0].local_path + "\t" + plan[0].object_key + "\n" +
                plan[1].local_path + "\t" + plan[1].object_key + "\n",
            "Manifest lines are '{local}\\t{key}'");
  ASSERT_TRUE(contains(test_harness::read_file(s->layout().log_path),
                       "Upload plan written: 2 objects"),
              "Plan logged");

  test_harness::remove_tree(root);
}

extern "C" bool test_report_engine() {
  tests_passed = 0;
  tests_failed = 0;

  test_html_escape();
  test_report_filename();
  test_category_breakdown();
  test_summary();
  test_html_report_verified();
  test_html_report_tampered();
  test_html_report_empty();
  test_upload_plan();

  std::printf("  report_engine: %d passed, %d failed\n", tests_passed,
              tests_failed);
  return tests_failed == 0;
}
