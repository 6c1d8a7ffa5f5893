/*
 * evidence_ledger.cpp — Evidence Ledger and Integrity Re-verification
 *
 * The ledger is the source of truth handed to reporting and upload.
 * Re-verification is never run implicitly; reporting and the CLI call it.
 */

#include "evidence_ledger/evidence_ledger.h"

#include <cstdio>
#include <cstring>

#include <sys/stat.h>

#include "digest_engine/digest_engine.h"

namespace forensics_lab {

static constexpr size_t MAX_DIGEST_FILE = 16384;

const char *ledger_status_name(LedgerStatus s) {
  switch (s) {
  case LedgerStatus::OK:
    return "OK";
  case LedgerStatus::MISSING_STORED_FILE:
    return "MISSING_STORED_FILE";
  case LedgerStatus::MISSING_DIGEST_FILE:
    return "MISSING_DIGEST_FILE";
  case LedgerStatus::DIGEST_FILE_MISMATCH:
    return "DIGEST_FILE_MISMATCH";
  default:
    return "UNKNOWN";
  }
}

const char *integrity_status_name(IntegrityStatus s) {
  switch (s) {
  case IntegrityStatus::VERIFIED:
    return "VERIFIED";
  case IntegrityStatus::MODIFIED:
    return "MODIFIED";
  case IntegrityStatus::STORED_FILE_MISSING:
    return "STORED_FILE_MISSING";
  case IntegrityStatus::DIGEST_FILE_MISSING:
    return "DIGEST_FILE_MISSING";
  case IntegrityStatus::DIGEST_FILE_MALFORMED:
    return "DIGEST_FILE_MALFORMED";
  default:
    return "UNKNOWN";
  }
}

static bool is_regular_file(const std::string &path) {
  struct stat st;
  return !path.empty() && ::stat(path.c_str(), &st) == 0 &&
         S_ISREG(st.st_mode);
}

static bool read_small_file(const std::string &path, std::string *out) {
  FILE *f = std::fopen(path.c_str(), "rb");
  if (!f)
    return false;
  char buf[MAX_DIGEST_FILE + 1];
  size_t n = std::fread(buf, 1, sizeof(buf), f);
  std::fclose(f);
  if (n > MAX_DIGEST_FILE)
    return false;
  out->assign(buf, n);
  return true;
}

// The digest file must read back as exactly this record's line
static bool digest_file_matches(const EvidenceRecord &record) {
  std::string content;
  std::string hex;
  std::string path;
  if (!read_small_file(record.digest_path, &content) ||
      !parse_digest_line(content, &hex, &path))
    return false;
  return hex == record.sha256 && path == record.stored_path;
}

// =========================================================================
// LEDGER
// =========================================================================

LedgerStatus EvidenceLedger::append(const EvidenceRecord &record) {
  if (!is_regular_file(record.stored_path))
    return LedgerStatus::MISSING_STORED_FILE;
  if (!is_regular_file(record.digest_path))
    return LedgerStatus::MISSING_DIGEST_FILE;
  if (!digest_file_matches(record))
    return LedgerStatus::DIGEST_FILE_MISMATCH;

  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(record);
  return LedgerStatus::OK;
}

size_t EvidenceLedger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::vector<EvidenceRecord> EvidenceLedger::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

bool EvidenceLedger::get(size_t i, EvidenceRecord *out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (i >= records_.size())
    return false;
  *out = records_[i];
  return true;
}

LedgerSummary EvidenceLedger::summarize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return summarize_records(records_);
}

LedgerSummary summarize_records(const std::vector<EvidenceRecord> &records) {
  LedgerSummary s;
  std::memset(&s, 0, sizeof(s));
  s.total_files = static_cast<int>(records.size());
  for (const EvidenceRecord &r : records) {
    s.total_bytes += r.descriptor.size_bytes;
    s.total_size_mb += r.descriptor.size_mb;
    s.category_counts[static_cast<int>(r.descriptor.category)]++;
  }
  for (int c = 0; c < FILE_CATEGORY_COUNT; c++) {
    if (s.category_counts[c] > 0)
      s.distinct_categories++;
  }
  return s;
}

// =========================================================================
// DIGEST FILES
// =========================================================================

std::string format_digest_line(const std::string &hex,
                               const std::string &stored_path) {
  return hex + "  " + stored_path + "\n";
}

bool parse_digest_line(const std::string &line, std::string *hex,
                       std::string *stored_path) {
  const size_t hex_len = SHA256_HEX_LENGTH;
  if (line.size() < hex_len + 4)
    return false;
  if (line[line.size() - 1] != '\n')
    return false;
  if (line.compare(hex_len, 2, "  ") != 0)
    return false;

  std::string h = line.substr(0, hex_len);
  std::string p = line.substr(hex_len + 2, line.size() - hex_len - 3);
  if (!is_hex_digest(h) || p.empty() || p.find('\n') != std::string::npos)
    return false;

  if (hex)
    *hex = h;
  if (stored_path)
    *stored_path = p;
  return true;
}

IntegrityResult verify_digest_file(const std::string &digest_path) {
  IntegrityResult result;
  result.status = IntegrityStatus::DIGEST_FILE_MISSING;

  std::string content;
  if (!is_regular_file(digest_path) || !read_small_file(digest_path, &content))
    return result;

  if (!parse_digest_line(content, &result.expected_sha256,
                         &result.stored_path)) {
    result.status = IntegrityStatus::DIGEST_FILE_MALFORMED;
    return result;
  }

  if (!is_regular_file(result.stored_path)) {
    result.status = IntegrityStatus::STORED_FILE_MISSING;
    return result;
  }

  std::string error;
  if (!digest_file_hex(result.stored_path, &result.actual_sha256, &error)) {
    std::fprintf(stderr, "ERROR: %s\n", error.c_str());
    result.status = IntegrityStatus::STORED_FILE_MISSING;
    return result;
  }

  result.status = result.actual_sha256 == result.expected_sha256
                      ? IntegrityStatus::VERIFIED
                      : IntegrityStatus::MODIFIED;
  return result;
}

IntegrityResult verify_record(const EvidenceRecord &record) {
  IntegrityResult result = verify_digest_file(record.digest_path);
  if (result.status == IntegrityStatus::DIGEST_FILE_MISSING ||
      result.status == IntegrityStatus::DIGEST_FILE_MALFORMED)
    return result;

  // The digest file must describe this record's copy
  if (result.stored_path != record.stored_path) {
    result.status = IntegrityStatus::DIGEST_FILE_MALFORMED;
    return result;
  }
  if (result.status == IntegrityStatus::VERIFIED &&
      result.expected_sha256 != record.sha256)
    result.status = IntegrityStatus::MODIFIED;
  return result;
}

} // namespace forensics_lab
