// evidence_ledger.h
// Ordered, append-only evidence records for one case session
//
// STRICT RULES:
// - Insertion order is the evidence numbering used in reports
// - A record is only accepted if its stored file exists and its digest
//   file parses back to the record's digest and stored path
// - Records are never modified or removed

#ifndef FORENSICS_LAB_EVIDENCE_LEDGER_H
#define FORENSICS_LAB_EVIDENCE_LEDGER_H

#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

#include "file_classifier/file_classifier.h"

namespace forensics_lab {

static constexpr char DIGEST_FILE_EXTENSION[] = ".sha256";

struct EvidenceRecord {
  std::string original_path;
  std::string stored_path;
  std::string digest_path;
  std::string stored_filename;
  std::string original_filename;
  std::string sha256;
  FileDescriptor descriptor;
  time_t processed_at;
};

enum class LedgerStatus : uint8_t {
  OK = 0,
  MISSING_STORED_FILE = 1,
  MISSING_DIGEST_FILE = 2,
  DIGEST_FILE_MISMATCH = 3,
};

const char *ledger_status_name(LedgerStatus s);

struct LedgerSummary {
  int total_files;
  uint64_t total_bytes;
  double total_size_mb; // sum of the per-record rounded MB values
  int category_counts[FILE_CATEGORY_COUNT];
  int distinct_categories;
};

class EvidenceLedger {
public:
  EvidenceLedger() = default;
  EvidenceLedger(const EvidenceLedger &) = delete;
  EvidenceLedger &operator=(const EvidenceLedger &) = delete;

  LedgerStatus append(const EvidenceRecord &record);

  size_t size() const;
  bool empty() const { return size() == 0; }

  // Copy of the records in evidence-number order
  std::vector<EvidenceRecord> snapshot() const;

  // Copies record i into *out; false when out of range.
  // Index 0 is evidence #1.
  bool get(size_t i, EvidenceRecord *out) const;

  LedgerSummary summarize() const;

  // Guards
  static bool can_modify_record() { return false; }
  static bool can_remove_record() { return false; }

private:
  std::vector<EvidenceRecord> records_;
  mutable std::mutex mutex_;
};

// Totals over any record sequence, e.g. a snapshot
LedgerSummary summarize_records(const std::vector<EvidenceRecord> &records);

// =========================================================================
// INTEGRITY VERIFICATION
// =========================================================================

enum class IntegrityStatus : uint8_t {
  VERIFIED = 0,
  MODIFIED = 1,
  STORED_FILE_MISSING = 2,
  DIGEST_FILE_MISSING = 3,
  DIGEST_FILE_MALFORMED = 4,
};

const char *integrity_status_name(IntegrityStatus s);

struct IntegrityResult {
  IntegrityStatus status;
  std::string expected_sha256; // from the digest file
  std::string actual_sha256;   // recomputed from the stored file
  std::string stored_path;
};

// "{hex}  {stored path}\n"
std::string format_digest_line(const std::string &hex,
                               const std::string &stored_path);

// Parses a digest line; false if it does not have the expected shape
bool parse_digest_line(const std::string &line, std::string *hex,
                       std::string *stored_path);

// Re-hash the stored file named inside a digest file
IntegrityResult verify_digest_file(const std::string &digest_path);

// Re-hash a record's stored file against its digest file and its own hex
IntegrityResult verify_record(const EvidenceRecord &record);

} // namespace forensics_lab

#endif // FORENSICS_LAB_EVIDENCE_LEDGER_H
