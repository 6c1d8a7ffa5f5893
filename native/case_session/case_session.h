// case_session.h
// Case Session — drives acquire -> hash -> persist digest -> log -> record
//
// STRICT RULES:
// - A ledger entry exists only if its stored copy and digest file exist
// - Every per-file failure is logged and returned, never thrown
// - One bad file never aborts a batch

#ifndef FORENSICS_LAB_CASE_SESSION_H
#define FORENSICS_LAB_CASE_SESSION_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "audit_log/audit_log.h"
#include "case_session/case_layout.h"
#include "evidence_ledger/evidence_ledger.h"
#include "evidence_store/evidence_store.h"

namespace forensics_lab {

struct CaseInfo {
  std::string case_number; // raw, normalized on open
  std::string investigator;
  std::string victim;
  std::string suspect;
  std::string crime_type;
};

enum class SessionStatus : uint8_t {
  OK = 0,
  INVALID_CASE_ID = 1,
  PROVISION_FAILED = 2,
  LOG_UNAVAILABLE = 3,
};

const char *session_status_name(SessionStatus s);

enum class ProcessStatus : uint8_t {
  OK = 0,
  SOURCE_NOT_FOUND = 1,
  CLASSIFICATION_FAILED = 2,
  COPY_FAILED = 3,
  HASH_OR_PERSIST_FAILED = 4,
};

const char *process_status_name(ProcessStatus s);

struct ProcessResult {
  ProcessStatus status;
  std::string source_path;
  EvidenceRecord record; // valid only when status == OK
  std::string error_message;
};

struct BatchResult {
  std::vector<ProcessResult> results; // one per input path, same order
  std::vector<EvidenceRecord> ledger; // full ledger after the batch
  int processed;
  int failed;
};

class CaseSession {
public:
  // Validates the case id, provisions the layout, checks the audit log is
  // writable and logs the case header. Unrecoverable failures return null.
  static std::unique_ptr<CaseSession> open(const CaseInfo &info,
                                           const SessionConfig &config,
                                           SessionStatus *status,
                                           std::string *error_message);

  CaseSession(const CaseSession &) = delete;
  CaseSession &operator=(const CaseSession &) = delete;

  ProcessResult process_evidence_file(const std::string &source_path);
  BatchResult process_evidence_files(const std::vector<std::string> &paths);

  // Logs "Evidence collection completed. Total files: N"
  void complete_collection();

  // Logs "=== CASE {id} COMPLETED SUCCESSFULLY ==="
  void close();

  const CaseIdentifier &case_id() const { return case_id_; }
  const CaseInfo &info() const { return info_; }
  const CaseLayout &layout() const { return layout_; }
  const EvidenceLedger &ledger() const { return ledger_; }
  AuditLog &audit_log() { return log_; }
  bool verbose() const { return config_.verbose; }

  // Stored copies that could not be backed by a ledger record
  const std::vector<std::string> &quarantined() const { return quarantined_; }

  // Test hook for the acquisition clock
  void set_time_source(TimeSource clock) { store_ = EvidenceStore(clock); }

private:
  CaseSession(const CaseInfo &info, const CaseIdentifier &id,
              const CaseLayout &layout, const SessionConfig &config);

  void log(const std::string &message);

  bool write_digest_file(const AcquireResult &acq, const std::string &hex,
                         std::string *out_path, std::string *error_message);
  void quarantine(const std::string &stored_path,
                  const std::string &stored_filename);

  CaseInfo info_;
  CaseIdentifier case_id_;
  CaseLayout layout_;
  SessionConfig config_;
  AuditLog log_;
  EvidenceStore store_;
  EvidenceLedger ledger_;
  std::vector<std::string> quarantined_;
};

// Writes a small text artifact for dry runs; returns its path or "" on error
std::string create_mock_evidence(const std::string &dir,
                                 std::string *error_message);

} // namespace forensics_lab

#endif // FORENSICS_LAB_CASE_SESSION_H
