/*
 * case_session.cpp — Case Session Orchestration
 *
 * Per file:
 *   1. EvidenceStore::acquire (classify + exclusive copy)
 *   2. Log the copy
 *   3. SHA-256 over the stored copy
 *   4. hashes/{stem}.sha256 = "{hex}  {stored path}\n"
 *   5. Log the hash
 *   6. Ledger append
 * A failure in 2-6 removes the partial digest file and moves the stored
 * copy to quarantine/, so evidence/ only holds ledger-backed files.
 */

#include "case_session/case_session.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <fcntl.h>
#include <unistd.h>

#include "digest_engine/digest_engine.h"

namespace forensics_lab {

static constexpr int MAX_DIGEST_NAME_ATTEMPTS = 1000;

const char *session_status_name(SessionStatus s) {
  switch (s) {
  case SessionStatus::OK:
    return "OK";
  case SessionStatus::INVALID_CASE_ID:
    return "INVALID_CASE_ID";
  case SessionStatus::PROVISION_FAILED:
    return "PROVISION_FAILED";
  case SessionStatus::LOG_UNAVAILABLE:
    return "LOG_UNAVAILABLE";
  default:
    return "UNKNOWN";
  }
}

const char *process_status_name(ProcessStatus s) {
  switch (s) {
  case ProcessStatus::OK:
    return "OK";
  case ProcessStatus::SOURCE_NOT_FOUND:
    return "SOURCE_NOT_FOUND";
  case ProcessStatus::CLASSIFICATION_FAILED:
    return "CLASSIFICATION_FAILED";
  case ProcessStatus::COPY_FAILED:
    return "COPY_FAILED";
  case ProcessStatus::HASH_OR_PERSIST_FAILED:
    return "HASH_OR_PERSIST_FAILED";
  default:
    return "UNKNOWN";
  }
}

static ProcessStatus from_acquire(AcquireStatus s) {
  switch (s) {
  case AcquireStatus::SOURCE_NOT_FOUND:
    return ProcessStatus::SOURCE_NOT_FOUND;
  case AcquireStatus::CLASSIFICATION_FAILED:
    return ProcessStatus::CLASSIFICATION_FAILED;
  case AcquireStatus::COPY_FAILED:
    return ProcessStatus::COPY_FAILED;
  default:
    return ProcessStatus::OK;
  }
}

// Path.stem semantics: drop the last suffix if there is one
static std::string file_stem(const std::string &filename) {
  size_t dot = filename.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 >= filename.size())
    return filename;
  return filename.substr(0, dot);
}

// =========================================================================
// OPEN / CLOSE
// =========================================================================

CaseSession::CaseSession(const CaseInfo &info, const CaseIdentifier &id,
                         const CaseLayout &layout, const SessionConfig &config)
    : info_(info), case_id_(id), layout_(layout), config_(config),
      log_(layout.log_path) {
  log_.set_echo(config.verbose);
}

std::unique_ptr<CaseSession> CaseSession::open(const CaseInfo &info,
                                               const SessionConfig &config,
                                               SessionStatus *status,
                                               std::string *error_message) {
  std::string err;
  CaseIdentifier id;
  if (!CaseIdentifier::normalize(info.case_number, &id, &err)) {
    *status = SessionStatus::INVALID_CASE_ID;
    if (error_message)
      *error_message = err;
    return nullptr;
  }

  CaseLayout layout = CaseLayout::for_case(config.root_dir, id);
  if (!provision_case_layout(layout, &err)) {
    *status = SessionStatus::PROVISION_FAILED;
    if (error_message)
      *error_message = err;
    return nullptr;
  }

  std::unique_ptr<CaseSession> session(
      new CaseSession(info, id, layout, config));
  if (!session->log_.check_writable(&err)) {
    *status = SessionStatus::LOG_UNAVAILABLE;
    if (error_message)
      *error_message = err;
    return nullptr;
  }

  if (config.verbose)
    std::printf("[CASE] Case %s opened at %s\n", id.str().c_str(),
                layout.base_dir.c_str());

  session->log("=== CASE " + id.str() + " STARTED ===");
  session->log("Folders created: " + layout.base_dir);
  session->log("Investigator: " + info.investigator);
  session->log("Victim: " + info.victim);
  session->log("Suspect: " + info.suspect);
  session->log("Crime Type: " + info.crime_type);

  *status = SessionStatus::OK;
  return session;
}

void CaseSession::log(const std::string &message) {
  // append() already reports to stderr; the session keeps going
  if (log_.append(message) != AuditStatus::OK && config_.verbose)
    std::fprintf(stderr, "WARNING: audit entry not persisted: %s\n",
                 message.c_str());
}

void CaseSession::complete_collection() {
  log("Evidence collection completed. Total files: " +
      std::to_string(ledger_.size()));
}

void CaseSession::close() {
  log("=== CASE " + case_id_.str() + " COMPLETED SUCCESSFULLY ===");
}

// =========================================================================
// DIGEST PERSISTENCE / ORPHANS
// =========================================================================

bool CaseSession::write_digest_file(const AcquireResult &acq,
                                    const std::string &hex,
                                    std::string *out_path,
                                    std::string *error_message) {
  std::string stem = file_stem(acq.stored_filename);
  std::string path;
  int fd = -1;
  for (int n = 0; n < MAX_DIGEST_NAME_ATTEMPTS; n++) {
    path = layout_.hashes_dir + "/" + stem +
           (n == 0 ? "" : "_" + std::to_string(n)) + DIGEST_FILE_EXTENSION;
    fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd >= 0 || errno != EEXIST)
      break;
  }
  if (fd < 0) {
    *error_message =
        "cannot create digest file " + path + ": " + std::strerror(errno);
    return false;
  }

  std::string line = format_digest_line(hex, acq.stored_path);
  const char *p = line.data();
  size_t left = line.size();
  bool ok = true;
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      ok = false;
      break;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  if (ok && ::fsync(fd) != 0)
    ok = false;
  if (!ok)
    *error_message =
        "cannot write digest file " + path + ": " + std::strerror(errno);
  if (::close(fd) != 0 && ok) {
    *error_message =
        "cannot close digest file " + path + ": " + std::strerror(errno);
    ok = false;
  }

  if (!ok) {
    ::unlink(path.c_str());
    return false;
  }
  *out_path = path;
  return true;
}

// "{stem}{ext}" for n == 0, else "{stem}_{n}{ext}"
static std::string numbered_name(const std::string &filename, int n) {
  if (n == 0)
    return filename;
  std::string stem = file_stem(filename);
  return stem + "_" + std::to_string(n) + filename.substr(stem.size());
}

void CaseSession::quarantine(const std::string &stored_path,
                             const std::string &stored_filename) {
  // link() fails with EEXIST instead of replacing an earlier orphan
  std::string target;
  bool linked = false;
  int err = 0;
  for (int n = 0; n < MAX_DIGEST_NAME_ATTEMPTS; n++) {
    target = layout_.quarantine_dir + "/" + numbered_name(stored_filename, n);
    if (::link(stored_path.c_str(), target.c_str()) == 0) {
      linked = true;
      break;
    }
    err = errno;
    if (err != EEXIST)
      break;
  }

  if (!linked) {
    log("ERROR: Could not quarantine orphaned copy " + stored_path + ": " +
        std::strerror(err));
    quarantined_.push_back(stored_path);
    return;
  }

  if (::unlink(stored_path.c_str()) != 0) {
    err = errno;
    log("ERROR: Orphaned copy also left at " + stored_path + ": " +
        std::strerror(err));
  }
  log("Orphaned evidence copy quarantined: " + stored_path + " -> " + target);
  quarantined_.push_back(target);
}

// =========================================================================
// PROCESSING
// =========================================================================

ProcessResult CaseSession::process_evidence_file(const std::string &source_path) {
  ProcessResult result;
  result.status = ProcessStatus::OK;
  result.source_path = source_path;

  if (config_.verbose)
    std::printf("[ACQUIRE] Processing evidence file: %s\n",
                source_path.c_str());

  AcquireResult acq = store_.acquire(source_path, layout_.evidence_dir);
  if (acq.status != AcquireStatus::OK) {
    result.status = from_acquire(acq.status);
    if (acq.status == AcquireStatus::COPY_FAILED)
      result.error_message =
          "Failed to process " + source_path + ": " + acq.error_message;
    else
      result.error_message = acq.error_message;
    log("ERROR: " + result.error_message);
    return result;
  }

  // From here on a stored copy exists; failures must not reach the ledger
  std::string error;
  std::string hex;
  std::string digest_path;
  bool ok = true;

  if (log_.append("File copied: " + source_path + " -> " + acq.stored_path) !=
      AuditStatus::OK) {
    error = "audit log unavailable after copy";
    ok = false;
  }

  if (ok && !digest_file_hex(acq.stored_path, &hex, &error))
    ok = false;

  if (ok && !write_digest_file(acq, hex, &digest_path, &error))
    ok = false;

  if (ok && log_.append("Hash calculated for " + acq.stored_filename + ": " +
                        hex) != AuditStatus::OK) {
    error = "audit log unavailable after hashing";
    ok = false;
  }

  EvidenceRecord record;
  if (ok) {
    record.original_path = source_path;
    record.stored_path = acq.stored_path;
    record.digest_path = digest_path;
    record.stored_filename = acq.stored_filename;
    record.original_filename = acq.descriptor.filename;
    record.sha256 = hex;
    record.descriptor = acq.descriptor;
    record.processed_at = std::time(nullptr);

    LedgerStatus ls = ledger_.append(record);
    if (ls != LedgerStatus::OK) {
      error = std::string("ledger rejected record: ") + ledger_status_name(ls);
      ok = false;
    }
  }

  if (!ok) {
    if (!digest_path.empty())
      ::unlink(digest_path.c_str());
    result.status = ProcessStatus::HASH_OR_PERSIST_FAILED;
    result.error_message = "Failed to process " + source_path + ": " + error;
    log("ERROR: " + result.error_message);
    quarantine(acq.stored_path, acq.stored_filename);
    return result;
  }

  if (config_.verbose) {
    std::printf("[ACQUIRE] Evidence processed: %s\n",
                record.stored_filename.c_str());
    std::printf("   Size: %.2f MB\n", record.descriptor.size_mb);
    std::printf("   Type: %s (%s)\n",
                file_category_name(record.descriptor.category),
                record.descriptor.mime_type.c_str());
    std::printf("   Hash: %.16s...\n", record.sha256.c_str());
  }

  result.record = record;
  return result;
}

BatchResult CaseSession::process_evidence_files(
    const std::vector<std::string> &paths) {
  BatchResult batch;
  batch.processed = 0;
  batch.failed = 0;

  for (const std::string &p : paths) {
    ProcessResult r = process_evidence_file(p);
    if (r.status == ProcessStatus::OK) {
      batch.processed++;
    } else {
      batch.failed++;
      if (config_.verbose)
        std::fprintf(stderr, "ERROR: %s [%s]\n", r.error_message.c_str(),
                     process_status_name(r.status));
    }
    batch.results.push_back(r);
  }

  batch.ledger = ledger_.snapshot();
  return batch;
}

// =========================================================================
// MOCK EVIDENCE
// =========================================================================

std::string create_mock_evidence(const std::string &dir,
                                 std::string *error_message) {
  std::string path = dir + "/mock_evidence.txt";
  FILE *f = std::fopen(path.c_str(), "w");
  if (!f) {
    if (error_message)
      *error_message = "cannot create " + path + ": " + std::strerror(errno);
    return "";
  }

  time_t now = std::time(nullptr);
  struct tm tm_buf;
  localtime_r(&now, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::fprintf(f, "DIGITAL EVIDENCE FILE\n");
  std::fprintf(f, "==============================\n");
  std::fprintf(f, "Created: %s\n", ts);
  std::fprintf(f, "\nThis is a test evidence file.\n");
  std::fprintf(f, "In real cases, this would be actual evidence data.\n");
  std::fprintf(f,
               "Examples: phone dumps, computer files, photos, videos, etc.\n");

  if (std::ferror(f) || std::fclose(f) != 0) {
    if (error_message)
      *error_message = "cannot write " + path;
    return "";
  }
  return path;
}

} // namespace forensics_lab
