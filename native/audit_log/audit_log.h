// audit_log.h
// Append-only per-case audit trail
//
// STRICT RULES:
// - One call writes exactly one line: "[YYYY-MM-DD HH:MM:SS] message"
// - File is opened in append mode per call, never held open
// - No entry is ever rewritten, truncated or deleted

#ifndef FORENSICS_LAB_AUDIT_LOG_H
#define FORENSICS_LAB_AUDIT_LOG_H

#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>

namespace forensics_lab {

static constexpr char AUDIT_LOG_FILENAME[] = "case_log.txt";

enum class AuditStatus : uint8_t {
  OK = 0,
  WRITE_FAILED = 1,
};

const char *audit_status_name(AuditStatus s);

class AuditLog {
public:
  explicit AuditLog(const std::string &log_path);

  AuditStatus append(const std::string &message);

  // Opens the log for append and closes it without writing. Used once at
  // session start: no audit trail can exist if this fails.
  bool check_writable(std::string *error_message) const;

  // Number of lines currently in the file, 0 if it does not exist
  int line_count() const;

  const std::string &path() const { return path_; }

  // Echo each entry to stdout as "[AUDIT] message"
  void set_echo(bool echo) { echo_ = echo; }

  static std::string format_entry(time_t when, const std::string &message);

  // Guards
  static bool can_rewrite_entry() { return false; }
  static bool can_delete_entry() { return false; }
  static bool can_truncate_log() { return false; }

private:
  std::string path_;
  bool echo_;
  mutable std::mutex mutex_;
};

} // namespace forensics_lab

#endif // FORENSICS_LAB_AUDIT_LOG_H
