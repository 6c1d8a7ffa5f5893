/*
 * audit_log.cpp — Case Audit Log
 *
 * The only durable chain-of-custody record. Every state-changing operation
 * of a case session lands here, in call order.
 */

#include "audit_log/audit_log.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace forensics_lab {

const char *audit_status_name(AuditStatus s) {
  switch (s) {
  case AuditStatus::OK:
    return "OK";
  case AuditStatus::WRITE_FAILED:
    return "WRITE_FAILED";
  default:
    return "UNKNOWN";
  }
}

AuditLog::AuditLog(const std::string &log_path)
    : path_(log_path), echo_(false) {}

std::string AuditLog::format_entry(time_t when, const std::string &message) {
  struct tm tm_buf;
  localtime_r(&when, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  // Embedded line breaks would split one entry into several
  std::string flat = message;
  for (char &c : flat) {
    if (c == '\n' || c == '\r')
      c = ' ';
  }
  return std::string("[") + ts + "] " + flat + "\n";
}

AuditStatus AuditLog::append(const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string line = format_entry(std::time(nullptr), message);

  FILE *f = std::fopen(path_.c_str(), "a");
  if (!f) {
    std::fprintf(stderr, "ERROR: cannot open audit log %s: %s\n",
                 path_.c_str(), std::strerror(errno));
    return AuditStatus::WRITE_FAILED;
  }

  size_t n = std::fwrite(line.data(), 1, line.size(), f);
  bool ok = n == line.size();
  if (std::fflush(f) != 0)
    ok = false;
  if (std::fclose(f) != 0)
    ok = false;

  if (!ok) {
    std::fprintf(stderr, "ERROR: audit log write failed on %s\n",
                 path_.c_str());
    return AuditStatus::WRITE_FAILED;
  }

  if (echo_)
    std::printf("[AUDIT] %s\n", message.c_str());
  return AuditStatus::OK;
}

bool AuditLog::check_writable(std::string *error_message) const {
  std::lock_guard<std::mutex> lock(mutex_);
  FILE *f = std::fopen(path_.c_str(), "a");
  if (!f) {
    if (error_message)
      *error_message =
          "cannot open audit log " + path_ + ": " + std::strerror(errno);
    return false;
  }
  std::fclose(f);
  return true;
}

int AuditLog::line_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  FILE *f = std::fopen(path_.c_str(), "r");
  if (!f)
    return 0;
  int lines = 0;
  int c;
  while ((c = std::fgetc(f)) != EOF) {
    if (c == '\n')
      lines++;
  }
  std::fclose(f);
  return lines;
}

} // namespace forensics_lab
