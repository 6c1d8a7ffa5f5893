/*
 * evidence_store.cpp — Evidence Acquisition Store
 *
 * Copy protocol:
 *   1. Resolve source, classify it
 *   2. Pick "{timestamp}_{name}", adding a counter if the name is taken
 *   3. O_CREAT|O_EXCL destination, byte copy, fsync
 *   4. Carry over permission bits and atime/mtime from the source
 * Any failure after the destination exists unlinks it.
 */

#include "evidence_store/evidence_store.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace forensics_lab {

// =========================================================================
// CONSTANTS
// =========================================================================

static constexpr int MAX_NAME_ATTEMPTS = 1000;
static constexpr size_t COPY_CHUNK = 64 * 1024;

const char *acquire_status_name(AcquireStatus s) {
  switch (s) {
  case AcquireStatus::OK:
    return "OK";
  case AcquireStatus::SOURCE_NOT_FOUND:
    return "SOURCE_NOT_FOUND";
  case AcquireStatus::CLASSIFICATION_FAILED:
    return "CLASSIFICATION_FAILED";
  case AcquireStatus::COPY_FAILED:
    return "COPY_FAILED";
  default:
    return "UNKNOWN";
  }
}

time_t system_time_source() { return std::time(nullptr); }

// =========================================================================
// LOW-LEVEL I/O
// =========================================================================

static std::string errno_text(const char *what, const std::string &path) {
  return std::string(what) + " " + path + ": " + std::strerror(errno);
}

static bool write_all(int fd, const char *buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    buf += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

static bool copy_fd(int src, int dst, std::string *error_message,
                    const std::string &src_path, const std::string &dst_path) {
  char buf[COPY_CHUNK];
  for (;;) {
    ssize_t n = ::read(src, buf, sizeof(buf));
    if (n == 0)
      return true;
    if (n < 0) {
      if (errno == EINTR)
        continue;
      *error_message = errno_text("read failed on", src_path);
      return false;
    }
    if (!write_all(dst, buf, static_cast<size_t>(n))) {
      *error_message = errno_text("write failed on", dst_path);
      return false;
    }
  }
}

// =========================================================================
// EVIDENCE STORE
// =========================================================================

EvidenceStore::EvidenceStore() : clock_(system_time_source) {}

EvidenceStore::EvidenceStore(TimeSource clock)
    : clock_(clock ? clock : system_time_source) {}

std::string EvidenceStore::stored_name(time_t when,
                                       const std::string &filename,
                                       int counter) {
  struct tm tm_buf;
  localtime_r(&when, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", &tm_buf);

  if (counter <= 0)
    return std::string(ts) + "_" + filename;
  return std::string(ts) + "_" + std::to_string(counter) + "_" + filename;
}

AcquireResult EvidenceStore::acquire(const std::string &source_path,
                                     const std::string &evidence_dir) {
  AcquireResult result;
  result.status = AcquireStatus::SOURCE_NOT_FOUND;

  struct stat st;
  if (source_path.empty() || ::stat(source_path.c_str(), &st) != 0) {
    result.error_message = "File not found: " + source_path;
    return result;
  }

  ClassifyResult cls = classify_file(source_path);
  if (cls.status != ClassifyStatus::OK) {
    result.status = AcquireStatus::CLASSIFICATION_FAILED;
    result.error_message = "Could not get file info for: " + source_path +
                           " (" + classify_status_name(cls.status) + ")";
    return result;
  }
  // A digest line is "{hex}  {path}\n"; the name must not break it
  if (cls.descriptor.filename.find_first_of("\r\n") != std::string::npos) {
    result.status = AcquireStatus::CLASSIFICATION_FAILED;
    result.error_message = "Could not get file info for: " + source_path +
                           " (line break in filename)";
    return result;
  }
  result.descriptor = cls.descriptor;

  time_t when = clock_();
  std::string error;
  if (!copy_exclusive(source_path, evidence_dir, cls.descriptor.filename, when,
                      &result.stored_path, &result.stored_filename, &error)) {
    result.status = AcquireStatus::COPY_FAILED;
    result.error_message = error;
    return result;
  }

  result.status = AcquireStatus::OK;
  return result;
}

bool EvidenceStore::copy_exclusive(const std::string &source_path,
                                   const std::string &evidence_dir,
                                   const std::string &filename, time_t when,
                                   std::string *out_path,
                                   std::string *out_name,
                                   std::string *error_message) {
  char abs_dir[PATH_MAX];
  if (!::realpath(evidence_dir.c_str(), abs_dir)) {
    *error_message = errno_text("evidence directory unavailable", evidence_dir);
    return false;
  }

  int src = ::open(source_path.c_str(), O_RDONLY | O_CLOEXEC);
  if (src < 0) {
    *error_message = errno_text("cannot open", source_path);
    return false;
  }

  struct stat src_st;
  if (::fstat(src, &src_st) != 0) {
    *error_message = errno_text("cannot stat", source_path);
    ::close(src);
    return false;
  }

  // Exclusive create: an existing name is never reused
  std::string dst_path;
  std::string dst_name;
  int dst = -1;
  for (int counter = 0; counter < MAX_NAME_ATTEMPTS; counter++) {
    dst_name = stored_name(when, filename, counter);
    dst_path = std::string(abs_dir) + "/" + dst_name;
    dst = ::open(dst_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                 0600);
    if (dst >= 0 || errno != EEXIST)
      break;
  }
  if (dst < 0) {
    if (errno == EEXIST)
      *error_message = "no free stored name for " + filename;
    else
      *error_message = errno_text("cannot create", dst_path);
    ::close(src);
    return false;
  }

  bool ok = copy_fd(src, dst, error_message, source_path, dst_path);
  ::close(src);

  if (ok && ::fsync(dst) != 0) {
    *error_message = errno_text("fsync failed on", dst_path);
    ok = false;
  }
  if (ok && ::fchmod(dst, src_st.st_mode & 07777) != 0) {
    *error_message = errno_text("cannot set mode on", dst_path);
    ok = false;
  }
  if (ok) {
    struct timespec times[2];
    times[0] = src_st.st_atim;
    times[1] = src_st.st_mtim;
    if (::futimens(dst, times) != 0) {
      *error_message = errno_text("cannot set timestamps on", dst_path);
      ok = false;
    }
  }
  if (::close(dst) != 0 && ok) {
    *error_message = errno_text("close failed on", dst_path);
    ok = false;
  }

  if (!ok) {
    // Partial copy is never evidence
    ::unlink(dst_path.c_str());
    return false;
  }

  *out_path = dst_path;
  *out_name = dst_name;
  return true;
}

} // namespace forensics_lab
