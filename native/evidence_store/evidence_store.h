// evidence_store.h
// Copies source files into the case evidence directory
//
// STRICT RULES:
// - Never overwrite an existing stored file
// - A failed copy leaves nothing behind in the evidence directory
// - Descriptor always describes the source, not the copy

#ifndef FORENSICS_LAB_EVIDENCE_STORE_H
#define FORENSICS_LAB_EVIDENCE_STORE_H

#include <cstdint>
#include <ctime>
#include <string>

#include "file_classifier/file_classifier.h"

namespace forensics_lab {

enum class AcquireStatus : uint8_t {
  OK = 0,
  SOURCE_NOT_FOUND = 1,
  CLASSIFICATION_FAILED = 2,
  COPY_FAILED = 3,
};

const char *acquire_status_name(AcquireStatus s);

struct AcquireResult {
  AcquireStatus status;
  std::string stored_path;     // absolute
  std::string stored_filename; // "{YYYYmmdd_HHMMSS}_{name}" or with counter
  FileDescriptor descriptor;   // of the source
  std::string error_message;
};

// Wall-clock source for the stored-name prefix
typedef time_t (*TimeSource)();

time_t system_time_source();

class EvidenceStore {
public:
  EvidenceStore();
  explicit EvidenceStore(TimeSource clock);

  AcquireResult acquire(const std::string &source_path,
                        const std::string &evidence_dir);

  // "{YYYYmmdd_HHMMSS}_{name}", or "{ts}_{n}_{name}" for n > 0
  static std::string stored_name(time_t when, const std::string &filename,
                                 int counter);

  // Guards
  static bool can_overwrite_stored_file() { return false; }

private:
  TimeSource clock_;

  bool copy_exclusive(const std::string &source_path,
                      const std::string &evidence_dir,
                      const std::string &filename, time_t when,
                      std::string *out_path, std::string *out_name,
                      std::string *error_message);
};

} // namespace forensics_lab

#endif // FORENSICS_LAB_EVIDENCE_STORE_H
