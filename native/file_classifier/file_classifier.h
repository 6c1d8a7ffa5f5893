// file_classifier.h
// Filesystem metadata and coarse media category for evidence files
//
// RULES:
// - Metadata only, file content is never read
// - Category comes from a static table keyed by lower-cased extension

#ifndef FORENSICS_LAB_FILE_CLASSIFIER_H
#define FORENSICS_LAB_FILE_CLASSIFIER_H

#include <cstdint>
#include <ctime>
#include <string>

namespace forensics_lab {

enum class FileCategory : uint8_t {
  IMAGE = 0,
  VIDEO = 1,
  DOCUMENT = 2,
  ARCHIVE = 3,
  UNKNOWN = 4,
};

static constexpr int FILE_CATEGORY_COUNT = 5;

const char *file_category_name(FileCategory c);

struct FileDescriptor {
  std::string filename;
  uint64_t size_bytes;
  double size_mb; // size_bytes / 1 MiB, rounded to 2 decimals
  time_t created;  // st_ctime
  time_t modified; // st_mtime
  std::string mime_type;
  FileCategory category;
  std::string extension; // lower-cased, with leading dot, or empty
};

bool operator==(const FileDescriptor &a, const FileDescriptor &b);

enum class ClassifyStatus : uint8_t {
  OK = 0,
  NOT_FOUND = 1,
  NOT_REGULAR_FILE = 2,
};

const char *classify_status_name(ClassifyStatus s);

struct ClassifyResult {
  ClassifyStatus status;
  FileDescriptor descriptor; // valid only when status == OK
  std::string error_message;
};

ClassifyResult classify_file(const std::string &path);

// Pure helpers, exposed for the store and for tests
std::string base_name(const std::string &path);
std::string lower_extension(const std::string &filename);
FileCategory category_for_extension(const std::string &ext);
std::string mime_type_for_extension(const std::string &ext);
double round_size_mb(uint64_t size_bytes);

} // namespace forensics_lab

#endif // FORENSICS_LAB_FILE_CLASSIFIER_H
