/*
 * file_classifier.cpp — Evidence File Classifier
 *
 * Derives size, timestamps, MIME hint and category from stat() and the
 * file extension. TOCTOU between classify and copy is accepted: this is
 * metadata collection, not a security boundary.
 */

#include "file_classifier/file_classifier.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>

#include <sys/stat.h>

namespace forensics_lab {

// =========================================================================
// TABLES
// =========================================================================

struct CategoryEntry {
  const char *ext;
  FileCategory category;
};

static const CategoryEntry CATEGORY_TABLE[] = {
    {".jpg", FileCategory::IMAGE},     {".jpeg", FileCategory::IMAGE},
    {".png", FileCategory::IMAGE},     {".gif", FileCategory::IMAGE},
    {".bmp", FileCategory::IMAGE},     {".tiff", FileCategory::IMAGE},
    {".mp4", FileCategory::VIDEO},     {".avi", FileCategory::VIDEO},
    {".mov", FileCategory::VIDEO},     {".wmv", FileCategory::VIDEO},
    {".mkv", FileCategory::VIDEO},     {".pdf", FileCategory::DOCUMENT},
    {".doc", FileCategory::DOCUMENT},  {".docx", FileCategory::DOCUMENT},
    {".txt", FileCategory::DOCUMENT},  {".zip", FileCategory::ARCHIVE},
    {".rar", FileCategory::ARCHIVE},   {".7z", FileCategory::ARCHIVE},
};

struct MimeEntry {
  const char *ext;
  const char *mime;
};

static const MimeEntry MIME_TABLE[] = {
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".tiff", "image/tiff"},
    {".tif", "image/tiff"},
    {".mp4", "video/mp4"},
    {".avi", "video/x-msvideo"},
    {".mov", "video/quicktime"},
    {".wmv", "video/x-ms-wmv"},
    {".mkv", "video/x-matroska"},
    {".pdf", "application/pdf"},
    {".doc", "application/msword"},
    {".docx", "application/"
              "vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xls", "application/vnd.ms-excel"},
    {".xlsx",
     "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".txt", "text/plain"},
    {".log", "text/plain"},
    {".csv", "text/csv"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".eml", "message/rfc822"},
    {".zip", "application/zip"},
    {".rar", "application/vnd.rar"},
    {".7z", "application/x-7z-compressed"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".mp3", "audio/mpeg"},
    {".wav", "audio/x-wav"},
};

const char *file_category_name(FileCategory c) {
  switch (c) {
  case FileCategory::IMAGE:
    return "image";
  case FileCategory::VIDEO:
    return "video";
  case FileCategory::DOCUMENT:
    return "document";
  case FileCategory::ARCHIVE:
    return "archive";
  case FileCategory::UNKNOWN:
    return "unknown";
  default:
    return "unknown";
  }
}

const char *classify_status_name(ClassifyStatus s) {
  switch (s) {
  case ClassifyStatus::OK:
    return "OK";
  case ClassifyStatus::NOT_FOUND:
    return "NOT_FOUND";
  case ClassifyStatus::NOT_REGULAR_FILE:
    return "NOT_REGULAR_FILE";
  default:
    return "UNKNOWN";
  }
}

bool operator==(const FileDescriptor &a, const FileDescriptor &b) {
  return a.filename == b.filename && a.size_bytes == b.size_bytes &&
         a.size_mb == b.size_mb && a.created == b.created &&
         a.modified == b.modified && a.mime_type == b.mime_type &&
         a.category == b.category && a.extension == b.extension;
}

// =========================================================================
// PATH HELPERS
// =========================================================================

std::string base_name(const std::string &path) {
  size_t end = path.size();
  while (end > 1 && path[end - 1] == '/')
    end--;
  size_t slash = path.rfind('/', end == 0 ? 0 : end - 1);
  if (slash == std::string::npos)
    return path.substr(0, end);
  return path.substr(slash + 1, end - slash - 1);
}

std::string lower_extension(const std::string &filename) {
  size_t dot = filename.rfind('.');
  // Leading-dot names (".bashrc") and trailing dots have no extension
  if (dot == std::string::npos || dot == 0 || dot + 1 >= filename.size())
    return "";
  std::string ext = filename.substr(dot);
  for (char &c : ext)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

FileCategory category_for_extension(const std::string &ext) {
  for (const CategoryEntry &e : CATEGORY_TABLE) {
    if (ext == e.ext)
      return e.category;
  }
  return FileCategory::UNKNOWN;
}

std::string mime_type_for_extension(const std::string &ext) {
  for (const MimeEntry &e : MIME_TABLE) {
    if (ext == e.ext)
      return e.mime;
  }
  return "unknown";
}

double round_size_mb(uint64_t size_bytes) {
  double mb = static_cast<double>(size_bytes) / (1024.0 * 1024.0);
  return std::round(mb * 100.0) / 100.0;
}

// =========================================================================
// CLASSIFY
// =========================================================================

ClassifyResult classify_file(const std::string &path) {
  ClassifyResult result;
  result.status = ClassifyStatus::NOT_FOUND;
  result.descriptor.size_bytes = 0;
  result.descriptor.size_mb = 0.0;
  result.descriptor.created = 0;
  result.descriptor.modified = 0;
  result.descriptor.category = FileCategory::UNKNOWN;

  struct stat st;
  if (path.empty() || ::stat(path.c_str(), &st) != 0) {
    result.error_message = "cannot stat " + path + ": " +
                           (path.empty() ? "empty path" : std::strerror(errno));
    return result;
  }

  if (!S_ISREG(st.st_mode)) {
    result.status = ClassifyStatus::NOT_REGULAR_FILE;
    result.error_message = path + " is not a regular file";
    return result;
  }

  FileDescriptor &d = result.descriptor;
  d.filename = base_name(path);
  d.size_bytes = static_cast<uint64_t>(st.st_size);
  d.size_mb = round_size_mb(d.size_bytes);
  d.created = st.st_ctime;
  d.modified = st.st_mtime;
  d.extension = lower_extension(d.filename);
  d.mime_type = mime_type_for_extension(d.extension);
  d.category = category_for_extension(d.extension);

  result.status = ClassifyStatus::OK;
  return result;
}

} // namespace forensics_lab
