/*
 * case_layout.cpp — Case Identifier, Layout and Configuration
 *
 * Layout:
 *   {root}/case_{id}/evidence     stored copies
 *   {root}/case_{id}/hashes       {stem}.sha256 digest files
 *   {root}/case_{id}/logs         case_log.txt
 *   {root}/case_{id}/reports      summary / HTML report / upload plan
 *   {root}/case_{id}/quarantine   orphaned copies from failed hashing
 */

#include "case_session/case_layout.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <sys/stat.h>

#include "audit_log/audit_log.h"

namespace forensics_lab {

static constexpr char DEFAULT_ROOT_SUFFIX[] = "/forensics";
static constexpr char FALLBACK_ROOT[] = "./forensics";

// =========================================================================
// CASE IDENTIFIER
// =========================================================================

static bool is_case_char(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
         (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
}

bool CaseIdentifier::normalize(const std::string &raw, CaseIdentifier *out,
                               std::string *error_message) {
  size_t begin = raw.find_first_not_of(" \t\r\n");
  size_t end = raw.find_last_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    if (error_message)
      *error_message = "case number is empty";
    return false;
  }
  std::string trimmed = raw.substr(begin, end - begin + 1);

  if (trimmed.size() > (size_t)CASE_ID_MAX_LEN) {
    if (error_message)
      *error_message = "case number longer than " +
                       std::to_string(CASE_ID_MAX_LEN) + " characters";
    return false;
  }
  for (char c : trimmed) {
    if (!is_case_char(c)) {
      if (error_message)
        *error_message = "case number may only contain letters, digits, "
                         "'_' and '-': " + trimmed;
      return false;
    }
  }

  if (trimmed.size() < (size_t)CASE_ID_WIDTH)
    trimmed.insert(0, CASE_ID_WIDTH - trimmed.size(), '0');

  out->value_ = trimmed;
  return true;
}

// =========================================================================
// LAYOUT
// =========================================================================

CaseLayout CaseLayout::for_case(const std::string &root,
                                const CaseIdentifier &id) {
  std::string r = root;
  while (r.size() > 1 && r[r.size() - 1] == '/')
    r.erase(r.size() - 1);

  CaseLayout l;
  l.base_dir = r + "/case_" + id.str();
  l.evidence_dir = l.base_dir + "/evidence";
  l.hashes_dir = l.base_dir + "/hashes";
  l.logs_dir = l.base_dir + "/logs";
  l.reports_dir = l.base_dir + "/reports";
  l.quarantine_dir = l.base_dir + "/quarantine";
  l.log_path = l.logs_dir + "/" + AUDIT_LOG_FILENAME;
  return l;
}

static bool make_dirs(const std::string &path, std::string *error_message) {
  std::string partial;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t slash = path.find('/', pos);
    if (slash == std::string::npos)
      slash = path.size();
    partial = path.substr(0, slash);
    pos = slash + 1;
    if (partial.empty())
      continue;

    if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      if (error_message)
        *error_message =
            "cannot create " + partial + ": " + std::strerror(errno);
      return false;
    }
  }

  struct stat st;
  if (::stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
    if (error_message)
      *error_message = path + " exists but is not a directory";
    return false;
  }
  return true;
}

bool provision_case_layout(const CaseLayout &layout,
                           std::string *error_message) {
  const std::string *dirs[] = {&layout.evidence_dir, &layout.hashes_dir,
                               &layout.logs_dir, &layout.reports_dir,
                               &layout.quarantine_dir};
  for (const std::string *d : dirs) {
    if (!make_dirs(*d, error_message))
      return false;
  }
  return true;
}

// =========================================================================
// CONFIGURATION
// =========================================================================

SessionConfig SessionConfig::from_environment() {
  SessionConfig cfg;
  cfg.verbose = true;

  const char *root = std::getenv("FORENSICS_LAB_ROOT");
  if (root && root[0] != '\0') {
    cfg.root_dir = root;
  } else {
    const char *home = std::getenv("HOME");
    if (home && home[0] != '\0')
      cfg.root_dir = std::string(home) + DEFAULT_ROOT_SUFFIX;
    else
      cfg.root_dir = FALLBACK_ROOT;
  }

  const char *quiet = std::getenv("FORENSICS_LAB_QUIET");
  if (quiet && std::strcmp(quiet, "1") == 0)
    cfg.verbose = false;

  return cfg;
}

} // namespace forensics_lab
