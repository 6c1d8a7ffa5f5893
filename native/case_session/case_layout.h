// case_layout.h
// Case identifier, on-disk case layout and session configuration

#ifndef FORENSICS_LAB_CASE_LAYOUT_H
#define FORENSICS_LAB_CASE_LAYOUT_H

#include <string>

namespace forensics_lab {

static constexpr int CASE_ID_WIDTH = 3;
static constexpr int CASE_ID_MAX_LEN = 32;

// Normalized case number: trimmed, left-zero-padded to CASE_ID_WIDTH.
// Restricted to [A-Za-z0-9_-] because it becomes a directory name.
class CaseIdentifier {
public:
  // False when the raw input is empty or contains other characters
  static bool normalize(const std::string &raw, CaseIdentifier *out,
                        std::string *error_message);

  const std::string &str() const { return value_; }

private:
  std::string value_;
};

struct CaseLayout {
  std::string base_dir; // {root}/case_{id}
  std::string evidence_dir;
  std::string hashes_dir;
  std::string logs_dir;
  std::string reports_dir;
  std::string quarantine_dir;
  std::string log_path; // {logs_dir}/case_log.txt

  static CaseLayout for_case(const std::string &root, const CaseIdentifier &id);
};

// mkdir -p for every layout directory. Idempotent.
bool provision_case_layout(const CaseLayout &layout,
                           std::string *error_message);

// Resolved once by the caller and handed to the session
struct SessionConfig {
  std::string root_dir;
  bool verbose;

  // FORENSICS_LAB_ROOT, else $HOME/forensics, else ./forensics;
  // FORENSICS_LAB_QUIET=1 turns console echo off
  static SessionConfig from_environment();
};

} // namespace forensics_lab

#endif // FORENSICS_LAB_CASE_LAYOUT_H
