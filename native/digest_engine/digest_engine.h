// digest_engine.h
// SHA-256 content digest for stored evidence copies
//
// RULES:
// - Digest is always computed over the stored copy, never the source
// - Output is 64 lower-case hex characters
// - No side effects, deterministic

#ifndef FORENSICS_LAB_DIGEST_ENGINE_H
#define FORENSICS_LAB_DIGEST_ENGINE_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace forensics_lab {

static constexpr int SHA256_DIGEST_LENGTH = 32;
static constexpr int SHA256_HEX_LENGTH = 64;

// Incremental SHA-256 (FIPS 180-4)
class Sha256 {
public:
  Sha256();

  void update(const uint8_t *data, size_t len);
  void finish(uint8_t out[SHA256_DIGEST_LENGTH]);

  // Lower-case hex of the final digest. Resets the context.
  std::string finish_hex();

  void reset();

private:
  uint32_t state_[8];
  uint8_t block_[64];
  size_t block_len_;
  uint64_t total_len_;

  void transform(const uint8_t blk[64]);
};

// Digest of an in-memory byte sequence
std::string digest_hex(const uint8_t *data, size_t len);
std::string digest_hex(const std::string &bytes);

// Digest of a file's full contents. Returns false if the file cannot be
// opened or is not read to EOF; error_message then carries the OS error.
bool digest_file_hex(const std::string &path, std::string *out_hex,
                     std::string *error_message);

void hash_to_hex(const uint8_t hash[SHA256_DIGEST_LENGTH],
                 char hex[SHA256_HEX_LENGTH + 1]);

// True for exactly 64 lower-case hex characters
bool is_hex_digest(const std::string &s);

} // namespace forensics_lab

#endif // FORENSICS_LAB_DIGEST_ENGINE_H
