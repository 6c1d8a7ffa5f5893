/*
 * digest_engine.cpp — SHA-256 Digest Engine
 *
 * Streaming SHA-256 over buffers and files.
 * Files are read in fixed chunks so evidence size is not bounded by memory.
 *
 * NO external dependencies.
 */

#include "digest_engine/digest_engine.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace forensics_lab {

// =========================================================================
// CONSTANTS
// =========================================================================

static constexpr size_t READ_CHUNK = 64 * 1024;

static const uint32_t K256[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1,
    0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786,
    0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147,
    0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a,
    0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

static inline uint32_t rotr(uint32_t x, int n) {
  return (x >> n) | (x << (32 - n));
}

// =========================================================================
// SHA-256 CONTEXT
// =========================================================================

Sha256::Sha256() { reset(); }

void Sha256::reset() {
  static const uint32_t init[8] = {0x6a09e667, 0xbb67ae85, 0x3c6ef372,
                                   0xa54ff53a, 0x510e527f, 0x9b05688c,
                                   0x1f83d9ab, 0x5be0cd19};
  std::memcpy(state_, init, sizeof(state_));
  std::memset(block_, 0, sizeof(block_));
  block_len_ = 0;
  total_len_ = 0;
}

void Sha256::transform(const uint8_t blk[64]) {
  uint32_t w[64];
  for (int i = 0; i < 16; i++)
    w[i] = ((uint32_t)blk[i * 4] << 24) | ((uint32_t)blk[i * 4 + 1] << 16) |
           ((uint32_t)blk[i * 4 + 2] << 8) | ((uint32_t)blk[i * 4 + 3]);
  for (int i = 16; i < 64; i++) {
    uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
    uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }

  uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3];
  uint32_t e = state_[4], f = state_[5], g = state_[6], h = state_[7];

  for (int i = 0; i < 64; i++) {
    uint32_t S1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
    uint32_t ch = (e & f) ^ (~e & g);
    uint32_t t1 = h + S1 + ch + K256[i] + w[i];
    uint32_t S0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
    uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
    uint32_t t2 = S0 + maj;
    h = g;
    g = f;
    f = e;
    e = d + t1;
    d = c;
    c = b;
    b = a;
    a = t1 + t2;
  }

  state_[0] += a;
  state_[1] += b;
  state_[2] += c;
  state_[3] += d;
  state_[4] += e;
  state_[5] += f;
  state_[6] += g;
  state_[7] += h;
}

void Sha256::update(const uint8_t *data, size_t len) {
  if (!data || len == 0)
    return;
  total_len_ += len;

  // Fill a partial block first
  if (block_len_ > 0) {
    size_t take = 64 - block_len_;
    if (take > len)
      take = len;
    std::memcpy(block_ + block_len_, data, take);
    block_len_ += take;
    data += take;
    len -= take;
    if (block_len_ < 64)
      return;
    transform(block_);
    block_len_ = 0;
  }

  while (len >= 64) {
    transform(data);
    data += 64;
    len -= 64;
  }

  if (len > 0) {
    std::memcpy(block_, data, len);
    block_len_ = len;
  }
}

void Sha256::finish(uint8_t out[SHA256_DIGEST_LENGTH]) {
  uint64_t bits = total_len_ * 8;

  block_[block_len_++] = 0x80;
  if (block_len_ > 56) {
    while (block_len_ < 64)
      block_[block_len_++] = 0;
    transform(block_);
    block_len_ = 0;
  }
  while (block_len_ < 56)
    block_[block_len_++] = 0;
  for (int j = 7; j >= 0; j--)
    block_[56 + (7 - j)] = (uint8_t)(bits >> (j * 8));
  transform(block_);

  for (int j = 0; j < 8; j++) {
    out[j * 4] = (uint8_t)(state_[j] >> 24);
    out[j * 4 + 1] = (uint8_t)(state_[j] >> 16);
    out[j * 4 + 2] = (uint8_t)(state_[j] >> 8);
    out[j * 4 + 3] = (uint8_t)(state_[j]);
  }
  reset();
}

std::string Sha256::finish_hex() {
  uint8_t digest[SHA256_DIGEST_LENGTH];
  finish(digest);
  char hex[SHA256_HEX_LENGTH + 1];
  hash_to_hex(digest, hex);
  return std::string(hex);
}

// =========================================================================
// HELPERS
// =========================================================================

void hash_to_hex(const uint8_t hash[SHA256_DIGEST_LENGTH],
                 char hex[SHA256_HEX_LENGTH + 1]) {
  static const char hc[] = "0123456789abcdef";
  for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
    hex[i * 2] = hc[(hash[i] >> 4) & 0xF];
    hex[i * 2 + 1] = hc[hash[i] & 0xF];
  }
  hex[SHA256_HEX_LENGTH] = '\0';
}

bool is_hex_digest(const std::string &s) {
  if (s.size() != (size_t)SHA256_HEX_LENGTH)
    return false;
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
      return false;
  }
  return true;
}

std::string digest_hex(const uint8_t *data, size_t len) {
  Sha256 ctx;
  ctx.update(data, len);
  return ctx.finish_hex();
}

std::string digest_hex(const std::string &bytes) {
  return digest_hex(reinterpret_cast<const uint8_t *>(bytes.data()),
                    bytes.size());
}

bool digest_file_hex(const std::string &path, std::string *out_hex,
                     std::string *error_message) {
  FILE *f = std::fopen(path.c_str(), "rb");
  if (!f) {
    if (error_message)
      *error_message = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }

  Sha256 ctx;
  uint8_t buf[READ_CHUNK];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
    ctx.update(buf, n);

  bool read_error = std::ferror(f) != 0;
  int saved_errno = errno;
  std::fclose(f);

  if (read_error) {
    if (error_message)
      *error_message =
          "read error on " + path + ": " + std::strerror(saved_errno);
    return false;
  }

  if (out_hex)
    *out_hex = ctx.finish_hex();
  return true;
}

} // namespace forensics_lab
