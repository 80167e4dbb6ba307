#include "util/sha256.hpp"

#include <cstring>

namespace {

const uint32_t sha256_k[64] = {
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

inline uint32_t Rotr(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }
inline uint32_t Ch(uint32_t x, uint32_t y, uint32_t z) {
  return (x & y) ^ (~x & z);
}
inline uint32_t Maj(uint32_t x, uint32_t y, uint32_t z) {
  return (x & y) ^ (x & z) ^ (y & z);
}
inline uint32_t F1(uint32_t x) { return Rotr(x, 2) ^ Rotr(x, 13) ^ Rotr(x, 22); }
inline uint32_t F2(uint32_t x) { return Rotr(x, 6) ^ Rotr(x, 11) ^ Rotr(x, 25); }
inline uint32_t F3(uint32_t x) { return Rotr(x, 7) ^ Rotr(x, 18) ^ (x >> 3); }
inline uint32_t F4(uint32_t x) { return Rotr(x, 17) ^ Rotr(x, 19) ^ (x >> 10); }

inline uint32_t Unpack32(const unsigned char* str) {
  return static_cast<uint32_t>(str[3]) | static_cast<uint32_t>(str[2]) << 8 |
         static_cast<uint32_t>(str[1]) << 16 |
         static_cast<uint32_t>(str[0]) << 24;
}

inline void Pack32(uint32_t x, unsigned char* str) {
  str[3] = static_cast<unsigned char>(x);
  str[2] = static_cast<unsigned char>(x >> 8);
  str[1] = static_cast<unsigned char>(x >> 16);
  str[0] = static_cast<unsigned char>(x >> 24);
}

}  // namespace

namespace util {

void SHA256::transform(const unsigned char* message, size_t block_nb) {
  uint32_t w[64];
  uint32_t wv[8];
  for (size_t i = 0; i < block_nb; i++) {
    const unsigned char* sub_block = message + (i << 6);
    for (int j = 0; j < 16; j++) w[j] = Unpack32(&sub_block[j << 2]);
    for (int j = 16; j < 64; j++)
      w[j] = F4(w[j - 2]) + w[j - 7] + F3(w[j - 15]) + w[j - 16];
    for (int j = 0; j < 8; j++) wv[j] = m_h[j];
    for (int j = 0; j < 64; j++) {
      uint32_t t1 = wv[7] + F2(wv[4]) + Ch(wv[4], wv[5], wv[6]) + sha256_k[j] +
                    w[j];
      uint32_t t2 = F1(wv[0]) + Maj(wv[0], wv[1], wv[2]);
      wv[7] = wv[6];
      wv[6] = wv[5];
      wv[5] = wv[4];
      wv[4] = wv[3] + t1;
      wv[3] = wv[2];
      wv[2] = wv[1];
      wv[1] = wv[0];
      wv[0] = t1 + t2;
    }
    for (int j = 0; j < 8; j++) m_h[j] += wv[j];
  }
}

void SHA256::init() {
  m_h[0] = 0x6a09e667;
  m_h[1] = 0xbb67ae85;
  m_h[2] = 0x3c6ef372;
  m_h[3] = 0xa54ff53a;
  m_h[4] = 0x510e527f;
  m_h[5] = 0x9b05688c;
  m_h[6] = 0x1f83d9ab;
  m_h[7] = 0x5be0cd19;
  m_len = 0;
  m_tot_len = 0;
}

void SHA256::update(const unsigned char* message, size_t len) {
  size_t tmp_len = SHA224_256_BLOCK_SIZE - m_len;
  size_t rem_len = len < tmp_len ? len : tmp_len;
  memcpy(&m_block[m_len], message, rem_len);
  if (m_len + len < SHA224_256_BLOCK_SIZE) {
    m_len += len;
    return;
  }
  size_t new_len = len - rem_len;
  size_t block_nb = new_len / SHA224_256_BLOCK_SIZE;
  const unsigned char* shifted_message = message + rem_len;
  transform(m_block, 1);
  transform(shifted_message, block_nb);
  rem_len = new_len % SHA224_256_BLOCK_SIZE;
  memcpy(m_block, &shifted_message[block_nb << 6], rem_len);
  m_len = rem_len;
  m_tot_len += (block_nb + 1) << 6;
}

void SHA256::finalize(unsigned char* digest) {
  size_t block_nb =
      (1 + ((SHA224_256_BLOCK_SIZE - 9) < (m_len % SHA224_256_BLOCK_SIZE)));
  uint64_t len_b = (static_cast<uint64_t>(m_tot_len) + m_len) << 3;
  size_t pm_len = block_nb << 6;
  memset(m_block + m_len, 0, pm_len - m_len);
  m_block[m_len] = 0x80;
  for (int i = 0; i < 8; i++) {
    m_block[pm_len - 1 - i] = static_cast<unsigned char>(len_b >> (8 * i));
  }
  transform(m_block, block_nb);
  for (int i = 0; i < 8; i++) Pack32(m_h[i], &digest[i << 2]);
}

void SHA256::finalize(SHA256_t* digest) { finalize(digest->data()); }

std::string SHA256_t::Hex() const {
  static const char* kDigits = "0123456789abcdef";
  std::string out;
  out.reserve(2 * size());
  for (uint8_t b : *this) {
    out += kDigits[b >> 4];
    out += kDigits[b & 0xf];
  }
  return out;
}

SHA256_t HashString(const std::string& data) {
  SHA256 hasher;
  hasher.update(data);
  SHA256_t digest;
  hasher.finalize(&digest);
  return digest;
}

}  // namespace util
