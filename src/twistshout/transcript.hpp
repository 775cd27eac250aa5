// transcript.hpp
#pragma once

#include "field.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace twistshout {

/* -------------------------------------------------------------------- *
 *  Fiat-Shamir transcript                                               *
 *  state_{i+1} = SHA256(state_i || tag || |label| || label || |m| || m) *
 *  Every challenge is absorbed back into the state, so no two draws     *
 *  can coincide and the sequence can never be rewound.                  *
 * -------------------------------------------------------------------- */
class Transcript {
public:
  using Digest = std::array<uint8_t, 32>;

  explicit Transcript(const std::string &domain) {
    state_.fill(0);
    append("domain", std::vector<uint8_t>(domain.begin(), domain.end()));
  }

  void append(const std::string &label, const std::vector<uint8_t> &bytes) {
    absorb('A', label, bytes);
  }

  void append_field(const std::string &label, const FieldT &x) {
    std::vector<uint8_t> bytes;
    append_field_bytes(bytes, x);
    append(label, bytes);
  }

  void append_fields(const std::string &label, const std::vector<FieldT> &xs) {
    std::vector<uint8_t> bytes;
    bytes.reserve(32 * xs.size());
    for (const auto &x : xs)
      append_field_bytes(bytes, x);
    append(label, bytes);
  }

  void append_point(const std::string &label, const G1 &p) {
    std::vector<uint8_t> bytes;
    append_g1_bytes(bytes, p);
    append(label, bytes);
  }

  void append_u64(const std::string &label, uint64_t v) {
    std::vector<uint8_t> bytes(8);
    for (size_t b = 0; b < 8; ++b)
      bytes[b] = static_cast<uint8_t>((v >> (8 * b)) & 0xff);
    append(label, bytes);
  }

  FieldT challenge(const std::string &label) {
    absorb('C', label, {});
    // 253 low bits of the digest are always below the BN254 group order
    static_assert(FieldT::num_limbs == 4, "expects a 256-bit scalar field");
    libff::bigint<FieldT::num_limbs> b;
    for (size_t i = 0; i < 4; ++i) {
      uint64_t limb = 0;
      for (size_t j = 0; j < 8; ++j)
        limb |= static_cast<uint64_t>(state_[8 * i + j]) << (8 * j);
      b.data[i] = static_cast<mp_limb_t>(limb);
    }
    b.data[3] &= static_cast<mp_limb_t>((1ull << 61) - 1);
    FieldT c(b);
    append_field(label, c);
    return c;
  }

  std::vector<FieldT> challenge_vector(const std::string &label,
                                       size_t count) {
    std::vector<FieldT> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i)
      out.push_back(challenge(label + "_" + std::to_string(i)));
    return out;
  }

  const Digest &state() const { return state_; }

private:
  Digest state_;

  static void put_length(std::vector<uint8_t> &buf, uint64_t len) {
    for (size_t b = 0; b < 8; ++b)
      buf.push_back(static_cast<uint8_t>((len >> (8 * b)) & 0xff));
  }

  void absorb(char tag, const std::string &label,
              const std::vector<uint8_t> &bytes) {
    std::vector<uint8_t> buf;
    buf.reserve(state_.size() + 17 + label.size() + bytes.size());
    buf.insert(buf.end(), state_.begin(), state_.end());
    buf.push_back(static_cast<uint8_t>(tag));
    put_length(buf, label.size());
    buf.insert(buf.end(), label.begin(), label.end());
    put_length(buf, bytes.size());
    buf.insert(buf.end(), bytes.begin(), bytes.end());

    unsigned int out_len = 0;
    if (EVP_Digest(buf.data(), buf.size(), state_.data(), &out_len,
                   EVP_sha256(), nullptr) != 1 ||
        out_len != state_.size())
      throw std::runtime_error("transcript: SHA-256 failed");
  }
};

} // namespace twistshout
