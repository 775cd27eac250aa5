// field.hpp
#pragma once

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include <cstdint>
#include <vector>

namespace twistshout {

using ppT = libff::alt_bn128_pp;
using FieldT = libff::Fr<ppT>;
using G1 = libff::G1<ppT>;
using G2 = libff::G2<ppT>;
using GT = libff::GT<ppT>;

/* must run once per process before any field or group arithmetic */
inline void init_public_params() { ppT::init_public_params(); }

inline FieldT field_from_u64(uint64_t v) {
  libff::bigint<FieldT::num_limbs> b(0ul);
  b.data[0] = static_cast<mp_limb_t>(v);
  return FieldT(b);
}

inline FieldT bit_to_field(bool b) {
  return b ? FieldT::one() : FieldT::zero();
}

/* Little-endian bit expansion: bit i of `index` becomes coordinate i. */
inline std::vector<FieldT> index_to_point(size_t index, size_t n) {
  std::vector<FieldT> p(n);
  for (size_t i = 0; i < n; ++i)
    p[i] = bit_to_field((index >> i) & 1);
  return p;
}

/* Canonical (non-Montgomery) little-endian bytes of a field element. */
inline void append_field_bytes(std::vector<uint8_t> &out, const FieldT &x) {
  const auto repr = x.as_bigint();
  for (mp_size_t i = 0; i < FieldT::num_limbs; ++i) {
    uint64_t limb = static_cast<uint64_t>(repr.data[i]);
    for (size_t b = 0; b < 8; ++b)
      out.push_back(static_cast<uint8_t>((limb >> (8 * b)) & 0xff));
  }
}

/* Affine coordinates of a G1 point; the point at infinity encodes as (0, 1). */
inline void append_g1_bytes(std::vector<uint8_t> &out, const G1 &p) {
  G1 copy = p;
  copy.to_affine_coordinates();
  for (const auto &coord : {copy.X, copy.Y}) {
    const auto repr = coord.as_bigint();
    for (mp_size_t i = 0; i < libff::alt_bn128_Fq::num_limbs; ++i) {
      uint64_t limb = static_cast<uint64_t>(repr.data[i]);
      for (size_t b = 0; b < 8; ++b)
        out.push_back(static_cast<uint8_t>((limb >> (8 * b)) & 0xff));
    }
  }
}

} // namespace twistshout
