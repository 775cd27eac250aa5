// kzg.hpp
#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "field.hpp"
#include "multilinear.hpp"
#include "structured.hpp"
#include "transcript.hpp"

#include <libff/algebra/scalar_multiplication/multiexp.hpp>
#include <libff/common/profiling.hpp>

#include <string>
#include <utility>
#include <vector>

namespace twistshout {
namespace kzg {

/* ===================================================================== *
 *  Multilinear KZG (Papamanthou-Shi-Tamassia)                            *
 *  Trapdoor tau = (t_0, ..., t_{n-1}).                                   *
 *  Opening identity, for z in F^n:                                       *
 *     f(X) - f(z) = sum_i (X_i - z_i) q_i(X_{i+1}, ..., X_{n-1})          *
 *  with q_i = f_i(1, .) - f_i(0, .) and f_{i+1} = f_i(z_i, .).           *
 *  SRS: for every suffix level m the Lagrange basis                      *
 *     L^m_b = [eq(t_m..t_{n-1}, b)]G1,  b in {0,1}^{n-m}                 *
 *  so [q(t)]G1 of any suffix polynomial is a multi-exponentiation, plus  *
 *  [t_i]G2 for the pairing check                                         *
 *     e(C - v G1, G2) = prod_i e(pi_i, [t_i - z_i]G2).                   *
 * ===================================================================== */

struct Commitment {
  G1 point;

  bool operator==(const Commitment &other) const { return point == other.point; }
  bool operator!=(const Commitment &other) const { return !(*this == other); }
};

/* n quotient commitments, one per variable */
struct OpeningProof {
  std::vector<G1> quotients;
};

class ProverKey;
class VerifierKey;

inline std::pair<ProverKey, VerifierKey>
setup(size_t n, const std::vector<FieldT> &trapdoor);

class ProverKey {
public:
  ProverKey() : n_(0) {}

  size_t num_variables() const { return n_; }

  /* basis for variables m..n-1; level n is the single point G1 */
  const std::vector<G1> &level(size_t m) const { return lagrange_.at(m); }

  /* key for the last m variables of this one; shares the trapdoor */
  ProverKey trim(size_t m) const {
    if (m > n_)
      throw UnsupportedSize("cannot trim a " + std::to_string(n_) +
                            "-variable key to " + std::to_string(m));
    ProverKey out;
    out.n_ = m;
    out.lagrange_.assign(lagrange_.begin() + (n_ - m), lagrange_.end());
    return out;
  }

private:
  size_t n_;
  std::vector<std::vector<G1>> lagrange_; // lagrange_[m] has 2^{n-m} points

  friend std::pair<ProverKey, VerifierKey>
  setup(size_t n, const std::vector<FieldT> &trapdoor);
};

class VerifierKey {
public:
  VerifierKey() : n_(0) {}

  size_t num_variables() const { return n_; }
  const G1 &g1() const { return g1_; }
  const G2 &g2() const { return g2_; }
  const std::vector<G2> &tau_g2() const { return tau_g2_; }

  VerifierKey trim(size_t m) const {
    if (m > n_)
      throw UnsupportedSize("cannot trim a " + std::to_string(n_) +
                            "-variable key to " + std::to_string(m));
    VerifierKey out;
    out.n_ = m;
    out.g1_ = g1_;
    out.g2_ = g2_;
    out.tau_g2_.assign(tau_g2_.begin() + (n_ - m), tau_g2_.end());
    return out;
  }

private:
  size_t n_;
  G1 g1_;
  G2 g2_;
  std::vector<G2> tau_g2_; // [t_i]G2

  friend std::pair<ProverKey, VerifierKey>
  setup(size_t n, const std::vector<FieldT> &trapdoor);
};

/* Structured reference string from an externally supplied trapdoor.
 * The trapdoor is only read here; callers must destroy it afterwards. */
inline std::pair<ProverKey, VerifierKey>
setup(size_t n, const std::vector<FieldT> &trapdoor) {
  if (n > kMaxVariables)
    throw UnsupportedSize("setup for " + std::to_string(n) +
                          " variables, at most " +
                          std::to_string(kMaxVariables) + " supported");
  if (trapdoor.size() != n)
    throw ShapeMismatch("trapdoor must have one element per variable");

  libff::enter_block("Call to kzg::setup");
  ProverKey pk;
  VerifierKey vk;
  pk.n_ = n;
  vk.n_ = n;

  const size_t scalar_size = FieldT::size_in_bits();
  const size_t total_points = (size_t(2) << n) - 1;
  const size_t window = libff::get_exp_window_size<G1>(total_points);
  libff::window_table<G1> g1_table =
      libff::get_window_table(scalar_size, window, G1::one());

  libff::enter_block("Compute Lagrange bases");
  pk.lagrange_.resize(n + 1);
  for (size_t m = 0; m <= n; ++m) {
    std::vector<FieldT> suffix(trapdoor.begin() + m, trapdoor.end());
    pk.lagrange_[m] =
        libff::batch_exp(scalar_size, window, g1_table, eq_table(suffix));
  }
  libff::leave_block("Compute Lagrange bases");

  vk.g1_ = G1::one();
  vk.g2_ = G2::one();
  vk.tau_g2_.reserve(n);
  for (const auto &t : trapdoor)
    vk.tau_g2_.push_back(t * G2::one());

  libff::leave_block("Call to kzg::setup");
  return {std::move(pk), std::move(vk)};
}

/* Simulated ceremony: samples the trapdoor and drops it on return. */
inline std::pair<ProverKey, VerifierKey> setup(size_t n) {
  std::vector<FieldT> trapdoor(n);
  for (auto &t : trapdoor)
    t = FieldT::random_element();
  auto keys = setup(n, trapdoor);
  for (auto &t : trapdoor)
    t = FieldT::zero();
  return keys;
}

namespace detail {

inline G1 msm(const std::vector<G1> &bases, const std::vector<FieldT> &scalars) {
  return libff::multi_exp<G1, FieldT, kMultiExpMethod>(
      bases.cbegin(), bases.cend(), scalars.cbegin(), scalars.cend(), 1);
}

inline G1 sparse_msm(const std::vector<G1> &bases,
                     const MultilinearExtension::SparseEntries &entries) {
  G1 acc = G1::zero();
  for (const auto &e : entries)
    if (!e.second.is_zero())
      acc = acc + e.second * bases[e.first];
  return acc;
}

inline void check_arity(const ProverKey &pk, const MultilinearExtension &f) {
  if (f.num_variables() != pk.num_variables())
    throw SizeMismatch("polynomial has " + std::to_string(f.num_variables()) +
                       " variables, key supports " +
                       std::to_string(pk.num_variables()));
}

/* e(P, Q) with the identity contributed by a zero operand */
inline void accumulate_miller(GT &acc, const G1 &p, const G2 &q) {
  if (p.is_zero() || q.is_zero())
    return;
  acc = acc * ppT::miller_loop(ppT::precompute_G1(p), ppT::precompute_G2(q));
}

} // namespace detail

/* C = [f(tau)]G1; sparse polynomials cost O(non-zeros) */
inline Commitment commit(const ProverKey &pk, const MultilinearExtension &f) {
  detail::check_arity(pk, f);
  if (f.is_sparse())
    return Commitment{detail::sparse_msm(pk.level(0), f.entries())};
  return Commitment{detail::msm(pk.level(0), f.cube())};
}

inline std::pair<FieldT, OpeningProof>
open(const ProverKey &pk, const MultilinearExtension &f,
     const std::vector<FieldT> &point) {
  detail::check_arity(pk, f);
  const size_t n = pk.num_variables();
  if (point.size() != n)
    throw ShapeMismatch("opening point has " + std::to_string(point.size()) +
                        " coordinates, key supports " + std::to_string(n));

  OpeningProof proof;
  proof.quotients.reserve(n);

  if (f.is_sparse()) {
    MultilinearExtension current = f;
    for (size_t i = 0; i < n; ++i) {
      // q_i(k) = f_i(1, k) - f_i(0, k)
      MultilinearExtension::SparseEntries q;
      for (const auto &e : current.entries()) {
        const FieldT v = (e.first & 1) ? e.second : -e.second;
        auto it = q.find(e.first >> 1);
        if (it == q.end())
          q.emplace(e.first >> 1, v);
        else
          it->second += v;
      }
      proof.quotients.push_back(detail::sparse_msm(pk.level(i + 1), q));
      current = current.bind(point[i], 0);
    }
    return {current.evaluate({}), std::move(proof)};
  }

  std::vector<FieldT> table = f.cube();
  for (size_t i = 0; i < n; ++i) {
    const size_t half = table.size() >> 1;
    std::vector<FieldT> q(half);
    for (size_t k = 0; k < half; ++k)
      q[k] = table[2 * k + 1] - table[2 * k];
    proof.quotients.push_back(detail::msm(pk.level(i + 1), q));
    MultilinearExtension::fold_once_inplace(table, point[i]);
  }
  return {table.front(), std::move(proof)};
}

/* Pairing check; malformed inputs are a rejection, never an exception. */
inline bool verify(const VerifierKey &vk, const Commitment &c,
                   const std::vector<FieldT> &point, const FieldT &value,
                   const OpeningProof &proof) {
  const size_t n = vk.num_variables();
  if (point.size() != n || proof.quotients.size() != n)
    return false;

  // e(C - v G1, G2) * prod_i e(-pi_i, [t_i - z_i]G2) == 1
  GT acc = GT::one();
  detail::accumulate_miller(acc, c.point - value * vk.g1(), vk.g2());
  for (size_t i = 0; i < n; ++i)
    detail::accumulate_miller(acc, -proof.quotients[i],
                              vk.tau_g2()[i] - point[i] * vk.g2());
  return ppT::final_exponentiation(acc) == GT::one();
}

/* Several openings at one shared point, folded with powers of gamma into a
 * single pairing check. gamma must be drawn after all inputs are fixed. */
inline bool batch_verify(const VerifierKey &vk,
                         const std::vector<Commitment> &commitments,
                         const std::vector<FieldT> &point,
                         const std::vector<FieldT> &values,
                         const std::vector<OpeningProof> &proofs,
                         const FieldT &gamma) {
  const size_t n = vk.num_variables();
  const size_t count = commitments.size();
  if (values.size() != count || proofs.size() != count || point.size() != n)
    return false;
  for (const auto &p : proofs)
    if (p.quotients.size() != n)
      return false;

  G1 lhs = G1::zero();
  FieldT combined_value = FieldT::zero();
  std::vector<G1> combined(n, G1::zero());
  FieldT power = FieldT::one();
  for (size_t j = 0; j < count; ++j) {
    lhs = lhs + power * commitments[j].point;
    combined_value += power * values[j];
    for (size_t i = 0; i < n; ++i)
      combined[i] = combined[i] + power * proofs[j].quotients[i];
    power *= gamma;
  }

  GT acc = GT::one();
  detail::accumulate_miller(acc, lhs - combined_value * vk.g1(), vk.g2());
  for (size_t i = 0; i < n; ++i)
    detail::accumulate_miller(acc, -combined[i],
                              vk.tau_g2()[i] - point[i] * vk.g2());
  return ppT::final_exponentiation(acc) == GT::one();
}

/* The {commit, open, verify} capability the protocols are written against.
 * Any other scheme exposing the same members can be swapped in. */
struct MultilinearKZG {
  using ProverKey = kzg::ProverKey;
  using VerifierKey = kzg::VerifierKey;
  using Commitment = kzg::Commitment;
  using OpeningProof = kzg::OpeningProof;

  static std::pair<ProverKey, VerifierKey> setup(size_t n) {
    return kzg::setup(n);
  }

  static Commitment commit(const ProverKey &pk, const MultilinearExtension &f) {
    return kzg::commit(pk, f);
  }

  static std::pair<FieldT, OpeningProof>
  open(const ProverKey &pk, const MultilinearExtension &f,
       const std::vector<FieldT> &point) {
    return kzg::open(pk, f, point);
  }

  static bool verify(const VerifierKey &vk, const Commitment &c,
                     const std::vector<FieldT> &point, const FieldT &value,
                     const OpeningProof &proof) {
    return kzg::verify(vk, c, point, value, proof);
  }

  static bool batch_verify(const VerifierKey &vk,
                           const std::vector<Commitment> &commitments,
                           const std::vector<FieldT> &point,
                           const std::vector<FieldT> &values,
                           const std::vector<OpeningProof> &proofs,
                           const FieldT &gamma) {
    return kzg::batch_verify(vk, commitments, point, values, proofs, gamma);
  }

  static void absorb(Transcript &transcript, const std::string &label,
                     const Commitment &c) {
    transcript.append_point(label, c.point);
  }
};

} // namespace kzg
} // namespace twistshout
