// shout.hpp
#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "field.hpp"
#include "kzg.hpp"
#include "lookup_table.hpp"
#include "multilinear.hpp"
#include "structured.hpp"
#include "sumcheck.hpp"
#include "transcript.hpp"

#include <libff/common/profiling.hpp>

#include <string>
#include <utility>
#include <vector>

namespace twistshout {
namespace shout {

/* ===================================================================== *
 *  Shout: read-only lookups                                              *
 *                                                                        *
 *  Table T(a) over log_table variables, zero-padded to 2^log_table.      *
 *  Lookup slot j holds ra(a,j) = [a == index_j] and rv(j); unused slots  *
 *  look up index 0 with value T(0), so every column of ra is one-hot.    *
 *  One degree-3 sum-check over (a,j):                                    *
 *     sum eq(r,j) [ra T + g ra] + eq(z,(a,j)) (ra^2 - ra)                *
 *       = rv(r) + g                                                      *
 *  which batches the read check, the Hamming weight of every column and  *
 *  booleanity of ra.                                                     *
 * ===================================================================== */

struct Parameters {
  size_t log_table;
  size_t log_lookups;

  size_t num_variables() const { return log_table + log_lookups; }
  size_t table_size() const { return size_t(1) << log_table; }
  size_t num_lookups() const { return size_t(1) << log_lookups; }
};

template <class PCS = kzg::MultilinearKZG> struct ProverKey {
  Parameters params;
  typename PCS::ProverKey cell_key;   // log_table + log_lookups variables
  typename PCS::ProverKey lookup_key; // log_lookups variables
  typename PCS::ProverKey table_key;  // log_table variables
};

template <class PCS = kzg::MultilinearKZG> struct VerifierKey {
  Parameters params;
  typename PCS::VerifierKey cell_key;
  typename PCS::VerifierKey lookup_key;
  typename PCS::VerifierKey table_key;
};

template <class PCS = kzg::MultilinearKZG> struct Proof {
  using Commitment = typename PCS::Commitment;
  using OpeningProof = typename PCS::OpeningProof;

  Commitment table, ra, rv;

  FieldT rv_value; // at r
  OpeningProof rv_opening;

  sumcheck::Proof read_check;
  FieldT ra_value; // at rho
  OpeningProof ra_opening;
  FieldT table_value; // at the table half of rho
  OpeningProof table_opening;
};

template <class PCS = kzg::MultilinearKZG>
std::pair<ProverKey<PCS>, VerifierKey<PCS>> setup(const Parameters &params) {
  libff::enter_block("Call to shout::setup");
  auto keys = PCS::setup(params.num_variables());
  ProverKey<PCS> pk{params, keys.first, keys.first.trim(params.log_lookups),
                    keys.first.trim(params.log_table)};
  VerifierKey<PCS> vk{params, keys.second,
                      keys.second.trim(params.log_lookups),
                      keys.second.trim(params.log_table)};
  libff::leave_block("Call to shout::setup");
  return {std::move(pk), std::move(vk)};
}

/* table values zero-padded to 2^log_table */
inline MultilinearExtension table_polynomial(const Parameters &params,
                                             const std::vector<FieldT> &values) {
  if (values.size() > params.table_size())
    throw IndexOutOfBounds("table of " + std::to_string(values.size()) +
                           " entries exceeds 2^" +
                           std::to_string(params.log_table));
  std::vector<FieldT> padded(values);
  padded.resize(params.table_size(), FieldT::zero());
  return MultilinearExtension(padded);
}

/* what a verifier pins a proof against */
template <class PCS = kzg::MultilinearKZG>
typename PCS::Commitment commit_table(const ProverKey<PCS> &pk,
                                      const std::vector<FieldT> &values) {
  return PCS::commit(pk.table_key, table_polynomial(pk.params, values));
}

namespace detail {

enum Operand { kEqCycle, kEqZero, kRa, kTable, kOperands };

inline FieldT read_summand(const std::vector<FieldT> &v, const FieldT &gamma,
                           const FieldT &alpha) {
  return v[kEqCycle] * (v[kRa] * v[kTable] + gamma * v[kRa]) +
         alpha * v[kEqZero] * (v[kRa].squared() - v[kRa]);
}

struct Challenges {
  std::vector<FieldT> r; // log_lookups
  std::vector<FieldT> z; // log_table + log_lookups
  FieldT gamma;
  FieldT alpha; // weight of the booleanity zero-check
};

template <class PCS>
Challenges start_transcript(Transcript &transcript, const Parameters &params,
                            const Proof<PCS> &proof) {
  transcript.append_u64("log_table", params.log_table);
  transcript.append_u64("log_lookups", params.log_lookups);
  PCS::absorb(transcript, "table", proof.table);
  PCS::absorb(transcript, "ra", proof.ra);
  PCS::absorb(transcript, "rv", proof.rv);

  Challenges c;
  c.r = transcript.challenge_vector("r_cycle", params.log_lookups);
  c.z = transcript.challenge_vector("z_zero", params.num_variables());
  c.gamma = transcript.challenge("gamma");
  c.alpha = transcript.challenge("alpha");
  return c;
}

} // namespace detail

/* Committed columns of a set of lookups. */
struct Witness {
  MultilinearExtension table; // log_table variables, dense, zero-padded
  MultilinearExtension ra;    // log_table + log_lookups variables
  MultilinearExtension rv;    // log_lookups variables
};

/* Unused slots look up index 0 so every address column stays one-hot. */
inline Witness encode_lookups(const Parameters &params,
                              const LookupTable &lookups) {
  MultilinearExtension table = table_polynomial(params, lookups.values());
  if (lookups.num_lookups() > params.num_lookups())
    throw IndexOutOfBounds(std::to_string(lookups.num_lookups()) +
                           " lookups exceed 2^" +
                           std::to_string(params.log_lookups) + " slots");
  for (const auto &l : lookups.lookups())
    if (l.index >= params.table_size())
      throw IndexOutOfBounds("lookup index " + std::to_string(l.index) +
                             " outside table of " +
                             std::to_string(params.table_size()) + " entries");

  libff::enter_block("Encode lookups");
  const size_t k = params.log_table;
  std::vector<std::pair<size_t, FieldT>> ra_entries;
  std::vector<FieldT> rv(params.num_lookups(), table.cube()[0]);
  for (size_t j = 0; j < params.num_lookups(); ++j) {
    size_t index = 0;
    if (j < lookups.num_lookups()) {
      index = lookups.lookups()[j].index;
      rv[j] = lookups.lookups()[j].value;
    }
    ra_entries.emplace_back(index + (j << k), FieldT::one());
  }
  MultilinearExtension ra(params.num_variables(), ra_entries);
  libff::leave_block("Encode lookups");
  return {std::move(table), std::move(ra), MultilinearExtension(rv)};
}

template <class PCS = kzg::MultilinearKZG> class Prover {
public:
  explicit Prover(const ProverKey<PCS> &pk) : pk_(pk) {}

  Proof<PCS> prove(const LookupTable &lookups) const {
    return prove(encode_lookups(pk_.params, lookups));
  }

  /* Proves whatever the witness holds; the verifier decides if every
     address column is one-hot. */
  Proof<PCS> prove(const Witness &w) const {
    const Parameters &params = pk_.params;
    const size_t k = params.log_table;
    const MultilinearExtension &table = w.table;
    const MultilinearExtension &ra = w.ra;
    const MultilinearExtension &rv_poly = w.rv;
    if (table.num_variables() != k ||
        ra.num_variables() != params.num_variables() ||
        rv_poly.num_variables() != params.log_lookups)
      throw ShapeMismatch("witness does not match log_table = " +
                          std::to_string(k) + ", log_lookups = " +
                          std::to_string(params.log_lookups));

    libff::enter_block("Call to shout::Prover::prove");

    libff::enter_block("Commit");
    Proof<PCS> proof;
    proof.table = PCS::commit(pk_.table_key, table);
    proof.ra = PCS::commit(pk_.cell_key, ra);
    proof.rv = PCS::commit(pk_.lookup_key, rv_poly);
    libff::leave_block("Commit");

    Transcript transcript(kShoutDomain);
    const detail::Challenges c =
        detail::start_transcript<PCS>(transcript, params, proof);

    auto rv_open = PCS::open(pk_.lookup_key, rv_poly, c.r);
    proof.rv_value = rv_open.first;
    proof.rv_opening = std::move(rv_open.second);
    transcript.append_field("rv_value", proof.rv_value);

    libff::enter_block("Read-checking sum-check");
    std::vector<FieldT> rho;
    {
      const size_t size = size_t(1) << params.num_variables();
      const size_t mask = params.table_size() - 1;
      const std::vector<FieldT> eq_r = eq_table(c.r);
      std::vector<std::vector<FieldT>> tables(detail::kOperands);
      tables[detail::kEqCycle].resize(size);
      tables[detail::kTable].resize(size);
      for (size_t i = 0; i < size; ++i) {
        tables[detail::kEqCycle][i] = eq_r[i >> k];
        tables[detail::kTable][i] = table.cube()[i & mask];
      }
      tables[detail::kEqZero] = eq_table(c.z);
      tables[detail::kRa] = ra.to_dense().cube();

      const FieldT gamma = c.gamma;
      const FieldT alpha = c.alpha;
      sumcheck::Prover sc(std::move(tables), 3,
                          [gamma, alpha](const std::vector<FieldT> &v) {
                            return detail::read_summand(v, gamma, alpha);
                          },
                          3);
      proof.read_check = sumcheck::prove(sc, transcript, rho);
    }
    libff::leave_block("Read-checking sum-check");

    libff::enter_block("Open at rho");
    const std::vector<FieldT> rho_table(rho.begin(), rho.begin() + k);
    auto ra_open = PCS::open(pk_.cell_key, ra, rho);
    auto table_open = PCS::open(pk_.table_key, table, rho_table);
    proof.ra_value = ra_open.first;
    proof.ra_opening = std::move(ra_open.second);
    proof.table_value = table_open.first;
    proof.table_opening = std::move(table_open.second);
    libff::leave_block("Open at rho");

    libff::leave_block("Call to shout::Prover::prove");
    return proof;
  }

private:
  const ProverKey<PCS> &pk_;
};

template <class PCS = kzg::MultilinearKZG> class Verifier {
public:
  explicit Verifier(const VerifierKey<PCS> &vk) : vk_(vk) {}

  bool verify(const Proof<PCS> &proof) const {
    const Parameters &params = vk_.params;
    libff::enter_block("Call to shout::Verifier::verify");
    std::vector<std::string> failures;

    Transcript transcript(kShoutDomain);
    const detail::Challenges c =
        detail::start_transcript<PCS>(transcript, params, proof);

    if (!PCS::verify(vk_.lookup_key, proof.rv, c.r, proof.rv_value,
                     proof.rv_opening))
      failures.push_back("rv opening at r");
    transcript.append_field("rv_value", proof.rv_value);

    sumcheck::Verifier sc(proof.rv_value + c.gamma, params.num_variables(), 3);
    if (!sc.verify(proof.read_check, transcript))
      failures.push_back("read-checking sum-check round " +
                         std::to_string(sc.failed_round()));

    const std::vector<FieldT> &rho = sc.challenges();
    const std::vector<FieldT> rho_table(rho.begin(),
                                        rho.begin() + params.log_table);
    const std::vector<FieldT> rho_cycle(rho.begin() + params.log_table,
                                        rho.end());
    if (!PCS::verify(vk_.cell_key, proof.ra, rho, proof.ra_value,
                     proof.ra_opening))
      failures.push_back("ra opening at rho");
    if (!PCS::verify(vk_.table_key, proof.table, rho_table,
                     proof.table_value, proof.table_opening))
      failures.push_back("table opening at rho");

    std::vector<FieldT> v(detail::kOperands);
    v[detail::kEqCycle] = eq_evaluate(c.r, rho_cycle);
    v[detail::kEqZero] = eq_evaluate(c.z, rho);
    v[detail::kRa] = proof.ra_value;
    v[detail::kTable] = proof.table_value;
    if (detail::read_summand(v, c.gamma, c.alpha) != sc.final_claim())
      failures.push_back("read-checking final claim");

    libff::leave_block("Call to shout::Verifier::verify");
    for (const auto &f : failures)
      sumcheck::report_rejection("shout: " + f);
    return failures.empty();
  }

  /* also requires the proof to be about a specific table */
  bool verify(const Proof<PCS> &proof,
              const typename PCS::Commitment &expected_table) const {
    const bool same_table = proof.table == expected_table;
    const bool ok = verify(proof);
    if (!same_table)
      sumcheck::report_rejection("shout: table commitment differs");
    return ok && same_table;
  }

private:
  const VerifierKey<PCS> &vk_;
};

template <class PCS = kzg::MultilinearKZG>
Proof<PCS> prove(const ProverKey<PCS> &pk, const LookupTable &lookups) {
  return Prover<PCS>(pk).prove(lookups);
}

template <class PCS = kzg::MultilinearKZG>
bool verify(const VerifierKey<PCS> &vk, const Proof<PCS> &proof) {
  return Verifier<PCS>(vk).verify(proof);
}

template <class PCS = kzg::MultilinearKZG>
bool verify(const VerifierKey<PCS> &vk, const Proof<PCS> &proof,
            const typename PCS::Commitment &expected_table) {
  return Verifier<PCS>(vk).verify(proof, expected_table);
}

} // namespace shout

using ShoutParameters = shout::Parameters;
template <class PCS = kzg::MultilinearKZG> using ShoutProof = shout::Proof<PCS>;

} // namespace twistshout
