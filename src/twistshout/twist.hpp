// twist.hpp
#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "field.hpp"
#include "kzg.hpp"
#include "memory_trace.hpp"
#include "multilinear.hpp"
#include "structured.hpp"
#include "sumcheck.hpp"
#include "transcript.hpp"

#include <libff/common/profiling.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace twistshout {
namespace twist {

/* ===================================================================== *
 *  Twist: read-write memory checking                                     *
 *                                                                        *
 *  K = 2^log_memory cells, T = 2^log_cycles time slots; an operation     *
 *  with timestamp j occupies slot j, idle slots do nothing. Cell index   *
 *  a and slot j are packed as a + (j << log_memory), so the address      *
 *  variables come first and the cycle variables last.                    *
 *                                                                        *
 *  Committed:  ra(a,j), wa(a,j)  one-hot read / write address columns     *
 *              rv(j), wv(j)      read / written value                     *
 *              rf(j), wf(j)      read / write flags                       *
 *              inc(j)            wv(j) - Val(addr_j, j) at writes          *
 *  Virtual:    Val(a,j) = sum_{j'} wa(a,j') inc(j') LT(j',j)              *
 *                                                                        *
 *  Read/write check over (a,j), degree 3:                                *
 *     sum eq(r,j) [ra Val + g wa (wv - Val) + g^2 ra + g^3 wa]           *
 *       + eq(z,(a,j)) [(ra^2-ra) + b(wa^2-wa) + b^2(rf^2-rf)             *
 *                      + b^3(wf^2-wf) + b^4 rf wf]                       *
 *       = rv(r) + g inc(r) + g^2 rf(r) + g^3 wf(r)                        *
 *  Value check over j', degree 3:                                        *
 *     sum wa(rho_a, j') inc(j') LT(j', rho_j) = Val(rho_a, rho_j)        *
 * ===================================================================== */

struct Parameters {
  size_t log_memory;
  size_t log_cycles;

  size_t num_variables() const { return log_memory + log_cycles; }
  size_t memory_size() const { return size_t(1) << log_memory; }
  size_t num_cycles() const { return size_t(1) << log_cycles; }
};

template <class PCS = kzg::MultilinearKZG> struct ProverKey {
  Parameters params;
  typename PCS::ProverKey cell_key;  // log_memory + log_cycles variables
  typename PCS::ProverKey cycle_key; // log_cycles variables
};

template <class PCS = kzg::MultilinearKZG> struct VerifierKey {
  Parameters params;
  typename PCS::VerifierKey cell_key;
  typename PCS::VerifierKey cycle_key;
};

template <class PCS = kzg::MultilinearKZG> struct Proof {
  using Commitment = typename PCS::Commitment;
  using OpeningProof = typename PCS::OpeningProof;

  Commitment ra, wa, rv, wv, inc, rf, wf;

  // rv, inc, rf, wf at the cycle point r
  std::vector<FieldT> cycle_values;
  std::vector<OpeningProof> cycle_openings;

  sumcheck::Proof read_write;
  FieldT val_claim;
  FieldT ra_value, wa_value;
  OpeningProof ra_opening, wa_opening;
  // wv, rf, wf at the cycle half of rho
  std::vector<FieldT> rho_cycle_values;
  std::vector<OpeningProof> rho_cycle_openings;

  sumcheck::Proof val_evaluation;
  FieldT wa_sigma_value, inc_sigma_value;
  OpeningProof wa_sigma_opening, inc_sigma_opening;
};

template <class PCS = kzg::MultilinearKZG>
std::pair<ProverKey<PCS>, VerifierKey<PCS>> setup(const Parameters &params) {
  libff::enter_block("Call to twist::setup");
  auto keys = PCS::setup(params.num_variables());
  ProverKey<PCS> pk{params, keys.first, keys.first.trim(params.log_cycles)};
  VerifierKey<PCS> vk{params, keys.second,
                      keys.second.trim(params.log_cycles)};
  libff::leave_block("Call to twist::setup");
  return {std::move(pk), std::move(vk)};
}

namespace detail {

enum Operand { kEqCycle, kEqZero, kRa, kWa, kVal, kWv, kRf, kWf, kOperands };

/* summand of the read/write check at one point; shared by both sides.
   alpha separates the zero-check from the read/write claim. */
inline FieldT read_write_summand(const std::vector<FieldT> &v,
                                 const FieldT &gamma, const FieldT &beta,
                                 const FieldT &alpha) {
  const FieldT gamma2 = gamma * gamma;
  const FieldT beta2 = beta * beta;
  const FieldT consistency = v[kRa] * v[kVal] +
                             gamma * v[kWa] * (v[kWv] - v[kVal]) +
                             gamma2 * v[kRa] + gamma2 * gamma * v[kWa];
  const FieldT booleanity =
      (v[kRa].squared() - v[kRa]) + beta * (v[kWa].squared() - v[kWa]) +
      beta2 * (v[kRf].squared() - v[kRf]) +
      beta2 * beta * (v[kWf].squared() - v[kWf]) +
      beta2 * beta2 * v[kRf] * v[kWf];
  return v[kEqCycle] * consistency + alpha * v[kEqZero] * booleanity;
}

struct Challenges {
  std::vector<FieldT> r; // log_cycles
  std::vector<FieldT> z; // log_memory + log_cycles
  FieldT gamma;
  FieldT beta;
  FieldT alpha;
};

template <class PCS>
Challenges start_transcript(Transcript &transcript, const Parameters &params,
                            const Proof<PCS> &proof) {
  transcript.append_u64("log_memory", params.log_memory);
  transcript.append_u64("log_cycles", params.log_cycles);
  PCS::absorb(transcript, "ra", proof.ra);
  PCS::absorb(transcript, "wa", proof.wa);
  PCS::absorb(transcript, "rv", proof.rv);
  PCS::absorb(transcript, "wv", proof.wv);
  PCS::absorb(transcript, "inc", proof.inc);
  PCS::absorb(transcript, "rf", proof.rf);
  PCS::absorb(transcript, "wf", proof.wf);

  Challenges c;
  c.r = transcript.challenge_vector("r_cycle", params.log_cycles);
  c.z = transcript.challenge_vector("z_zero", params.num_variables());
  c.gamma = transcript.challenge("gamma");
  c.beta = transcript.challenge("beta");
  c.alpha = transcript.challenge("alpha");
  return c;
}

inline std::vector<FieldT> concat(const std::vector<FieldT> &a,
                                  const std::vector<FieldT> &b) {
  std::vector<FieldT> out(a);
  out.insert(out.end(), b.begin(), b.end());
  return out;
}

} // namespace detail

/* Checks slot and address bounds; timestamps must strictly increase. */
inline void validate_trace(const Parameters &params, const MemoryTrace &trace) {
  size_t previous = 0;
  bool first = true;
  for (const auto &op : trace.operations()) {
    if (op.address >= params.memory_size())
      throw TraceOutOfBounds("address " + std::to_string(op.address) +
                             " outside memory of " +
                             std::to_string(params.memory_size()) + " cells");
    if (op.timestamp >= params.num_cycles())
      throw TraceOutOfBounds("timestamp " + std::to_string(op.timestamp) +
                             " outside " + std::to_string(params.num_cycles()) +
                             " cycles");
    if (!first && op.timestamp <= previous)
      throw TraceOutOfBounds("timestamp " + std::to_string(op.timestamp) +
                             " does not follow " + std::to_string(previous));
    previous = op.timestamp;
    first = false;
  }
}

/* Committed columns of a trace plus the virtual Val table. */
struct Witness {
  MultilinearExtension ra, wa;              // log_memory + log_cycles vars
  MultilinearExtension rv, wv, inc, rf, wf; // log_cycles vars, dense
  std::vector<FieldT> val; // Val(a, j), dense over all variables
};

/* ------------------------------------------------------------------ *
 *  One pass over the slots. Memory starts at zero; Val(., j) is the   *
 *  state before slot j executes, so a read at j sees Val(addr, j).    *
 *  Read values are taken from the trace as given: an inconsistent     *
 *  trace encodes fine and is caught by the read/write check.          *
 * ------------------------------------------------------------------ */
inline Witness encode_trace(const Parameters &params, const MemoryTrace &trace) {
  libff::enter_block("Encode trace");
  const size_t k = params.log_memory;
  const size_t cells = params.memory_size();
  const size_t cycles = params.num_cycles();

  std::vector<std::pair<size_t, FieldT>> ra_entries, wa_entries;
  std::vector<FieldT> rv(cycles, FieldT::zero()), wv(cycles, FieldT::zero());
  std::vector<FieldT> rf(cycles, FieldT::zero()), wf(cycles, FieldT::zero());
  std::vector<FieldT> inc(cycles, FieldT::zero());
  std::vector<FieldT> val(cells * cycles);
  std::vector<FieldT> memory(cells, FieldT::zero());

  const auto &ops = trace.operations();
  size_t next = 0;
  for (size_t j = 0; j < cycles; ++j) {
    std::copy(memory.begin(), memory.end(), val.begin() + (j << k));
    if (next == ops.size() || ops[next].timestamp != j)
      continue;
    const MemoryOp &op = ops[next++];
    const size_t cell = op.address + (j << k);
    if (op.op == OpKind::Write) {
      wa_entries.emplace_back(cell, FieldT::one());
      wv[j] = op.value;
      wf[j] = FieldT::one();
      inc[j] = op.value - memory[op.address];
      memory[op.address] = op.value;
    } else {
      ra_entries.emplace_back(cell, FieldT::one());
      rv[j] = op.value;
      rf[j] = FieldT::one();
    }
  }

  const size_t n = params.num_variables();
  Witness w{MultilinearExtension(n, ra_entries),
            MultilinearExtension(n, wa_entries),
            MultilinearExtension(rv),
            MultilinearExtension(wv),
            MultilinearExtension(inc),
            MultilinearExtension(rf),
            MultilinearExtension(wf),
            std::move(val)};
  libff::leave_block("Encode trace");
  return w;
}

template <class PCS = kzg::MultilinearKZG> class Prover {
public:
  explicit Prover(const ProverKey<PCS> &pk) : pk_(pk) {}

  Proof<PCS> prove(const MemoryTrace &trace) const {
    const Parameters &params = pk_.params;
    validate_trace(params, trace);
    return prove(encode_trace(params, trace));
  }

  /* Proves whatever the witness holds; the verifier decides if it is a
     valid memory trace. */
  Proof<PCS> prove(Witness w) const {
    const Parameters &params = pk_.params;
    const size_t expected = size_t(1) << params.num_variables();
    if (w.val.size() != expected)
      throw ShapeMismatch("Val table has " + std::to_string(w.val.size()) +
                          " entries, expected " + std::to_string(expected));
    for (const auto *p : {&w.ra, &w.wa})
      if (p->num_variables() != params.num_variables())
        throw ShapeMismatch("address column over " +
                            std::to_string(p->num_variables()) + " variables");
    for (const auto *p : {&w.rv, &w.wv, &w.inc, &w.rf, &w.wf})
      if (p->num_variables() != params.log_cycles)
        throw ShapeMismatch("cycle column over " +
                            std::to_string(p->num_variables()) + " variables");
    libff::enter_block("Call to twist::Prover::prove");

    libff::enter_block("Commit");
    Proof<PCS> proof;
    proof.ra = PCS::commit(pk_.cell_key, w.ra);
    proof.wa = PCS::commit(pk_.cell_key, w.wa);
    proof.rv = PCS::commit(pk_.cycle_key, w.rv);
    proof.wv = PCS::commit(pk_.cycle_key, w.wv);
    proof.inc = PCS::commit(pk_.cycle_key, w.inc);
    proof.rf = PCS::commit(pk_.cycle_key, w.rf);
    proof.wf = PCS::commit(pk_.cycle_key, w.wf);
    libff::leave_block("Commit");

    Transcript transcript(kTwistDomain);
    const detail::Challenges c =
        detail::start_transcript<PCS>(transcript, params, proof);

    libff::enter_block("Open at r");
    open_batch(transcript, {&w.rv, &w.inc, &w.rf, &w.wf}, c.r,
               proof.cycle_values, proof.cycle_openings, "cycle_values");
    libff::leave_block("Open at r");

    libff::enter_block("Read/write sum-check");
    std::vector<FieldT> rho;
    {
      const size_t k = params.log_memory;
      const size_t size = size_t(1) << params.num_variables();
      const std::vector<FieldT> eq_r = eq_table(c.r);
      std::vector<std::vector<FieldT>> tables(detail::kOperands);
      tables[detail::kEqCycle].resize(size);
      tables[detail::kWv].resize(size);
      tables[detail::kRf].resize(size);
      tables[detail::kWf].resize(size);
      for (size_t i = 0; i < size; ++i) {
        const size_t j = i >> k;
        tables[detail::kEqCycle][i] = eq_r[j];
        tables[detail::kWv][i] = w.wv.cube()[j];
        tables[detail::kRf][i] = w.rf.cube()[j];
        tables[detail::kWf][i] = w.wf.cube()[j];
      }
      tables[detail::kEqZero] = eq_table(c.z);
      tables[detail::kRa] = w.ra.to_dense().cube();
      tables[detail::kWa] = w.wa.to_dense().cube();
      tables[detail::kVal] = std::move(w.val);

      const FieldT gamma = c.gamma;
      const FieldT beta = c.beta;
      const FieldT alpha = c.alpha;
      sumcheck::Prover sc(std::move(tables), 3,
                          [gamma, beta, alpha](const std::vector<FieldT> &v) {
                            return detail::read_write_summand(v, gamma, beta,
                                                              alpha);
                          },
                          3);
      proof.read_write = sumcheck::prove(sc, transcript, rho);
      proof.val_claim = sc.final_values()[detail::kVal];
    }
    transcript.append_field("val_claim", proof.val_claim);
    libff::leave_block("Read/write sum-check");

    const std::vector<FieldT> rho_cell(rho.begin(),
                                       rho.begin() + params.log_memory);
    const std::vector<FieldT> rho_cycle(rho.begin() + params.log_memory,
                                        rho.end());

    libff::enter_block("Open at rho");
    auto ra_open = PCS::open(pk_.cell_key, w.ra, rho);
    auto wa_open = PCS::open(pk_.cell_key, w.wa, rho);
    proof.ra_value = ra_open.first;
    proof.ra_opening = std::move(ra_open.second);
    proof.wa_value = wa_open.first;
    proof.wa_opening = std::move(wa_open.second);
    transcript.append_fields("rho_cell_values",
                             {proof.ra_value, proof.wa_value});
    open_batch(transcript, {&w.wv, &w.rf, &w.wf}, rho_cycle,
               proof.rho_cycle_values, proof.rho_cycle_openings,
               "rho_cycle_values");
    libff::leave_block("Open at rho");

    libff::enter_block("Value-evaluation sum-check");
    std::vector<FieldT> sigma;
    {
      std::vector<FieldT> wa_row = w.wa.to_dense().cube();
      for (const auto &x : rho_cell)
        MultilinearExtension::fold_once_inplace(wa_row, x);
      std::vector<std::vector<FieldT>> tables;
      tables.push_back(std::move(wa_row));
      tables.push_back(w.inc.cube());
      tables.push_back(
          less_than_table(rho_cycle));
      sumcheck::Prover sc(std::move(tables), 3,
                          [](const std::vector<FieldT> &v) {
                            return v[0] * v[1] * v[2];
                          },
                          3);
      proof.val_evaluation = sumcheck::prove(sc, transcript, sigma);
    }
    libff::leave_block("Value-evaluation sum-check");

    libff::enter_block("Open at sigma");
    auto wa_sigma = PCS::open(pk_.cell_key, w.wa, detail::concat(rho_cell, sigma));
    auto inc_sigma = PCS::open(pk_.cycle_key, w.inc, sigma);
    proof.wa_sigma_value = wa_sigma.first;
    proof.wa_sigma_opening = std::move(wa_sigma.second);
    proof.inc_sigma_value = inc_sigma.first;
    proof.inc_sigma_opening = std::move(inc_sigma.second);
    libff::leave_block("Open at sigma");

    libff::leave_block("Call to twist::Prover::prove");
    return proof;
  }

private:
  const ProverKey<PCS> &pk_;

  /* opens several cycle polynomials at one point and absorbs the values */
  void open_batch(Transcript &transcript,
                  const std::vector<const MultilinearExtension *> &polys,
                  const std::vector<FieldT> &point,
                  std::vector<FieldT> &values,
                  std::vector<typename PCS::OpeningProof> &openings,
                  const std::string &label) const {
    values.clear();
    openings.clear();
    for (const auto *p : polys) {
      auto opened = PCS::open(pk_.cycle_key, *p, point);
      values.push_back(opened.first);
      openings.push_back(std::move(opened.second));
    }
    transcript.append_fields(label, values);
    transcript.challenge("batch_gamma"); // verifier folds the batch with it
  }
};

/* -------------------------------------------------------------------- *
 *  Verifier                                                             *
 *  Replays the transcript and runs every check even after one fails;    *
 *  rejections are reported once verification has finished.             *
 * -------------------------------------------------------------------- */
template <class PCS = kzg::MultilinearKZG> class Verifier {
public:
  explicit Verifier(const VerifierKey<PCS> &vk) : vk_(vk) {}

  bool verify(const Proof<PCS> &proof) const {
    const Parameters &params = vk_.params;
    libff::enter_block("Call to twist::Verifier::verify");
    std::vector<std::string> failures;

    // missing values read as zero; the batched openings reject the shape
    std::vector<FieldT> cycle_values = proof.cycle_values;
    std::vector<FieldT> rho_cycle_values = proof.rho_cycle_values;
    if (cycle_values.size() != 4 || rho_cycle_values.size() != 3)
      failures.push_back("malformed proof");
    cycle_values.resize(4, FieldT::zero());
    rho_cycle_values.resize(3, FieldT::zero());

    Transcript transcript(kTwistDomain);
    const detail::Challenges c =
        detail::start_transcript<PCS>(transcript, params, proof);

    transcript.append_fields("cycle_values", proof.cycle_values);
    const FieldT batch_r = transcript.challenge("batch_gamma");
    if (!PCS::batch_verify(vk_.cycle_key,
                           {proof.rv, proof.inc, proof.rf, proof.wf}, c.r,
                           proof.cycle_values, proof.cycle_openings, batch_r))
      failures.push_back("openings at r");

    const FieldT gamma2 = c.gamma * c.gamma;
    const FieldT claim = cycle_values[0] + c.gamma * cycle_values[1] +
                         gamma2 * cycle_values[2] +
                         gamma2 * c.gamma * cycle_values[3];
    sumcheck::Verifier rw(claim, params.num_variables(), 3);
    if (!rw.verify(proof.read_write, transcript))
      failures.push_back("read/write sum-check round " +
                         std::to_string(rw.failed_round()));
    transcript.append_field("val_claim", proof.val_claim);

    const std::vector<FieldT> &rho = rw.challenges();
    const std::vector<FieldT> rho_cell(rho.begin(),
                                       rho.begin() + params.log_memory);
    const std::vector<FieldT> rho_cycle(rho.begin() + params.log_memory,
                                        rho.end());

    transcript.append_fields("rho_cell_values",
                             {proof.ra_value, proof.wa_value});
    if (!PCS::verify(vk_.cell_key, proof.ra, rho, proof.ra_value,
                     proof.ra_opening))
      failures.push_back("ra opening at rho");
    if (!PCS::verify(vk_.cell_key, proof.wa, rho, proof.wa_value,
                     proof.wa_opening))
      failures.push_back("wa opening at rho");
    transcript.append_fields("rho_cycle_values", proof.rho_cycle_values);
    const FieldT batch_rho = transcript.challenge("batch_gamma");
    if (!PCS::batch_verify(vk_.cycle_key, {proof.wv, proof.rf, proof.wf},
                           rho_cycle, proof.rho_cycle_values,
                           proof.rho_cycle_openings, batch_rho))
      failures.push_back("openings at rho");

    std::vector<FieldT> v(detail::kOperands);
    v[detail::kEqCycle] = eq_evaluate(c.r, rho_cycle);
    v[detail::kEqZero] = eq_evaluate(c.z, rho);
    v[detail::kRa] = proof.ra_value;
    v[detail::kWa] = proof.wa_value;
    v[detail::kVal] = proof.val_claim;
    v[detail::kWv] = rho_cycle_values[0];
    v[detail::kRf] = rho_cycle_values[1];
    v[detail::kWf] = rho_cycle_values[2];
    if (detail::read_write_summand(v, c.gamma, c.beta, c.alpha) !=
        rw.final_claim())
      failures.push_back("read/write final claim");

    sumcheck::Verifier ve(proof.val_claim, params.log_cycles, 3);
    if (!ve.verify(proof.val_evaluation, transcript))
      failures.push_back("value-evaluation sum-check round " +
                         std::to_string(ve.failed_round()));
    const std::vector<FieldT> &sigma = ve.challenges();
    const FieldT lt = less_than_evaluate(sigma, rho_cycle);
    if (proof.wa_sigma_value * proof.inc_sigma_value * lt != ve.final_claim())
      failures.push_back("value-evaluation final claim");
    if (!PCS::verify(vk_.cell_key, proof.wa, detail::concat(rho_cell, sigma),
                     proof.wa_sigma_value, proof.wa_sigma_opening))
      failures.push_back("wa opening at sigma");
    if (!PCS::verify(vk_.cycle_key, proof.inc, sigma, proof.inc_sigma_value,
                     proof.inc_sigma_opening))
      failures.push_back("inc opening at sigma");

    libff::leave_block("Call to twist::Verifier::verify");
    for (const auto &f : failures)
      sumcheck::report_rejection("twist: " + f);
    return failures.empty();
  }

private:
  const VerifierKey<PCS> &vk_;
};

template <class PCS = kzg::MultilinearKZG>
Proof<PCS> prove(const ProverKey<PCS> &pk, const MemoryTrace &trace) {
  return Prover<PCS>(pk).prove(trace);
}

template <class PCS = kzg::MultilinearKZG>
bool verify(const VerifierKey<PCS> &vk, const Proof<PCS> &proof) {
  return Verifier<PCS>(vk).verify(proof);
}

} // namespace twist

using TwistParameters = twist::Parameters;
template <class PCS = kzg::MultilinearKZG> using TwistProof = twist::Proof<PCS>;

} // namespace twistshout
