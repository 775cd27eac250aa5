// sumcheck.hpp
#pragma once

#include "errors.hpp"
#include "field.hpp"
#include "multilinear.hpp"
#include "transcript.hpp"
#include "univariate.hpp"

#include <libff/common/profiling.hpp>

#include <cstdio>
#include <functional>
#include <string>
#include <vector>

namespace twistshout {
namespace sumcheck {

/* Combines the operand values at one point into the summand. */
using Combiner = std::function<FieldT(const std::vector<FieldT> &)>;

struct Proof {
  std::vector<UnivariatePolynomial> rounds;
};

/* ===================================================================== *
 *  Prover for  sum_{x in {0,1}^n} g(f_1(x), ..., f_m(x))                 *
 *  where every f_i is multilinear (a dense table) and g has total        *
 *  degree <= degree().                                                   *
 *  Linear-time: every round folds the tables in half, so the work is     *
 *  O(m * d * 2^n) overall, and memory shrinks 2^n -> 2^{n-1} -> ... -> 1 *
 * ===================================================================== */
class Prover {
public:
  Prover(std::vector<std::vector<FieldT>> tables, size_t degree,
         Combiner combine, size_t degree_bound)
      : tables_(std::move(tables)), degree_(degree),
        combine_(std::move(combine)), n_(0), processed_(0) {
    if (tables_.empty())
      throw ShapeMismatch("sum-check needs at least one operand");
    if (degree_ > degree_bound)
      throw DegreeViolation("composition of degree " +
                            std::to_string(degree_) + " exceeds bound " +
                            std::to_string(degree_bound));
    const size_t size = tables_.front().size();
    while ((size_t(1) << n_) < size)
      ++n_;
    if (size == 0 || size != (size_t(1) << n_))
      throw ShapeMismatch("operand length must be 2^n");
    for (const auto &t : tables_)
      if (t.size() != size)
        throw SizeMismatch("sum-check operands of different sizes");
  }

  /* sum of a product of MLEs; the degree is the number of factors */
  static Prover product(const std::vector<MultilinearExtension> &factors,
                        size_t degree_bound) {
    std::vector<std::vector<FieldT>> tables;
    tables.reserve(factors.size());
    for (const auto &f : factors)
      tables.push_back(f.to_dense().cube());
    return Prover(std::move(tables), factors.size(),
                  [](const std::vector<FieldT> &v) {
                    FieldT acc = FieldT::one();
                    for (const auto &x : v)
                      acc *= x;
                    return acc;
                  },
                  degree_bound);
  }

  size_t num_variables() const { return n_; }
  size_t degree() const { return degree_; }
  size_t rounds_done() const { return processed_; }

  /* sum over the remaining cube; before any round this is the claim */
  FieldT current_sum() const {
    FieldT acc = FieldT::zero();
    std::vector<FieldT> vals(tables_.size());
    const size_t size = tables_.front().size();
    for (size_t i = 0; i < size; ++i) {
      for (size_t t = 0; t < tables_.size(); ++t)
        vals[t] = tables_[t][i];
      acc += combine_(vals);
    }
    return acc;
  }

  /* ------------------------------------------------------------------ *
   *  One round: g_i(X) = sum over the suffix cube with the current      *
   *  variable set to X. Each operand is affine in X, so evaluating at   *
   *  X = 0..d only needs the pair (v0, v1) and its difference.          *
   *  One extra point X = d+1 is checked against the degree-d            *
   *  interpolant so an under-declared combiner is caught here rather    *
   *  than surfacing as a verifier rejection.                            *
   * ------------------------------------------------------------------ */
  UnivariatePolynomial compute_round() const {
    if (processed_ >= n_)
      throw std::logic_error("sum-check: all variables already bound");
    const size_t points = degree_ + 2;
    const size_t m = tables_.size();
    std::vector<FieldT> evals(points, FieldT::zero());
    std::vector<FieldT> vals(m), diffs(m);

    const size_t half = tables_.front().size() >> 1;
    for (size_t i = 0; i < half; ++i) {
      for (size_t t = 0; t < m; ++t) {
        vals[t] = tables_[t][2 * i];
        diffs[t] = tables_[t][2 * i + 1] - vals[t];
      }
      for (size_t x = 0; x < points; ++x) {
        if (x > 0)
          for (size_t t = 0; t < m; ++t)
            vals[t] += diffs[t];
        evals[x] += combine_(vals);
      }
    }

    const FieldT extra = evals.back();
    evals.pop_back();
    std::vector<FieldT> xs(evals.size());
    for (size_t x = 0; x < xs.size(); ++x)
      xs[x] = field_from_u64(x);
    if (lagrange_eval(evals, xs, field_from_u64(points - 1)) != extra)
      throw DegreeViolation("round " + std::to_string(processed_ + 1) +
                            " polynomial exceeds declared degree " +
                            std::to_string(degree_));
    return UnivariatePolynomial::interpolate(evals);
  }

  /* fix the current variable to the verifier's challenge */
  void bind(const FieldT &r) {
    if (processed_ >= n_)
      throw std::logic_error("sum-check: all variables already bound");
    for (auto &t : tables_)
      MultilinearExtension::fold_once_inplace(t, r);
    ++processed_;
  }

  /* operand values at the fully bound point (r_1, ..., r_n) */
  std::vector<FieldT> final_values() const {
    if (processed_ != n_)
      throw std::logic_error("sum-check: variables left unbound");
    std::vector<FieldT> out;
    out.reserve(tables_.size());
    for (const auto &t : tables_)
      out.push_back(t.front());
    return out;
  }

private:
  std::vector<std::vector<FieldT>> tables_;
  const size_t degree_;
  Combiner combine_;
  size_t n_;
  size_t processed_; // how many coordinates are already fixed
};

/* Runs all rounds non-interactively. Challenges come from the transcript;
 * returns the proof and leaves the prover fully bound. */
inline Proof prove(Prover &prover, Transcript &transcript,
                   std::vector<FieldT> &challenges) {
  Proof proof;
  challenges.clear();
  for (size_t round = 0; round < prover.num_variables(); ++round) {
    UnivariatePolynomial p = prover.compute_round();
    transcript.append_fields("sumcheck_round", p.coeffs);
    const FieldT r = transcript.challenge("sumcheck_challenge");
    prover.bind(r);
    challenges.push_back(r);
    proof.rounds.push_back(std::move(p));
  }
  return proof;
}

inline Proof prove_product(const std::vector<MultilinearExtension> &factors,
                           Transcript &transcript,
                           std::vector<FieldT> &challenges) {
  Prover prover = Prover::product(factors, factors.size());
  return prove(prover, transcript, challenges);
}

/* -------------------------------------------------------------------- *
 *  Verifier                                                             *
 *  Checks g_i(0) + g_i(1) against the running claim, draws r_i from the *
 *  transcript and moves the claim to g_i(r_i). After n rounds the       *
 *  remaining claim is an evaluation at (r_1..r_n) that the caller must  *
 *  certify, normally with commitment openings.                          *
 *  Every round is replayed even after a failure so the transcript and   *
 *  the amount of work do not depend on where the proof went wrong.      *
 * -------------------------------------------------------------------- */
class Verifier {
public:
  Verifier(const FieldT &claim, size_t n, size_t degree_bound)
      : claim_(claim), n_(n), degree_bound_(degree_bound) {}

  bool verify(const Proof &proof, Transcript &transcript) {
    challenges_.clear();
    failed_round_ = 0;
    // missing rounds are replayed as empty messages, extra rounds are unread
    const UnivariatePolynomial missing{};
    bool ok = true;
    FieldT current = claim_;
    for (size_t round = 0; round < n_; ++round) {
      const UnivariatePolynomial &p =
          round < proof.rounds.size() ? proof.rounds[round] : missing;
      if (p.coeffs.empty() || p.degree() > degree_bound_ ||
          p.sum_over_binary() != current) {
        if (ok)
          failed_round_ = round + 1;
        ok = false;
      }
      transcript.append_fields("sumcheck_round", p.coeffs);
      const FieldT r = transcript.challenge("sumcheck_challenge");
      challenges_.push_back(r);
      current = p.evaluate(r);
    }
    if (ok && proof.rounds.size() != n_) {
      failed_round_ = n_ + 1;
      ok = false;
    }
    final_claim_ = current;
    return ok;
  }

  const std::vector<FieldT> &challenges() const { return challenges_; }
  const FieldT &final_claim() const { return final_claim_; }
  // 1-based index of the first inconsistent round, 0 when none;
  // n + 1 when only the round count is wrong
  size_t failed_round() const { return failed_round_; }

private:
  FieldT claim_;
  const size_t n_;
  const size_t degree_bound_;
  std::vector<FieldT> challenges_;
  FieldT final_claim_ = FieldT::zero();
  size_t failed_round_ = 0;
};

/* Reports a rejected check after the whole verification has run. */
inline void report_rejection(const std::string &what) {
  if (libff::inhibit_profiling_info)
    return;
  libff::print_indent();
  printf("* rejected: %s\n", what.c_str());
}

} // namespace sumcheck
} // namespace twistshout
