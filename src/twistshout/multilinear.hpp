// multilinear.hpp
#pragma once

#include "errors.hpp"
#include "field.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace twistshout {

/* -------------------------------------------------------------------- *
 *  Multilinear extension of f : {0,1}^n -> F.                           *
 *  Two representations behind one interface, selected by kind():        *
 *    Dense  - all 2^n evaluations on the Boolean cube                   *
 *    Sparse - only the non-zero (index -> value) entries                *
 *  Bit i of a cube index is variable i (little-endian), so variable 0   *
 *  pairs entries (2k, 2k+1).                                            *
 * -------------------------------------------------------------------- */
class MultilinearExtension {
public:
  enum class Kind { Dense, Sparse };
  using SparseEntries = std::map<size_t, FieldT>;

  /* dense: |evaluations| must be a power of two */
  explicit MultilinearExtension(const std::vector<FieldT> &evaluations)
      : kind_(Kind::Dense), n_(0), dense_(evaluations) {
    if (dense_.empty())
      throw ShapeMismatch("evaluation vector is empty");
    while ((size_t(1) << n_) < dense_.size())
      ++n_; // derive n
    if (dense_.size() != (size_t(1) << n_))
      throw ShapeMismatch("evaluation vector length must be 2^n");
  }

  /* sparse: later entries for the same index overwrite earlier ones */
  MultilinearExtension(size_t n,
                       const std::vector<std::pair<size_t, FieldT>> &entries)
      : kind_(Kind::Sparse), n_(n) {
    if (n >= 8 * sizeof(size_t))
      throw ShapeMismatch("too many variables");
    for (const auto &e : entries) {
      if (e.first >= (size_t(1) << n_))
        throw IndexOutOfBounds("sparse entry " + std::to_string(e.first) +
                               " outside 2^" + std::to_string(n_));
      sparse_[e.first] = e.second;
    }
  }

  /* indicator of `index`: 1 at its bit encoding, 0 elsewhere */
  static MultilinearExtension one_hot(size_t n, size_t index) {
    return MultilinearExtension(n, {{index, FieldT::one()}});
  }

  Kind kind() const { return kind_; }
  bool is_dense() const { return kind_ == Kind::Dense; }
  bool is_sparse() const { return kind_ == Kind::Sparse; }
  size_t num_variables() const { return n_; }

  size_t num_nonzero() const {
    size_t count = 0;
    if (kind_ == Kind::Dense) {
      for (const auto &v : dense_)
        if (!v.is_zero())
          ++count;
    } else {
      for (const auto &e : sparse_)
        if (!e.second.is_zero())
          ++count;
    }
    return count;
  }

  /* Dense: O(2^n) by repeated folding. Sparse: O(k*n) over k entries. */
  FieldT evaluate(const std::vector<FieldT> &point) const {
    if (point.size() != n_)
      throw ShapeMismatch("point has " + std::to_string(point.size()) +
                          " coordinates, polynomial has " +
                          std::to_string(n_) + " variables");
    if (kind_ == Kind::Dense) {
      std::vector<FieldT> tmp = dense_;
      for (size_t i = 0; i < n_; ++i)
        fold_once_inplace(tmp, point[i]);
      return tmp.front();
    }
    FieldT acc = FieldT::zero();
    for (const auto &e : sparse_) {
      FieldT chi = e.second;
      for (size_t i = 0; i < n_ && !chi.is_zero(); ++i)
        chi *= ((e.first >> i) & 1) ? point[i] : (FieldT::one() - point[i]);
      acc += chi;
    }
    return acc;
  }

  /* Fix variable `position` to r; the result has n-1 variables and keeps
   * the representation. Variables above `position` shift down by one. */
  MultilinearExtension bind(const FieldT &r, size_t position) const {
    if (position >= n_)
      throw ShapeMismatch("bind position " + std::to_string(position) +
                          " on a " + std::to_string(n_) +
                          "-variable polynomial");
    if (kind_ == Kind::Dense) {
      std::vector<FieldT> out = dense_;
      if (position == 0) {
        fold_once_inplace(out, r);
      } else {
        const size_t low_mask = (size_t(1) << position) - 1;
        const size_t half = dense_.size() >> 1;
        for (size_t idx = 0; idx < half; ++idx) {
          const size_t i0 =
              (idx & low_mask) | ((idx & ~low_mask) << 1); // bit `position` = 0
          const size_t i1 = i0 | (size_t(1) << position);
          out[idx] = dense_[i0] + r * (dense_[i1] - dense_[i0]);
        }
        out.resize(half);
      }
      return MultilinearExtension(std::move(out), Kind::Dense);
    }

    const FieldT one_minus_r = FieldT::one() - r;
    const size_t low_mask = (size_t(1) << position) - 1;
    SparseEntries folded;
    for (const auto &e : sparse_) {
      const size_t idx = e.first;
      const size_t reduced = (idx & low_mask) | ((idx >> (position + 1)) << position);
      const FieldT contrib =
          ((idx >> position) & 1) ? r * e.second : one_minus_r * e.second;
      auto it = folded.find(reduced);
      if (it == folded.end())
        folded.emplace(reduced, contrib);
      else
        it->second += contrib;
    }
    MultilinearExtension res(n_ - 1, std::vector<std::pair<size_t, FieldT>>{});
    res.sparse_ = std::move(folded);
    return res;
  }

  FieldT sum_over_hypercube() const {
    FieldT acc = FieldT::zero();
    if (kind_ == Kind::Dense) {
      for (const auto &v : dense_)
        acc += v;
    } else {
      for (const auto &e : sparse_)
        acc += e.second;
    }
    return acc;
  }

  MultilinearExtension add(const MultilinearExtension &other) const {
    if (other.n_ != n_)
      throw SizeMismatch("adding polynomials of " + std::to_string(n_) +
                         " and " + std::to_string(other.n_) + " variables");
    if (kind_ == Kind::Sparse && other.kind_ == Kind::Sparse) {
      MultilinearExtension res = *this;
      for (const auto &e : other.sparse_) {
        auto it = res.sparse_.find(e.first);
        if (it == res.sparse_.end())
          res.sparse_.emplace(e.first, e.second);
        else
          it->second += e.second;
      }
      return res;
    }
    std::vector<FieldT> sum = to_dense().dense_;
    if (other.kind_ == Kind::Dense) {
      for (size_t i = 0; i < sum.size(); ++i)
        sum[i] += other.dense_[i];
    } else {
      for (const auto &e : other.sparse_)
        sum[e.first] += e.second;
    }
    return MultilinearExtension(std::move(sum), Kind::Dense);
  }

  MultilinearExtension scale(const FieldT &c) const {
    MultilinearExtension res = *this;
    for (auto &v : res.dense_)
      v *= c;
    for (auto &e : res.sparse_)
      e.second *= c;
    return res;
  }

  MultilinearExtension to_dense() const {
    if (kind_ == Kind::Dense)
      return *this;
    std::vector<FieldT> values(size_t(1) << n_, FieldT::zero());
    for (const auto &e : sparse_)
      values[e.first] = e.second;
    return MultilinearExtension(std::move(values), Kind::Dense);
  }

  /* Read-only access to the full table on {0,1}^n (dense only). */
  const std::vector<FieldT> &cube() const {
    if (kind_ != Kind::Dense)
      throw std::logic_error("cube() requires a dense polynomial");
    return dense_;
  }

  const SparseEntries &entries() const {
    if (kind_ != Kind::Sparse)
      throw std::logic_error("entries() requires a sparse polynomial");
    return sparse_;
  }

  /* Fold away variable 0: each pair (v0, v1) becomes (1-r)*v0 + r*v1,
   * the affine interpolation through (0, v0) and (1, v1). */
  static void fold_once_inplace(std::vector<FieldT> &vec, const FieldT &r) {
    const size_t half = vec.size() >> 1;
    for (size_t pair = 0; pair < half; ++pair) {
      const FieldT v0 = vec[2 * pair];
      const FieldT v1 = vec[2 * pair + 1];
      vec[pair] = v0 + r * (v1 - v0);
    }
    vec.resize(half);
  }

private:
  Kind kind_;
  size_t n_;
  std::vector<FieldT> dense_;
  SparseEntries sparse_;

  MultilinearExtension(std::vector<FieldT> &&values, Kind)
      : kind_(Kind::Dense), n_(0), dense_(std::move(values)) {
    while ((size_t(1) << n_) < dense_.size())
      ++n_;
  }
};

} // namespace twistshout
