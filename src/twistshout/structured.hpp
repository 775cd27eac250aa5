// structured.hpp
#pragma once

#include "errors.hpp"
#include "field.hpp"
#include "multilinear.hpp"

#include <string>
#include <vector>

namespace twistshout {

/* -------------------------------------------------------------------- *
 *  Structured polynomial families. Each is evaluated directly from     *
 *  bit expansions in O(n); nothing of size 2^n is built unless a       *
 *  sum-check explicitly asks for a table.                              *
 * -------------------------------------------------------------------- */

/* eq(x, y) = prod_i (x_i y_i + (1 - x_i)(1 - y_i)) */
inline FieldT eq_evaluate(const std::vector<FieldT> &x,
                          const std::vector<FieldT> &y) {
  if (x.size() != y.size())
    throw ShapeMismatch("eq over points of different length");
  FieldT acc = FieldT::one();
  for (size_t i = 0; i < x.size(); ++i) {
    const FieldT xy = x[i] * y[i];
    acc *= xy + xy + FieldT::one() - x[i] - y[i];
  }
  return acc;
}

/* Table of eq(r, b) over every b in {0,1}^n, built in O(2^n).
 * Variable i lands on bit i of the index. */
inline std::vector<FieldT> eq_table(const std::vector<FieldT> &r) {
  std::vector<FieldT> table(size_t(1) << r.size(), FieldT::zero());
  table[0] = FieldT::one();
  size_t size = 1;
  for (size_t i = 0; i < r.size(); ++i) {
    for (size_t k = 0; k < size; ++k) {
      const FieldT hi = table[k] * r[i];
      table[k + size] = hi;
      table[k] -= hi; // table[k] * (1 - r_i)
    }
    size <<= 1;
  }
  return table;
}

/* One-hot selector for a fixed index over a 2^n domain. */
class OneHotPolynomial {
public:
  OneHotPolynomial(size_t n, size_t index) : n_(n), index_(index) {
    if (n_ >= 8 * sizeof(size_t) || index_ >= (size_t(1) << n_))
      throw IndexOutOfBounds("one-hot index " + std::to_string(index) +
                             " outside 2^" + std::to_string(n));
  }

  size_t num_variables() const { return n_; }
  size_t index() const { return index_; }

  FieldT evaluate(const std::vector<FieldT> &point) const {
    if (point.size() != n_)
      throw ShapeMismatch("one-hot point length");
    FieldT acc = FieldT::one();
    for (size_t i = 0; i < n_; ++i)
      acc *= ((index_ >> i) & 1) ? point[i] : (FieldT::one() - point[i]);
    return acc;
  }

  MultilinearExtension to_mle() const {
    return MultilinearExtension::one_hot(n_, index_);
  }

private:
  size_t n_;
  size_t index_;
};

inline FieldT one_hot_evaluate(size_t index, const std::vector<FieldT> &point) {
  return OneHotPolynomial(point.size(), index).evaluate(point);
}

/* -------------------------------------------------------------------- *
 *  LT(x, y) over pairs of n-bit indices: 1 iff int(x) < int(y).         *
 *  x < y exactly when, at the most significant differing bit i,         *
 *  x_i = 0 and y_i = 1:                                                 *
 *     LT(x, y) = sum_i (1 - x_i) y_i prod_{l > i} eq(x_l, y_l)          *
 *  Every term is a product over distinct variables, so the sum is the   *
 *  multilinear extension.                                               *
 * -------------------------------------------------------------------- */
class LessThanPolynomial {
public:
  explicit LessThanPolynomial(size_t n) : n_(n) {}

  size_t num_variables() const { return 2 * n_; }

  FieldT evaluate(const std::vector<FieldT> &x,
                  const std::vector<FieldT> &y) const {
    if (x.size() != n_ || y.size() != n_)
      throw ShapeMismatch("less-than operands must have " +
                          std::to_string(n_) + " coordinates");
    FieldT acc = FieldT::zero();
    FieldT suffix_eq = FieldT::one(); // prod_{l > i} eq(x_l, y_l)
    for (size_t i = n_; i-- > 0;) {
      acc += suffix_eq * (FieldT::one() - x[i]) * y[i];
      const FieldT xy = x[i] * y[i];
      suffix_eq *= xy + xy + FieldT::one() - x[i] - y[i];
    }
    return acc;
  }

  FieldT evaluate_indices(size_t a, size_t b) const {
    return evaluate(index_to_point(a, n_), index_to_point(b, n_));
  }

  /* LT(j, y) for every boolean j, in O(2^n). Adding variable i as the new
   * top bit: LT = (1 - j_i) y_i + eq(j_i, y_i) * LT(low bits). */
  std::vector<FieldT> table_against(const std::vector<FieldT> &y) const {
    if (y.size() != n_)
      throw ShapeMismatch("less-than table point length");
    std::vector<FieldT> table(size_t(1) << n_, FieldT::zero());
    size_t size = 1;
    for (size_t i = 0; i < n_; ++i) {
      const FieldT one_minus_y = FieldT::one() - y[i];
      for (size_t k = 0; k < size; ++k) {
        const FieldT low = table[k];
        table[k] = y[i] + one_minus_y * low; // j_i = 0
        table[k + size] = y[i] * low;        // j_i = 1
      }
      size <<= 1;
    }
    return table;
  }

private:
  size_t n_;
};

inline FieldT less_than_evaluate(const std::vector<FieldT> &x,
                                 const std::vector<FieldT> &y) {
  return LessThanPolynomial(x.size()).evaluate(x, y);
}

/* LT(j, y) for every boolean j */
inline std::vector<FieldT> less_than_table(const std::vector<FieldT> &y) {
  return LessThanPolynomial(y.size()).table_against(y);
}

} // namespace twistshout
