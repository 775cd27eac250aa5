// univariate.hpp
#pragma once

#include "field.hpp"

#include <utility>
#include <vector>

namespace twistshout {

/* -------------------------------------------------------------------- *
 *  Univariate round polynomial c0 + c1 X + ... + cd X^d                 *
 *  (generalises the linear / quadratic rounds of a degree-1 / degree-2  *
 *  sum-check to any small degree)                                       *
 * -------------------------------------------------------------------- */
struct UnivariatePolynomial {
  std::vector<FieldT> coeffs;

  UnivariatePolynomial() = default;
  explicit UnivariatePolynomial(std::vector<FieldT> c) : coeffs(std::move(c)) {}

  size_t degree() const { return coeffs.empty() ? 0 : coeffs.size() - 1; }

  FieldT evaluate(const FieldT &x) const {
    FieldT acc = FieldT::zero();
    for (size_t i = coeffs.size(); i-- > 0;)
      acc = acc * x + coeffs[i];
    return acc;
  }

  // p(0) + p(1) = 2 c0 + c1 + ... + cd
  FieldT sum_over_binary() const {
    if (coeffs.empty())
      return FieldT::zero();
    FieldT acc = coeffs[0];
    for (const auto &c : coeffs)
      acc += c;
    return acc;
  }

  /* coefficients of the unique degree-d polynomial through (i, evals[i]),
   * i = 0..d */
  static UnivariatePolynomial interpolate(const std::vector<FieldT> &evals) {
    const size_t points = evals.size();
    std::vector<FieldT> result(points, FieldT::zero());
    for (size_t i = 0; i < points; ++i) {
      // basis_i(X) = prod_{j != i} (X - j) / (i - j)
      std::vector<FieldT> basis(1, FieldT::one());
      FieldT denom = FieldT::one();
      for (size_t j = 0; j < points; ++j) {
        if (j == i)
          continue;
        const FieldT xj = field_from_u64(j);
        std::vector<FieldT> next(basis.size() + 1, FieldT::zero());
        for (size_t k = 0; k < basis.size(); ++k) {
          next[k + 1] += basis[k];
          next[k] -= basis[k] * xj;
        }
        basis.swap(next);
        denom *= field_from_u64(i) - xj;
      }
      const FieldT scale = evals[i] * denom.inverse();
      for (size_t k = 0; k < points; ++k)
        result[k] += scale * basis[k];
    }
    return UnivariatePolynomial(std::move(result));
  }
};

/* Lagrange evaluation at r of the polynomial through (xs[i], ys[i]). */
inline FieldT lagrange_eval(const std::vector<FieldT> &ys,
                            const std::vector<FieldT> &xs, const FieldT &r) {
  const size_t deg1 = xs.size();
  FieldT res = FieldT::zero();
  for (size_t i = 0; i < deg1; ++i) {
    FieldT term = ys[i];
    for (size_t j = 0; j < deg1; ++j) {
      if (j == i)
        continue;
      term *= (r - xs[j]) * (xs[i] - xs[j]).inverse();
    }
    res += term;
  }
  return res;
}

} // namespace twistshout
