// tests/test_structured.cpp
// ----------------------------------------------
#include <gtest/gtest.h>
#include <libff/common/profiling.hpp>

#include "twistshout/structured.hpp"
#include "twistshout/univariate.hpp"

using namespace twistshout;

static std::vector<FieldT> random_point(size_t n) {
  std::vector<FieldT> p(n);
  for (auto &x : p)
    x = FieldT::random_element();
  return p;
}

/* ------------------------------------------------------------------ *
 * 1. eq                                                              *
 * ------------------------------------------------------------------ */
TEST(Eq, IndicatorOnCube) {
  const size_t n = 3;
  for (size_t a = 0; a < 8; ++a)
    for (size_t b = 0; b < 8; ++b)
      ASSERT_EQ(eq_evaluate(index_to_point(a, n), index_to_point(b, n)),
                bit_to_field(a == b));
}

TEST(Eq, TableMatchesPointwise) {
  const auto r = random_point(5);
  const auto table = eq_table(r);
  ASSERT_EQ(table.size(), 32u);
  FieldT sum = FieldT::zero();
  for (size_t b = 0; b < table.size(); ++b) {
    ASSERT_EQ(table[b], eq_evaluate(r, index_to_point(b, 5)));
    sum += table[b];
  }
  ASSERT_EQ(sum, FieldT::one());
}

TEST(Eq, RejectsDifferentLengths) {
  ASSERT_THROW(eq_evaluate(random_point(2), random_point(3)), ShapeMismatch);
}

/* ------------------------------------------------------------------ *
 * 2. one-hot                                                         *
 * ------------------------------------------------------------------ */
TEST(OneHot, SelectsItsIndex) {
  const OneHotPolynomial h(4, 9);
  for (size_t i = 0; i < 16; ++i)
    ASSERT_EQ(h.evaluate(index_to_point(i, 4)), bit_to_field(i == 9));
}

TEST(OneHot, AgreesWithMleOffCube) {
  const OneHotPolynomial h(4, 9);
  const auto p = random_point(4);
  ASSERT_EQ(h.evaluate(p), h.to_mle().evaluate(p));
  ASSERT_EQ(one_hot_evaluate(9, p), h.evaluate(p));
  ASSERT_EQ(h.evaluate(p), eq_evaluate(index_to_point(9, 4), p));
}

TEST(OneHot, IndexOutOfRange) {
  ASSERT_THROW(OneHotPolynomial(3, 8), IndexOutOfBounds);
  ASSERT_NO_THROW(OneHotPolynomial(3, 7));
}

/* ------------------------------------------------------------------ *
 * 3. less-than                                                       *
 * ------------------------------------------------------------------ */
TEST(LessThan, MatchesIntegerComparison) {
  const size_t n = 4;
  const LessThanPolynomial lt(n);
  ASSERT_EQ(lt.num_variables(), 2 * n);
  for (size_t a = 0; a < 16; ++a)
    for (size_t b = 0; b < 16; ++b)
      ASSERT_EQ(lt.evaluate_indices(a, b), bit_to_field(a < b))
          << a << " < " << b;
}

TEST(LessThan, IsMultilinearInEachCoordinate) {
  // affine in x_0: LT(x0=2) = 2 LT(x0=1) - LT(x0=0)
  const size_t n = 3;
  auto x = random_point(n);
  const auto y = random_point(n);
  x[0] = FieldT::zero();
  const FieldT at0 = less_than_evaluate(x, y);
  x[0] = FieldT::one();
  const FieldT at1 = less_than_evaluate(x, y);
  x[0] = field_from_u64(2);
  ASSERT_EQ(less_than_evaluate(x, y), at1 + at1 - at0);
}

TEST(LessThan, TableAgainstPoint) {
  const size_t n = 4;
  const auto y = random_point(n);
  const auto table = less_than_table(y);
  ASSERT_EQ(table.size(), 16u);
  for (size_t j = 0; j < 16; ++j)
    ASSERT_EQ(table[j], less_than_evaluate(index_to_point(j, n), y));
}

TEST(LessThan, ZeroVariables) {
  ASSERT_EQ(less_than_evaluate({}, {}), FieldT::zero());
  ASSERT_EQ(less_than_table({}), std::vector<FieldT>{FieldT::zero()});
}

TEST(LessThan, RejectsWrongLength) {
  const LessThanPolynomial lt(3);
  ASSERT_THROW(lt.evaluate(random_point(3), random_point(2)), ShapeMismatch);
}

/* ------------------------------------------------------------------ *
 * 4. univariate round polynomials                                    *
 * ------------------------------------------------------------------ */
TEST(Univariate, InterpolateAndEvaluate) {
  // 2 + 3X + 5X^2 + 7X^3
  const UnivariatePolynomial p({field_from_u64(2), field_from_u64(3),
                                field_from_u64(5), field_from_u64(7)});
  std::vector<FieldT> evals;
  for (uint64_t x = 0; x <= 3; ++x)
    evals.push_back(p.evaluate(field_from_u64(x)));
  const auto q = UnivariatePolynomial::interpolate(evals);
  ASSERT_EQ(q.coeffs, p.coeffs);
  ASSERT_EQ(q.degree(), 3u);
  ASSERT_EQ(p.sum_over_binary(), field_from_u64(2 + 2 + 3 + 5 + 7));
}

TEST(Univariate, LagrangeMatchesHorner) {
  const UnivariatePolynomial p({field_from_u64(4), field_from_u64(1),
                                field_from_u64(6)});
  std::vector<FieldT> xs, ys;
  for (uint64_t x = 0; x <= 2; ++x) {
    xs.push_back(field_from_u64(x));
    ys.push_back(p.evaluate(xs.back()));
  }
  const FieldT r = FieldT::random_element();
  ASSERT_EQ(lagrange_eval(ys, xs, r), p.evaluate(r));
}

int main(int argc, char **argv) {
  init_public_params();
  libff::inhibit_profiling_info = true;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
