// tests/test_shout.cpp
// ----------------------------------------------
#include <gtest/gtest.h>
#include <libff/common/profiling.hpp>

#include "twistshout/lookup_table.hpp"
#include "twistshout/shout.hpp"

#include <tuple>

using namespace twistshout;

static FieldT F(uint64_t v) { return field_from_u64(v); }

/* ------------------------------------------------------------------ *
 * 1. LookupTable                                                     *
 * ------------------------------------------------------------------ */
TEST(LookupTable, RecordsLookups) {
  LookupTable table({F(10), F(20), F(30), F(40), F(50)});
  ASSERT_EQ(table.lookup(0), F(10));
  ASSERT_EQ(table.lookup(2), F(30));
  ASSERT_EQ(table.lookup(4), F(50));
  ASSERT_EQ(table.num_lookups(), 3u);
  ASSERT_EQ(table.table_size(), 5u);
  ASSERT_EQ(table.lookups()[1].index, 2u);
}

TEST(LookupTable, BoundsChecked) {
  LookupTable table({F(100), F(200), F(300)});
  ASSERT_THROW(table.lookup(3), IndexOutOfBounds);
  ASSERT_THROW(table.lookup(100), IndexOutOfBounds);
  LookupTable empty(std::vector<FieldT>{});
  ASSERT_THROW(empty.lookup(0), IndexOutOfBounds);
  ASSERT_EQ(table.num_lookups(), 0u);
}

/* ---------------- fixture: 8-entry table, 8 lookup slots ----------- */
class ShoutFixture : public ::testing::Test {
protected:
  shout::Parameters params{3, 3};
  shout::ProverKey<> pk;
  shout::VerifierKey<> vk;

  void SetUp() override { std::tie(pk, vk) = shout::setup(params); }

  bool round_trip(const LookupTable &table) {
    return shout::verify(vk, shout::prove(pk, table));
  }
};

static std::vector<FieldT> squares(size_t n) {
  std::vector<FieldT> out;
  for (uint64_t i = 1; i <= n; ++i)
    out.push_back(F(i * i));
  return out;
}

/* ------------------------------------------------------------------ *
 * 2. Completeness                                                    *
 * ------------------------------------------------------------------ */
TEST(Shout, PaddedTableLookup) {
  const shout::Parameters params{2, 1};
  const auto keys = shout::setup(params);
  LookupTable table({F(1), F(4), F(9)});
  ASSERT_EQ(table.lookup(1), F(4));
  const auto proof = shout::prove(keys.first, table);
  ASSERT_TRUE(shout::verify(keys.second, proof));
  ASSERT_TRUE(shout::verify(keys.second, proof,
                            shout::commit_table(keys.first, table.values())));
}

TEST_F(ShoutFixture, NoLookups) {
  ASSERT_TRUE(round_trip(LookupTable(squares(5))));
}

TEST_F(ShoutFixture, EveryIndexInReverse) {
  LookupTable table(squares(8));
  for (size_t i = 8; i-- > 0;)
    ASSERT_EQ(table.lookup(i), F((i + 1) * (i + 1)));
  ASSERT_TRUE(round_trip(table));
}

TEST_F(ShoutFixture, RepeatedAndDuplicateValues) {
  LookupTable table({F(7), F(7), FieldT::zero(), F(7)});
  table.lookup(3);
  table.lookup(3);
  table.lookup(2);
  table.lookup(0);
  ASSERT_TRUE(round_trip(table));
}

/* padding rows sit in the zero-extended part of the table */
TEST_F(ShoutFixture, LookupIntoPaddedRegion) {
  LookupTable table(squares(3));
  table.push(6, FieldT::zero());
  ASSERT_TRUE(round_trip(table));
}

TEST(Shout, SingleEntryTable) {
  const shout::Parameters params{0, 2};
  const auto keys = shout::setup(params);
  LookupTable table({F(42)});
  table.lookup(0);
  table.lookup(0);
  ASSERT_TRUE(shout::verify(keys.second, shout::prove(keys.first, table)));
}

/* ------------------------------------------------------------------ *
 * 3. Soundness                                                       *
 * ------------------------------------------------------------------ */
TEST(Shout, WrongValueRejected) {
  const shout::Parameters params{2, 1};
  const auto keys = shout::setup(params);
  LookupTable table({F(1), F(4), F(9)});
  table.push(1, F(5));
  ASSERT_FALSE(shout::verify(keys.second, shout::prove(keys.first, table)));
}

TEST_F(ShoutFixture, PaddedRegionIsZero) {
  LookupTable table(squares(3));
  table.push(5, F(1));
  ASSERT_FALSE(round_trip(table));
}

TEST_F(ShoutFixture, TamperedProofRejected) {
  LookupTable table(squares(8));
  table.lookup(2);
  table.lookup(5);
  const auto proof = shout::prove(pk, table);
  ASSERT_TRUE(shout::verify(vk, proof));

  auto p = proof;
  p.rv_value += FieldT::one();
  ASSERT_FALSE(shout::verify(vk, p));

  p = proof;
  p.table_value += FieldT::one();
  ASSERT_FALSE(shout::verify(vk, p));

  p = proof;
  p.read_check.rounds[3].coeffs[2] += FieldT::one();
  ASSERT_FALSE(shout::verify(vk, p));

  p = proof;
  p.read_check.rounds.pop_back();
  ASSERT_FALSE(shout::verify(vk, p));

  p = proof;
  p.ra_opening.quotients.clear();
  ASSERT_FALSE(shout::verify(vk, p));
}

/* a proof against another table verifies alone but not when pinned */
TEST_F(ShoutFixture, ExpectedTableCommitment) {
  LookupTable table(squares(8));
  table.lookup(4);
  const auto proof = shout::prove(pk, table);
  const auto expected = shout::commit_table(pk, table.values());
  ASSERT_EQ(proof.table, expected);
  ASSERT_TRUE(shout::verify(vk, proof, expected));

  auto other_values = table.values();
  other_values[4] = F(1000);
  LookupTable other(other_values);
  other.lookup(4);
  const auto other_proof = shout::prove(pk, other);
  ASSERT_TRUE(shout::verify(vk, other_proof));
  ASSERT_FALSE(shout::verify(vk, other_proof, expected));
}

/* ------------------------------------------------------------------ *
 * 4. Soundness: address columns that are not one-hot                 *
 * ------------------------------------------------------------------ */
class ShoutWitnessFixture : public ::testing::Test {
protected:
  shout::Parameters params{1, 1}; // table [1, 4], 2 lookup slots
  shout::ProverKey<> pk;
  shout::VerifierKey<> vk;

  void SetUp() override { std::tie(pk, vk) = shout::setup(params); }

  /* the same address column (s, 1 - s) in every slot */
  shout::Witness witness(const FieldT &s, const FieldT &value) const {
    const FieldT t = FieldT::one() - s;
    return {MultilinearExtension(std::vector<FieldT>{F(1), F(4)}),
            MultilinearExtension(std::vector<FieldT>{s, t, s, t}),
            MultilinearExtension(std::vector<FieldT>{value, value})};
  }

  bool accepts(const shout::Witness &w) {
    return shout::verify(vk, shout::Prover<>(pk).prove(w));
  }
};

TEST_F(ShoutWitnessFixture, EncodedLookupsThroughWitness) {
  LookupTable table({F(1), F(4)});
  table.lookup(1);
  table.lookup(0);
  ASSERT_TRUE(accepts(shout::encode_lookups(params, table)));
  ASSERT_TRUE(accepts(witness(FieldT::zero(), F(4))));
  ASSERT_FALSE(accepts(witness(FieldT::zero(), F(9))));
}

/* s = 5: s*1 + (1-s)*4 + (s^2 - s) = 9, a value the table does not hold */
TEST_F(ShoutWitnessFixture, FractionalOneHotRejected) {
  const FieldT s = F(5);
  const FieldT t = FieldT::one() - s;
  ASSERT_EQ(s * F(1) + t * F(4) + (s.squared() - s), F(9));
  ASSERT_FALSE(accepts(witness(s, F(9))));

  const FieldT half = F(2).inverse();
  ASSERT_FALSE(accepts(witness(half, half * F(5) + (half.squared() - half))));
}

TEST_F(ShoutWitnessFixture, TwoHotColumnRejected) {
  shout::Witness w = witness(FieldT::zero(), F(5));
  w.ra = MultilinearExtension(std::vector<FieldT>(4, FieldT::one()));
  ASSERT_FALSE(accepts(w));
}

TEST_F(ShoutWitnessFixture, WitnessShapeChecked) {
  shout::Witness w = witness(FieldT::zero(), F(4));
  w.rv = MultilinearExtension(std::vector<FieldT>(4, F(4)));
  ASSERT_THROW(shout::Prover<>(pk).prove(w), ShapeMismatch);
}

/* ------------------------------------------------------------------ *
 * 5. Caller errors                                                   *
 * ------------------------------------------------------------------ */
TEST(Shout, IndexOutOfRange) {
  const shout::Parameters params{2, 1};
  const auto keys = shout::setup(params);
  LookupTable table({F(1), F(4), F(9)});
  table.push(5, F(0));
  ASSERT_THROW(shout::prove(keys.first, table), IndexOutOfBounds);
}

TEST_F(ShoutFixture, TableTooLong) {
  LookupTable table(squares(9));
  ASSERT_THROW(shout::prove(pk, table), IndexOutOfBounds);
  ASSERT_THROW(shout::commit_table(pk, table.values()), IndexOutOfBounds);
}

TEST_F(ShoutFixture, TooManyLookups) {
  LookupTable table(squares(8));
  for (size_t j = 0; j <= params.num_lookups(); ++j)
    table.lookup(j % 8);
  ASSERT_THROW(shout::prove(pk, table), IndexOutOfBounds);
}

int main(int argc, char **argv) {
  init_public_params();
  libff::inhibit_profiling_info = true;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
