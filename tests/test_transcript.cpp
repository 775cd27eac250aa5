// tests/test_transcript.cpp
// ----------------------------------------------
#include <gtest/gtest.h>
#include <libff/common/profiling.hpp>

#include "twistshout/transcript.hpp"

#include <set>
#include <string>

using namespace twistshout;

/* ------------------------------------------------------------------ *
 * 1. Determinism                                                     *
 * ------------------------------------------------------------------ */
TEST(Transcript, SameAppendsSameChallenges) {
  Transcript a("test-domain"), b("test-domain");
  for (Transcript *t : {&a, &b}) {
    t->append_u64("n", 7);
    t->append_field("x", field_from_u64(42));
    t->append_point("p", G1::one());
  }
  ASSERT_EQ(a.state(), b.state());
  ASSERT_EQ(a.challenge("c"), b.challenge("c"));
  ASSERT_EQ(a.challenge_vector("v", 4), b.challenge_vector("v", 4));
}

TEST(Transcript, DomainSeparatesProtocols) {
  Transcript a("twist-v1"), b("shout-v1");
  ASSERT_NE(a.challenge("c"), b.challenge("c"));
}

TEST(Transcript, LabelAndMessageBothBind) {
  Transcript base("d"), other_label("d"), other_value("d");
  base.append_field("x", FieldT::one());
  other_label.append_field("y", FieldT::one());
  other_value.append_field("x", FieldT::zero());
  const FieldT c = base.challenge("c");
  ASSERT_NE(c, other_label.challenge("c"));
  ASSERT_NE(c, other_value.challenge("c"));
}

/* label boundaries are length-prefixed, so "ab"+"c" differs from "a"+"bc" */
TEST(Transcript, NoAmbiguousConcatenation) {
  Transcript a("d"), b("d");
  a.append("ab", {'c'});
  b.append("a", {'b', 'c'});
  ASSERT_NE(a.state(), b.state());
}

/* ------------------------------------------------------------------ *
 * 2. Draws never repeat                                              *
 * ------------------------------------------------------------------ */
TEST(Transcript, RepeatedDrawsDiffer) {
  Transcript t("d");
  std::set<std::string> seen;
  for (size_t i = 0; i < 64; ++i) {
    const FieldT c = t.challenge("same-label");
    std::vector<uint8_t> bytes;
    append_field_bytes(bytes, c);
    ASSERT_TRUE(seen.insert(std::string(bytes.begin(), bytes.end())).second)
        << "draw " << i << " repeated";
  }
}

TEST(Transcript, ChallengeVectorLength) {
  Transcript t("d");
  ASSERT_EQ(t.challenge_vector("r", 0).size(), 0u);
  const auto v = t.challenge_vector("r", 5);
  ASSERT_EQ(v.size(), 5u);
  ASSERT_NE(v[0], v[1]);
}

/* a transcript diverged once stays diverged */
TEST(Transcript, DivergenceIsPermanent) {
  Transcript a("d"), b("d");
  a.append_u64("n", 1);
  b.append_u64("n", 2);
  a.append_u64("m", 3);
  b.append_u64("m", 3);
  ASSERT_NE(a.challenge("c"), b.challenge("c"));
}

int main(int argc, char **argv) {
  init_public_params();
  libff::inhibit_profiling_info = true;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
