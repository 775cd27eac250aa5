// config.hpp
#pragma once

#include <libff/algebra/scalar_multiplication/multiexp.hpp>

#include <cstddef>

// Largest number of variables a commitment key may be set up for.
// The SRS holds 2^{n+1} G1 points, so this bounds memory as well.
#ifndef TWISTSHOUT_MAX_VARIABLES
#define TWISTSHOUT_MAX_VARIABLES 24
#endif

// #define TWISTSHOUT_NAIVE_MULTIEXP // plain double-and-add instead of BDLO12

namespace twistshout {

constexpr size_t kMaxVariables = TWISTSHOUT_MAX_VARIABLES;

#ifdef TWISTSHOUT_NAIVE_MULTIEXP
constexpr libff::multi_exp_method kMultiExpMethod =
    libff::multi_exp_method_naive_plain;
#else
constexpr libff::multi_exp_method kMultiExpMethod =
    libff::multi_exp_method_BDLO12;
#endif

// Transcript domain separators, one per protocol.
constexpr const char *kTwistDomain = "twist-v1";
constexpr const char *kShoutDomain = "shout-v1";

} // namespace twistshout
