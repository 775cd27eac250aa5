// twistshout.hpp
#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "field.hpp"
#include "kzg.hpp"
#include "lookup_table.hpp"
#include "memory_trace.hpp"
#include "multilinear.hpp"
#include "shout.hpp"
#include "structured.hpp"
#include "sumcheck.hpp"
#include "transcript.hpp"
#include "twist.hpp"
#include "univariate.hpp"
