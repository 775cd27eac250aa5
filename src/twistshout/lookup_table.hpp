// lookup_table.hpp
#pragma once

#include "errors.hpp"
#include "field.hpp"

#include <string>
#include <vector>

namespace twistshout {

struct Lookup {
  size_t index;
  FieldT value;
};

/* A read-only table and the lookups made into it, in order.
 * lookup() reports the table entry; push() records an arbitrary pair. */
class LookupTable {
public:
  explicit LookupTable(std::vector<FieldT> values)
      : values_(std::move(values)) {}

  const std::vector<FieldT> &values() const { return values_; }
  size_t table_size() const { return values_.size(); }

  FieldT lookup(size_t index) {
    if (index >= values_.size())
      throw IndexOutOfBounds("lookup index " + std::to_string(index) +
                             " outside table of " +
                             std::to_string(values_.size()) + " entries");
    lookups_.push_back(Lookup{index, values_[index]});
    return values_[index];
  }

  void push(size_t index, const FieldT &value) {
    lookups_.push_back(Lookup{index, value});
  }

  const std::vector<Lookup> &lookups() const { return lookups_; }
  size_t num_lookups() const { return lookups_.size(); }

private:
  std::vector<FieldT> values_;
  std::vector<Lookup> lookups_;
};

} // namespace twistshout
