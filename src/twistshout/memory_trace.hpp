// memory_trace.hpp
#pragma once

#include "errors.hpp"
#include "field.hpp"

#include <map>
#include <string>
#include <vector>

namespace twistshout {

enum class OpKind { Read, Write };

/* One access. For a Read, `value` is what the access reported. */
struct MemoryOp {
  OpKind op;
  size_t address;
  FieldT value;
  size_t timestamp;

  static MemoryOp read(size_t address, const FieldT &value, size_t timestamp) {
    return MemoryOp{OpKind::Read, address, value, timestamp};
  }
  static MemoryOp write(size_t address, const FieldT &value, size_t timestamp) {
    return MemoryOp{OpKind::Write, address, value, timestamp};
  }
};

/* -------------------------------------------------------------------- *
 *  Ordered trace over a memory of 2^log_memory cells, all initialised   *
 *  to zero. write()/read() keep a shadow copy of memory so reads report *
 *  the consistent value and timestamps advance by one; push() appends   *
 *  an arbitrary operation unchecked, which is how callers hand over     *
 *  traces produced elsewhere (consistent or not).                       *
 * -------------------------------------------------------------------- */
class MemoryTrace {
public:
  explicit MemoryTrace(size_t log_memory) : log_memory_(log_memory) {
    if (log_memory_ >= 8 * sizeof(size_t))
      throw TraceOutOfBounds("memory of 2^" + std::to_string(log_memory) +
                             " cells");
  }

  size_t log_memory() const { return log_memory_; }
  size_t memory_size() const { return size_t(1) << log_memory_; }

  void write(size_t address, const FieldT &value) {
    check_address(address);
    shadow_[address] = value;
    ops_.push_back(MemoryOp::write(address, value, next_timestamp()));
  }

  FieldT read(size_t address) {
    check_address(address);
    auto it = shadow_.find(address);
    const FieldT value = (it == shadow_.end()) ? FieldT::zero() : it->second;
    ops_.push_back(MemoryOp::read(address, value, next_timestamp()));
    return value;
  }

  void push(const MemoryOp &op) {
    if (op.op == OpKind::Write && op.address < memory_size())
      shadow_[op.address] = op.value;
    ops_.push_back(op);
  }

  const std::vector<MemoryOp> &operations() const { return ops_; }
  std::vector<MemoryOp> &mutable_operations() { return ops_; }
  size_t size() const { return ops_.size(); }
  bool empty() const { return ops_.empty(); }

  size_t next_timestamp() const {
    return ops_.empty() ? 0 : ops_.back().timestamp + 1;
  }

private:
  size_t log_memory_;
  std::vector<MemoryOp> ops_;
  std::map<size_t, FieldT> shadow_;

  void check_address(size_t address) const {
    if (address >= memory_size())
      throw TraceOutOfBounds("address " + std::to_string(address) +
                             " outside memory of " +
                             std::to_string(memory_size()) + " cells");
  }
};

} // namespace twistshout
